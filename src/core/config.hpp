#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ConnectConfig {
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    std::string private_key;                 // PEM text, or a path to one
    std::string passphrase;
    int sock = -1;                           // already-connected socket, used instead of host
    int timeout = SSH_CONNECT_TIMEOUT_SECS;
    int keepalive_interval = SSH_KEEPALIVE_SECS;
};

struct SudoConfig {
    std::string password;
    std::string user = DEFAULT_SUDO_USER;
};

struct TransferConfig {
    size_t concurrency = DEFAULT_MAX_AT_ONCE;
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    int file_mode = DEFAULT_FILE_MODE;
    int dir_mode = DEFAULT_DIR_MODE;

    TransferOptions transfer_options() const {
        TransferOptions opts;
        opts.chunk_size = chunk_size;
        opts.file_mode = file_mode;
        return opts;
    }
};

class Config {
public:
    // Load from a YAML file (default: ~/.shuttle/config.yaml)
    static Result<Config> load(const fs::path& path = get_default_config_path());

    // Parse YAML text
    static Result<Config> parse(const std::string& yaml_text);

    static fs::path get_default_config_path();

    const ConnectConfig& connect() const { return connect_; }
    const SudoConfig& sudo() const { return sudo_; }
    const TransferConfig& transfer() const { return transfer_; }
    bool has_sudo() const { return !sudo_.password.empty(); }

    Config() = default;

private:
    ConnectConfig connect_;
    SudoConfig sudo_;
    TransferConfig transfer_;
};

// Validate a connection config and resolve private_key paths to key text.
// Throws SessionError(InvalidArgument) on a malformed config.
ConnectConfig normalize_config(const ConnectConfig& given);
