#include "config.hpp"
#include "errors.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// Modes are written the way chmod takes them ("0644" or 644), read as octal.
static int parse_mode(const YAML::Node& node, int fallback) {
    if (!node || !node.IsScalar()) return fallback;
    std::string text = node.as<std::string>();
    try {
        size_t used = 0;
        int mode = std::stoi(text, &used, 8);
        if (used != text.size() || mode < 0 || mode > 07777) return fallback;
        return mode;
    } catch (const std::exception&) {
        return fallback;
    }
}

static void read_connection(const YAML::Node& node, ConnectConfig& c) {
    if (node["host"]) c.host = node["host"].as<std::string>();
    if (node["port"]) c.port = node["port"].as<int>(22);
    if (node["username"]) c.username = node["username"].as<std::string>();
    if (node["user"]) c.username = node["user"].as<std::string>();
    if (node["password"]) c.password = node["password"].as<std::string>();
    if (node["private_key"]) c.private_key = node["private_key"].as<std::string>();
    if (node["passphrase"]) c.passphrase = node["passphrase"].as<std::string>();
    if (node["timeout"]) c.timeout = node["timeout"].as<int>(SSH_CONNECT_TIMEOUT_SECS);
    if (node["keepalive_interval"]) {
        c.keepalive_interval = node["keepalive_interval"].as<int>(SSH_KEEPALIVE_SECS);
    }
}

static void read_transfer(const YAML::Node& node, TransferConfig& t) {
    if (node["concurrency"]) {
        int n = node["concurrency"].as<int>(static_cast<int>(DEFAULT_MAX_AT_ONCE));
        if (n > 0) t.concurrency = static_cast<size_t>(n);
    }
    if (node["chunk_size"]) {
        int n = node["chunk_size"].as<int>(static_cast<int>(DEFAULT_CHUNK_SIZE));
        if (n > 0) t.chunk_size = static_cast<size_t>(n);
    }
    t.file_mode = parse_mode(node["file_mode"], t.file_mode);
    t.dir_mode = parse_mode(node["dir_mode"], t.dir_mode);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        if (root["connection"] && root["connection"].IsMap()) {
            read_connection(root["connection"], config.connect_);
        }

        if (root["sudo"] && root["sudo"].IsMap()) {
            auto sudo = root["sudo"];
            if (sudo["password"]) config.sudo_.password = sudo["password"].as<std::string>();
            if (sudo["user"]) config.sudo_.user = sudo["user"].as<std::string>();
        }

        if (root["transfer"] && root["transfer"].IsMap()) {
            read_transfer(root["transfer"], config.transfer_);
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Failed to parse config: {}", e.what()));
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

fs::path Config::get_default_config_path() {
    return platform::home_dir() / ".shuttle" / "config.yaml";
}

ConnectConfig normalize_config(const ConnectConfig& given) {
    ConnectConfig config = given;

    if (config.sock < 0 && config.host.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "config.host or config.sock must be provided");
    }
    if (config.port <= 0 || config.port > 65535) {
        throw SessionError(ErrorKind::InvalidArgument,
                           fmt::format("config.port must be a valid port, got {}", config.port));
    }
    if (config.timeout <= 0) {
        throw SessionError(ErrorKind::InvalidArgument, "config.timeout must be positive");
    }

    if (!config.private_key.empty()) {
        const auto& key = config.private_key;
        if (key.find("BEGIN") == std::string::npos || key.find("KEY") == std::string::npos) {
            fs::path key_path = key;
            if (!fs::exists(key_path)) {
                throw SessionError(ErrorKind::InvalidArgument,
                                   fmt::format("config.private_key does not exist at {}", key));
            }
            std::ifstream in(key_path, std::ios::binary);
            if (!in) {
                throw SessionError(ErrorKind::InvalidArgument,
                                   fmt::format("config.private_key cannot be read at {}", key));
            }
            std::stringstream ss;
            ss << in.rdbuf();
            config.private_key = ss.str();
        }
    }

    return config;
}
