#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result
struct ExecResult {
    int exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::optional<std::string> signal;   // set when the command was killed by a signal

    bool success() const { return exit_code == 0 && !signal; }
    bool failed() const { return !success(); }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Options for the channel a command runs on
struct ChannelOptions {
    bool pty = false;
    std::string term = "xterm";
    int cols = 80;
    int rows = 24;
    std::map<std::string, std::string> env;
};

enum class StreamKind {
    Stdout,
    Stderr,
};

struct ExecCommandOptions {
    std::optional<std::string> cwd;
    std::optional<std::string> stdin_data;
    bool use_sudo = false;
    ChannelOptions channel;
};

struct ExecOptions {
    std::optional<std::string> cwd;
    std::optional<std::string> stdin_data;
    StreamKind stream = StreamKind::Stdout;   // which stream exec() returns
    ChannelOptions channel;
};

struct TransferOptions {
    size_t chunk_size = 32768;
    int file_mode = 0644;
};

struct LocalRemotePair {
    std::string local;
    std::string remote;

    bool operator==(const LocalRemotePair& o) const {
        return local == o.local && remote == o.remote;
    }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Observer for every chunk a channel forwards (after prompt filtering)
using OutputHook = std::function<void(StreamKind, const std::string&)>;
