#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "types.hpp"

enum class ErrorKind {
    NotConnected,           // no active session
    InvalidArgument,        // rejected before any I/O
    LocalNotFound,          // local file or directory missing
    RemoteMissingAncestor,  // ENOENT / "No such file": recoverable by creating parents
    RemoteNotADirectory,    // path exists but is not a directory
    ChannelFailure,         // transport-level error, never retried
    CommandFailure,         // a command wrote to stderr in simple-output mode
};

const char* error_kind_name(ErrorKind kind);

// Value-level failure carried by non-blocking operations and progress callbacks.
struct RemoteError {
    ErrorKind kind = ErrorKind::ChannelFailure;
    int code = 0;            // errno-style code when the remote reported one
    std::string message;
};

// True for the failures a parent-directory creation can repair.
bool is_missing_ancestor(const RemoteError& err);

class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& message, int code = 0);
    explicit SessionError(const RemoteError& err);

    ErrorKind kind() const { return kind_; }
    int code() const { return code_; }
    RemoteError to_remote_error() const;

private:
    ErrorKind kind_;
    int code_;
};

// Thrown by put_files(): the failure plus every pair that did transfer.
class TransferError : public SessionError {
public:
    TransferError(const RemoteError& cause, std::vector<LocalRemotePair> transferred);

    const std::vector<LocalRemotePair>& transferred() const { return transferred_; }

private:
    std::vector<LocalRemotePair> transferred_;
};
