#include "errors.hpp"
#include <cerrno>

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NotConnected:          return "NotConnected";
    case ErrorKind::InvalidArgument:       return "InvalidArgument";
    case ErrorKind::LocalNotFound:         return "LocalNotFound";
    case ErrorKind::RemoteMissingAncestor: return "RemoteMissingAncestor";
    case ErrorKind::RemoteNotADirectory:   return "RemoteNotADirectory";
    case ErrorKind::ChannelFailure:        return "ChannelFailure";
    case ErrorKind::CommandFailure:        return "CommandFailure";
    }
    return "Unknown";
}

bool is_missing_ancestor(const RemoteError& err) {
    return err.kind == ErrorKind::RemoteMissingAncestor ||
           err.code == ENOENT ||
           err.message == "No such file";
}

SessionError::SessionError(ErrorKind kind, const std::string& message, int code)
    : std::runtime_error(message), kind_(kind), code_(code) {}

SessionError::SessionError(const RemoteError& err)
    : std::runtime_error(err.message), kind_(err.kind), code_(err.code) {}

RemoteError SessionError::to_remote_error() const {
    return RemoteError{kind_, code_, what()};
}

TransferError::TransferError(const RemoteError& cause, std::vector<LocalRemotePair> transferred)
    : SessionError(cause), transferred_(std::move(transferred)) {}
