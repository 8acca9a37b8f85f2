#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <core/types.hpp>

// Remote channel abstraction. The transport (libssh2 in production, fakes in
// tests) is driven without blocking: every network call is a RemoteOp that is
// stepped until it settles, or a stream read that reports Again.

enum class OpStatus {
    Pending,   // would block; step again after wait()
    Done,
    Failed,
};

class RemoteOp {
public:
    virtual ~RemoteOp() = default;

    // Advance without blocking. Once Done/Failed is returned the op must not
    // be stepped again.
    virtual OpStatus step() = 0;

    const RemoteError& error() const { return error_; }

protected:
    OpStatus fail(RemoteError err) {
        error_ = std::move(err);
        return OpStatus::Failed;
    }

    RemoteError error_;
};

struct RemoteAttributes {
    bool is_directory = false;
    bool is_regular = false;
    uint64_t size = 0;
    unsigned long permissions = 0;
};

// SFTP-like single-object operations.
class SftpHandle {
public:
    virtual ~SftpHandle() = default;

    // `out` must outlive the returned op.
    virtual std::unique_ptr<RemoteOp> stat(const std::string& path, RemoteAttributes* out) = 0;
    virtual std::unique_ptr<RemoteOp> mkdir(const std::string& path, int mode) = 0;
    virtual std::unique_ptr<RemoteOp> fast_get(const std::string& remote_path,
                                               const std::string& local_path,
                                               const TransferOptions& opts) = 0;
    virtual std::unique_ptr<RemoteOp> fast_put(const std::string& local_path,
                                               const std::string& remote_path,
                                               const TransferOptions& opts) = 0;

    // Block until the underlying connection may make progress (bounded).
    virtual void wait(int timeout_ms) = 0;

    // Close the subsystem. Further ops fail.
    virtual void end() = 0;
};

enum class ReadStatus {
    Data,      // bytes appended to the output buffer
    Again,     // nothing available right now
    Eof,       // stream finished
    Error,
};

// One duplex channel: stdout + stderr in, stdin out.
class RemoteStream {
public:
    virtual ~RemoteStream() = default;

    virtual ReadStatus read(StreamKind stream, std::string& out) = 0;

    // Write all of `data` (may wait internally). False on channel error.
    virtual bool write(const std::string& data) = 0;

    virtual void send_eof() = 0;

    // Close the channel and collect the exit status.
    virtual void close() = 0;

    virtual int exit_status() const = 0;
    virtual std::optional<std::string> exit_signal() const = 0;
    virtual std::string last_error() const = 0;

    virtual void wait(int timeout_ms) = 0;
};

// The connection itself: handshake, auth, channel multiplexing.
class RemoteTransport {
public:
    virtual ~RemoteTransport() = default;

    // Throws SessionError(ChannelFailure) when the connection cannot be made.
    virtual void connect(const ConnectConfig& config, StatusCallback callback) = 0;
    virtual void disconnect() = 0;
    virtual bool is_alive() = 0;

    // Throw SessionError(ChannelFailure) on failure.
    virtual std::unique_ptr<RemoteStream> open_channel(const std::string& command,
                                                       const ChannelOptions& opts) = 0;
    virtual std::unique_ptr<SftpHandle> open_sftp() = 0;
};

// Step `op` until it settles, waiting on `io` between rounds.
// Throws SessionError built from the op's error when it fails.
void run_op(RemoteOp& op, SftpHandle& io);
