#pragma once

#include <memory>
#include <optional>
#include <string>
#include <platform/socket_util.hpp>
#include "remote.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// Session and socket shared between a transport and every channel or SFTP
// handle opened on it. disconnect() frees the session and clears `session`,
// so a handle that outlives its transport finds it null and makes no further
// libssh2 calls (libssh2_session_free already released its channel).
struct Libssh2Link {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SHUTTLE_INVALID_SOCKET;

    bool open() const { return session != nullptr; }

    // Poll the socket for whatever direction libssh2 is waiting on.
    void wait(int timeout_ms) const;

    // Last libssh2 error text for this session.
    std::string last_error() const;
};

// RemoteTransport over a non-blocking libssh2 session.
//
// Every libssh2 call that would block returns EAGAIN; channel and SFTP ops
// surface that as Pending / ReadStatus::Again and wait() polls the socket in
// the direction libssh2 is blocked on.
class Libssh2Transport : public RemoteTransport {
public:
    Libssh2Transport();
    ~Libssh2Transport() override;

    void connect(const ConnectConfig& config, StatusCallback callback) override;
    void disconnect() override;
    bool is_alive() override;

    std::unique_ptr<RemoteStream> open_channel(const std::string& command,
                                               const ChannelOptions& opts) override;
    std::unique_ptr<SftpHandle> open_sftp() override;

    void wait(int timeout_ms) { link_->wait(timeout_ms); }
    std::string last_error() const { return link_->last_error(); }

    const std::shared_ptr<Libssh2Link>& link() const { return link_; }

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

private:
    std::shared_ptr<Libssh2Link> link_;
    bool owns_socket_ = false;
    bool active_ = false;
    int timeout_secs_ = 30;

    void authenticate(const ConnectConfig& config, StatusCallback callback);
    // Tear down a half-built session and build the error to throw.
    SessionError connect_error(const std::string& message);
};

// One exec channel. Owns `ch` while the link is open.
class Libssh2Stream : public RemoteStream {
public:
    Libssh2Stream(LIBSSH2_CHANNEL* ch, std::shared_ptr<Libssh2Link> link);
    ~Libssh2Stream() override;

    ReadStatus read(StreamKind stream, std::string& out) override;
    bool write(const std::string& data) override;
    void send_eof() override;
    void close() override;

    int exit_status() const override { return exit_status_; }
    std::optional<std::string> exit_signal() const override { return exit_signal_; }
    std::string last_error() const override { return error_; }

    void wait(int timeout_ms) override { link_->wait(timeout_ms); }

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<Libssh2Link> link_;
    bool closed_ = false;
    int exit_status_ = -1;
    std::optional<std::string> exit_signal_;
    std::string error_;
};

// libssh2 keeps per-subsystem request state (open/stat/mkdir/close all
// share it), so at most one op may be inside a request at a time. An op that
// got EAGAIN keeps the slot until its call completes.
class Libssh2Sftp : public SftpHandle {
public:
    Libssh2Sftp(LIBSSH2_SFTP* sftp, std::shared_ptr<Libssh2Link> link);
    ~Libssh2Sftp() override { end(); }

    std::unique_ptr<RemoteOp> stat(const std::string& path, RemoteAttributes* out) override;
    std::unique_ptr<RemoteOp> mkdir(const std::string& path, int mode) override;
    std::unique_ptr<RemoteOp> fast_get(const std::string& remote_path,
                                       const std::string& local_path,
                                       const TransferOptions& opts) override;
    std::unique_ptr<RemoteOp> fast_put(const std::string& local_path,
                                       const std::string& remote_path,
                                       const TransferOptions& opts) override;

    void wait(int timeout_ms) override { link_->wait(timeout_ms); }
    void end() override;

    // Null once ended or once the transport has disconnected.
    LIBSSH2_SFTP* raw() const { return link_->open() ? sftp_ : nullptr; }
    const Libssh2Link& link() const { return *link_; }

    bool acquire(const void* op);
    void release(const void* op);

    // Error for a failed libssh2 call (rc < 0, not EAGAIN).
    RemoteError error_for(int rc, const std::string& path) const;

private:
    LIBSSH2_SFTP* sftp_;
    std::shared_ptr<Libssh2Link> link_;
    const void* owner_ = nullptr;
};
