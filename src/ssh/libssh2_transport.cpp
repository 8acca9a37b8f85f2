#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>

// ── Keyboard-interactive auth ──────────────────────────────────

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    // Every prompt gets the password; servers that want more than that
    // need an interactive client.
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static bool libssh2_ready() {
    static int rc = libssh2_init(0);
    return rc == 0;
}

static std::string session_error_text(LIBSSH2_SESSION* session) {
    if (!session) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "unknown libssh2 error";
}

// ── SFTP status mapping ────────────────────────────────────────

static RemoteError sftp_status_error(unsigned long fx, const std::string& path) {
    switch (fx) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return {ErrorKind::RemoteMissingAncestor, ENOENT, "No such file"};
    case LIBSSH2_FX_PERMISSION_DENIED:
        return {ErrorKind::ChannelFailure, EACCES, "Permission denied: " + path};
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return {ErrorKind::ChannelFailure, EEXIST, "File already exists: " + path};
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return {ErrorKind::RemoteNotADirectory, ENOTDIR, "Not a directory: " + path};
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        return {ErrorKind::ChannelFailure, ENOSPC, "No space left on device: " + path};
    case LIBSSH2_FX_FAILURE:
        return {ErrorKind::ChannelFailure, 0, "Failure: " + path};
    default:
        return {ErrorKind::ChannelFailure, 0, fmt::format("SFTP error {}: {}", fx, path)};
    }
}

// ── Channel stream ─────────────────────────────────────────────

Libssh2Stream::Libssh2Stream(LIBSSH2_CHANNEL* ch, std::shared_ptr<Libssh2Link> link)
    : ch_(ch), link_(std::move(link)) {}

Libssh2Stream::~Libssh2Stream() {
    close();
    if (ch_ && link_->open()) {
        libssh2_channel_free(ch_);
    }
    ch_ = nullptr;
}

ReadStatus Libssh2Stream::read(StreamKind stream, std::string& out) {
    if (!ch_) return ReadStatus::Eof;
    if (!link_->open()) {
        error_ = "SSH session closed";
        return ReadStatus::Error;
    }

    char buf[SSH_READ_BUF_SIZE];
    int stream_id = (stream == StreamKind::Stderr) ? SSH_EXTENDED_DATA_STDERR : 0;
    ssize_t n = libssh2_channel_read_ex(ch_, stream_id, buf, sizeof(buf));

    if (n > 0) {
        out.append(buf, static_cast<size_t>(n));
        return ReadStatus::Data;
    }
    if (n == LIBSSH2_ERROR_EAGAIN) {
        return libssh2_channel_eof(ch_) ? ReadStatus::Eof : ReadStatus::Again;
    }
    if (n == 0) return ReadStatus::Eof;

    error_ = fmt::format("SSH channel read error ({}): {}", n, link_->last_error());
    return ReadStatus::Error;
}

bool Libssh2Stream::write(const std::string& data) {
    if (!ch_ || closed_) return false;
    if (!link_->open()) {
        error_ = "SSH session closed";
        return false;
    }

    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w = libssh2_channel_write(ch_, data.data() + sent, data.size() - sent);
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > SSH_WRITE_MAX_RETRIES) {
                error_ = "Write stalled (EAGAIN for too long)";
                return false;
            }
            link_->wait(SSH_POLL_INTERVAL_MS);
            continue;
        }
        if (w < 0) {
            error_ = "Channel write error: " + link_->last_error();
            return false;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

void Libssh2Stream::send_eof() {
    if (!ch_ || closed_ || !link_->open()) return;
    while (libssh2_channel_send_eof(ch_) == LIBSSH2_ERROR_EAGAIN) {
        link_->wait(SSH_POLL_INTERVAL_MS);
    }
}

void Libssh2Stream::close() {
    if (!ch_ || closed_) return;
    closed_ = true;
    if (!link_->open()) return;

    int rc;
    while ((rc = libssh2_channel_close(ch_)) == LIBSSH2_ERROR_EAGAIN) {
        link_->wait(SSH_POLL_INTERVAL_MS);
    }
    if (rc != 0) return;

    while (libssh2_channel_wait_closed(ch_) == LIBSSH2_ERROR_EAGAIN) {
        link_->wait(SSH_POLL_INTERVAL_MS);
    }

    exit_status_ = libssh2_channel_get_exit_status(ch_);

    char* sig = nullptr;
    size_t sig_len = 0;
    if (libssh2_channel_get_exit_signal(ch_, &sig, &sig_len, nullptr, nullptr,
                                        nullptr, nullptr) == 0 && sig) {
        exit_signal_ = std::string(sig, sig_len);
        libssh2_free(link_->session, sig);
    }
}

// ── SFTP ───────────────────────────────────────────────────────

Libssh2Sftp::Libssh2Sftp(LIBSSH2_SFTP* sftp, std::shared_ptr<Libssh2Link> link)
    : sftp_(sftp), link_(std::move(link)) {}

void Libssh2Sftp::end() {
    if (!sftp_) return;
    // After a disconnect the subsystem went down with the session
    if (link_->open()) {
        while (libssh2_sftp_shutdown(sftp_) == LIBSSH2_ERROR_EAGAIN) {
            link_->wait(SSH_POLL_INTERVAL_MS);
        }
    }
    sftp_ = nullptr;
}

bool Libssh2Sftp::acquire(const void* op) {
    if (owner_ && owner_ != op) return false;
    owner_ = op;
    return true;
}

void Libssh2Sftp::release(const void* op) {
    if (owner_ == op) owner_ = nullptr;
}

RemoteError Libssh2Sftp::error_for(int rc, const std::string& path) const {
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && raw()) {
        return sftp_status_error(libssh2_sftp_last_error(sftp_), path);
    }
    return {ErrorKind::ChannelFailure, 0,
            fmt::format("{} ({})", link_->last_error(), path)};
}

namespace {

class SftpOpBase : public RemoteOp {
public:
    explicit SftpOpBase(Libssh2Sftp& sftp) : sftp_(sftp) {}
    ~SftpOpBase() override { sftp_.release(this); }

protected:
    Libssh2Sftp& sftp_;

    OpStatus closed_subsystem() {
        return fail({ErrorKind::ChannelFailure, 0, "SFTP session already ended"});
    }
};

class StatOp : public SftpOpBase {
public:
    StatOp(Libssh2Sftp& sftp, std::string path, RemoteAttributes* out)
        : SftpOpBase(sftp), path_(std::move(path)), out_(out) {}

    OpStatus step() override {
        if (!sftp_.raw()) return closed_subsystem();
        if (!sftp_.acquire(this)) return OpStatus::Pending;

        LIBSSH2_SFTP_ATTRIBUTES attrs;
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_stat_ex(sftp_.raw(), path_.c_str(),
                                      static_cast<unsigned int>(path_.size()),
                                      LIBSSH2_SFTP_STAT, &attrs);
        if (rc == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
        sftp_.release(this);
        if (rc < 0) return fail(sftp_.error_for(rc, path_));

        if (out_) {
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
                out_->permissions = attrs.permissions;
                out_->is_directory = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
                out_->is_regular = LIBSSH2_SFTP_S_ISREG(attrs.permissions);
            }
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) {
                out_->size = attrs.filesize;
            }
        }
        return OpStatus::Done;
    }

private:
    std::string path_;
    RemoteAttributes* out_;
};

class MkdirOp : public SftpOpBase {
public:
    MkdirOp(Libssh2Sftp& sftp, std::string path, int mode)
        : SftpOpBase(sftp), path_(std::move(path)), mode_(mode) {}

    OpStatus step() override {
        if (!sftp_.raw()) return closed_subsystem();
        if (!sftp_.acquire(this)) return OpStatus::Pending;

        int rc = libssh2_sftp_mkdir_ex(sftp_.raw(), path_.c_str(),
                                       static_cast<unsigned int>(path_.size()), mode_);
        if (rc == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
        sftp_.release(this);
        if (rc < 0) return fail(sftp_.error_for(rc, path_));
        return OpStatus::Done;
    }

private:
    std::string path_;
    int mode_;
};

// Shared open/close handling for the two transfer directions.
class FileTransferOp : public SftpOpBase {
public:
    FileTransferOp(Libssh2Sftp& sftp, std::string remote, const TransferOptions& opts)
        : SftpOpBase(sftp), remote_(std::move(remote)), opts_(opts),
          buf_(opts.chunk_size > 0 ? opts.chunk_size : DEFAULT_CHUNK_SIZE) {}

    ~FileTransferOp() override {
        if (handle_ && sftp_.raw()) {
            while (libssh2_sftp_close_handle(handle_) == LIBSSH2_ERROR_EAGAIN) {
                sftp_.link().wait(SSH_POLL_INTERVAL_MS);
            }
        }
        handle_ = nullptr;
    }

protected:
    enum class Phase { Open, Transfer, Close };

    std::string remote_;
    TransferOptions opts_;
    std::vector<char> buf_;
    LIBSSH2_SFTP_HANDLE* handle_ = nullptr;
    Phase phase_ = Phase::Open;

    // Pending until the handle is open; Failed on error; Done once open.
    OpStatus open_remote(unsigned long flags, long mode) {
        if (!sftp_.acquire(this)) return OpStatus::Pending;
        handle_ = libssh2_sftp_open_ex(sftp_.raw(), remote_.c_str(),
                                       static_cast<unsigned int>(remote_.size()),
                                       flags, mode, LIBSSH2_SFTP_OPENFILE);
        if (!handle_) {
            int rc = libssh2_session_last_errno(sftp_.link().session);
            if (rc == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
            sftp_.release(this);
            return fail(sftp_.error_for(rc, remote_));
        }
        sftp_.release(this);
        return OpStatus::Done;
    }

    OpStatus close_remote() {
        if (!sftp_.acquire(this)) return OpStatus::Pending;
        int rc = libssh2_sftp_close_handle(handle_);
        if (rc == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
        sftp_.release(this);
        handle_ = nullptr;
        if (rc < 0) return fail(sftp_.error_for(rc, remote_));
        return OpStatus::Done;
    }
};

class PutOp : public FileTransferOp {
public:
    PutOp(Libssh2Sftp& sftp, std::string local, std::string remote, const TransferOptions& opts)
        : FileTransferOp(sftp, std::move(remote), opts), local_(std::move(local)) {}

    OpStatus step() override {
        if (!sftp_.raw()) return closed_subsystem();

        while (true) {
            switch (phase_) {
            case Phase::Open: {
                if (!in_.is_open()) {
                    in_.open(local_, std::ios::binary);
                    if (!in_) {
                        return fail({ErrorKind::LocalNotFound, 0, "Cannot read file: " + local_});
                    }
                }
                auto status = open_remote(LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                          opts_.file_mode);
                if (status != OpStatus::Done) return status;
                phase_ = Phase::Transfer;
                break;
            }

            case Phase::Transfer: {
                if (offset_ == filled_) {
                    in_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
                    filled_ = static_cast<size_t>(in_.gcount());
                    offset_ = 0;
                    if (filled_ == 0) {
                        if (in_.bad()) {
                            return fail({ErrorKind::LocalNotFound, 0, "Read error on " + local_});
                        }
                        phase_ = Phase::Close;
                        break;
                    }
                }

                if (!sftp_.acquire(this)) return OpStatus::Pending;
                ssize_t n = libssh2_sftp_write(handle_, buf_.data() + offset_, filled_ - offset_);
                if (n == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
                sftp_.release(this);
                if (n < 0) return fail(sftp_.error_for(static_cast<int>(n), remote_));
                offset_ += static_cast<size_t>(n);
                break;
            }

            case Phase::Close:
                return close_remote();
            }
        }
    }

private:
    std::string local_;
    std::ifstream in_;
    size_t filled_ = 0;
    size_t offset_ = 0;
};

class GetOp : public FileTransferOp {
public:
    GetOp(Libssh2Sftp& sftp, std::string remote, std::string local, const TransferOptions& opts)
        : FileTransferOp(sftp, std::move(remote), opts), local_(std::move(local)) {}

    OpStatus step() override {
        if (!sftp_.raw()) return closed_subsystem();

        while (true) {
            switch (phase_) {
            case Phase::Open: {
                auto status = open_remote(LIBSSH2_FXF_READ, 0);
                if (status != OpStatus::Done) return status;
                out_.open(local_, std::ios::binary | std::ios::trunc);
                if (!out_) {
                    return fail({ErrorKind::LocalNotFound, 0, "Cannot write file: " + local_});
                }
                phase_ = Phase::Transfer;
                break;
            }

            case Phase::Transfer: {
                if (!sftp_.acquire(this)) return OpStatus::Pending;
                ssize_t n = libssh2_sftp_read(handle_, buf_.data(), buf_.size());
                if (n == LIBSSH2_ERROR_EAGAIN) return OpStatus::Pending;
                sftp_.release(this);
                if (n < 0) return fail(sftp_.error_for(static_cast<int>(n), remote_));
                if (n == 0) {
                    out_.close();
                    phase_ = Phase::Close;
                    break;
                }
                out_.write(buf_.data(), n);
                if (!out_) {
                    return fail({ErrorKind::LocalNotFound, 0, "Write error on " + local_});
                }
                break;
            }

            case Phase::Close:
                return close_remote();
            }
        }
    }

private:
    std::string local_;
    std::ofstream out_;
};

} // namespace

std::unique_ptr<RemoteOp> Libssh2Sftp::stat(const std::string& path, RemoteAttributes* out) {
    return std::make_unique<StatOp>(*this, path, out);
}

std::unique_ptr<RemoteOp> Libssh2Sftp::mkdir(const std::string& path, int mode) {
    return std::make_unique<MkdirOp>(*this, path, mode);
}

std::unique_ptr<RemoteOp> Libssh2Sftp::fast_get(const std::string& remote_path,
                                                const std::string& local_path,
                                                const TransferOptions& opts) {
    return std::make_unique<GetOp>(*this, remote_path, local_path, opts);
}

std::unique_ptr<RemoteOp> Libssh2Sftp::fast_put(const std::string& local_path,
                                                const std::string& remote_path,
                                                const TransferOptions& opts) {
    return std::make_unique<PutOp>(*this, local_path, remote_path, opts);
}

// ── Transport ──────────────────────────────────────────────────

Libssh2Transport::Libssh2Transport() : link_(std::make_shared<Libssh2Link>()) {}

Libssh2Transport::~Libssh2Transport() {
    disconnect();
}

SessionError Libssh2Transport::connect_error(const std::string& message) {
    shuttle_log("Connect failed: " + message);
    disconnect();
    return SessionError(ErrorKind::ChannelFailure, message);
}

void Libssh2Transport::connect(const ConnectConfig& config, StatusCallback callback) {
    if (!libssh2_ready()) {
        throw SessionError(ErrorKind::ChannelFailure, "Failed to initialize libssh2");
    }

    timeout_secs_ = config.timeout;

    if (config.sock >= 0) {
        link_->sock = static_cast<socket_t>(config.sock);
        owns_socket_ = false;
        platform::set_nonblocking(link_->sock);
    } else {
        if (callback) callback(fmt::format("Connecting to {}:{}...", config.host, config.port));
        std::string error;
        link_->sock = platform::connect_tcp(config.host, config.port, config.timeout * 1000, error);
        if (link_->sock == SHUTTLE_INVALID_SOCKET) {
            throw connect_error(error);
        }
        owns_socket_ = true;
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    link_->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!link_->session) {
        throw connect_error("Failed to create SSH session");
    }
    libssh2_session_set_blocking(link_->session, 0);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    int ret;
    while ((ret = libssh2_session_handshake(link_->session, link_->sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) {
            throw connect_error("SSH handshake timed out");
        }
        wait(100);
    }
    if (ret != 0) {
        throw connect_error("SSH handshake failed: " + last_error());
    }

    platform::enable_tcp_keepalive(link_->sock);
    libssh2_keepalive_config(link_->session, 1, static_cast<unsigned>(config.keepalive_interval));

    if (callback) callback("SSH handshake complete, authenticating...");
    authenticate(config, callback);

    active_ = true;
    shuttle_log(fmt::format("Connected to {}@{}", config.username, config.host));
    if (callback) callback("Connected to " + config.host);
}

void Libssh2Transport::authenticate(const ConnectConfig& config, StatusCallback callback) {
    const std::string& user = config.username;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    auto timed_out = [&]() { return std::chrono::steady_clock::now() > deadline; };
    int ret;

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(link_->session, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(link_->session)) return;  // "none" auth accepted
        if (libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN || timed_out()) break;
        wait(100);
    }
    std::string methods = auth_list ? auth_list : "";
    shuttle_log("Auth methods: " + methods);

    if (!config.private_key.empty()) {
        if (callback) callback("Using public key auth...");
        const char* passphrase = config.passphrase.empty() ? nullptr : config.passphrase.c_str();
        while ((ret = libssh2_userauth_publickey_frommemory(
                    link_->session, user.c_str(), user.length(), nullptr, 0,
                    config.private_key.c_str(), config.private_key.length(),
                    passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            if (timed_out()) throw connect_error("Authentication timed out");
            wait(100);
        }
        if (ret == 0) return;
        shuttle_log("Public key auth failed: " + last_error());
    }

    if (!config.password.empty() && methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data;
        kbd_data.password = config.password;
        kbd_data.prompt_round = 0;
        *libssh2_session_abstract(link_->session) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(link_->session, user.c_str(),
                                                            kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (timed_out()) break;
            wait(100);
        }
        *libssh2_session_abstract(link_->session) = nullptr;
        if (ret == 0) return;
    }

    if (!config.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        if (callback) callback("Using password auth...");
        while ((ret = libssh2_userauth_password(link_->session, user.c_str(),
                                                config.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (timed_out()) throw connect_error("Authentication timed out");
            wait(100);
        }
        if (ret == 0) return;
    }

    throw connect_error(fmt::format("All configured authentication methods failed for {}", user));
}

void Libssh2Transport::disconnect() {
    active_ = false;

    if (link_->session) {
        while (libssh2_session_disconnect(link_->session, "Normal disconnection") == LIBSSH2_ERROR_EAGAIN) {
            wait(SSH_POLL_INTERVAL_MS);
        }
        libssh2_session_free(link_->session);
        link_->session = nullptr;
    }

    if (link_->sock != SHUTTLE_INVALID_SOCKET) {
        if (owns_socket_) platform::close_socket(link_->sock);
        link_->sock = SHUTTLE_INVALID_SOCKET;
    }
}

bool Libssh2Transport::is_alive() {
    if (!active_ || !link_->session || link_->sock == SHUTTLE_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(link_->session, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(link_->sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }
    return true;
}

std::unique_ptr<RemoteStream> Libssh2Transport::open_channel(const std::string& command,
                                                             const ChannelOptions& opts) {
    if (!link_->session) {
        throw SessionError(ErrorKind::NotConnected, "Not connected to server");
    }

    LIBSSH2_CHANNEL* ch = nullptr;
    while ((ch = libssh2_channel_open_session(link_->session)) == nullptr) {
        if (libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
            throw SessionError(ErrorKind::ChannelFailure, "Failed to open channel: " + last_error());
        }
        wait(SSH_POLL_INTERVAL_MS);
    }
    // From here the stream owns the channel and frees it on any exit.
    auto stream = std::make_unique<Libssh2Stream>(ch, link_);

    for (const auto& [name, value] : opts.env) {
        int rc;
        while ((rc = libssh2_channel_setenv_ex(ch, name.c_str(), static_cast<unsigned int>(name.size()),
                                               value.c_str(), static_cast<unsigned int>(value.size())))
               == LIBSSH2_ERROR_EAGAIN) {
            wait(SSH_POLL_INTERVAL_MS);
        }
        // Most servers only accept a whitelist of variables
        if (rc != 0) shuttle_log(fmt::format("Server rejected env {}", name));
    }

    int rc;
    if (opts.pty) {
        while ((rc = libssh2_channel_request_pty_ex(
                    ch, opts.term.c_str(), static_cast<unsigned int>(opts.term.size()),
                    nullptr, 0, opts.cols, opts.rows, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
            wait(SSH_POLL_INTERVAL_MS);
        }
        if (rc != 0) {
            throw SessionError(ErrorKind::ChannelFailure, "Failed to request pty: " + last_error());
        }
    }

    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        wait(SSH_POLL_INTERVAL_MS);
    }
    if (rc != 0) {
        throw SessionError(ErrorKind::ChannelFailure, "Failed to exec command on channel: " + last_error());
    }

    return stream;
}

std::unique_ptr<SftpHandle> Libssh2Transport::open_sftp() {
    if (!link_->session) {
        throw SessionError(ErrorKind::NotConnected, "Not connected to server");
    }

    LIBSSH2_SFTP* sftp = nullptr;
    while ((sftp = libssh2_sftp_init(link_->session)) == nullptr) {
        if (libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
            throw SessionError(ErrorKind::ChannelFailure, "SFTP init failed: " + last_error());
        }
        wait(SSH_POLL_INTERVAL_MS);
    }
    return std::make_unique<Libssh2Sftp>(sftp, link_);
}

void Libssh2Link::wait(int timeout_ms) const {
    if (!session || sock == SHUTTLE_INVALID_SOCKET) {
        platform::sleep_ms(timeout_ms);
        return;
    }

    int dirs = libssh2_session_block_directions(session);
    short events = 0;
    if (dirs & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dirs & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock, events, timeout_ms);
}

std::string Libssh2Link::last_error() const {
    return session_error_text(session);
}
