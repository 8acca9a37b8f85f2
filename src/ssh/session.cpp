#include "session.hpp"
#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <transfer/remote_fs.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;

static std::unique_ptr<RemoteTransport> make_libssh2_transport() {
    return std::make_unique<Libssh2Transport>();
}

Session::Session(ConnectConfig config, TransportFactory factory)
    : config_(std::move(config)),
      factory_(factory ? std::move(factory) : TransportFactory(make_libssh2_transport)) {}

Session::~Session() {
    teardown();
}

// ── Lifecycle ──────────────────────────────────────────────────

void Session::connect(const std::optional<ConnectConfig>& config, StatusCallback callback) {
    references_++;
    if (transport_) return;

    if (config) config_ = *config;

    try {
        ConnectConfig normalized = normalize_config(config_);
        auto transport = factory_();
        transport->connect(normalized, callback);
        transport_ = std::move(transport);
    } catch (...) {
        references_--;
        throw;
    }
    shuttle_log(fmt::format("Session connected ({} reference)", references_));
}

void Session::dispose() {
    if (references_ > 0) references_--;
    if (references_ == 0 && transport_) {
        teardown();
    }
}

void Session::teardown() {
    if (!transport_) return;
    shuttle_log("Session teardown");
    transport_->disconnect();
    transport_.reset();
}

RemoteTransport& Session::require_connection() {
    if (!transport_) {
        throw SessionError(ErrorKind::NotConnected, "Not connected to server");
    }
    if (!transport_->is_alive()) {
        shuttle_log("Connection lost; dropping transport");
        transport_.reset();
        references_ = 0;
        throw SessionError(ErrorKind::NotConnected, "Not connected to server");
    }
    return *transport_;
}

void Session::enable_sudo_mode(const std::string& password, const std::string& user) {
    sudo_password_ = password;
    sudo_user_ = user.empty() ? DEFAULT_SUDO_USER : user;
    sudo_enabled_ = true;
}

void Session::disable_sudo_mode() {
    sudo_password_.clear();
    sudo_enabled_ = false;
}

std::unique_ptr<SftpHandle> Session::request_sftp() {
    return require_connection().open_sftp();
}

Session::SftpLease::SftpLease(Session& session, SftpHandle* given) : handle_(given) {
    if (!handle_) {
        owned_ = session.request_sftp();
        handle_ = owned_.get();
    }
}

Session::SftpLease::~SftpLease() {
    if (owned_) owned_->end();
}

// ── Commands ───────────────────────────────────────────────────

ExecResult Session::exec_command(const std::string& given, const ExecCommandOptions& opts) {
    RemoteTransport& transport = require_connection();

    std::string command = given;
    if (opts.cwd) {
        // cd output is discarded so a missing directory does not show up as stderr
        command = fmt::format("cd {} 1> /dev/null 2> /dev/null; {}", shell_escape(*opts.cwd), command);
    }

    ShellChannel channel(transport.open_channel(command, opts.channel), hook_);
    if (opts.use_sudo && sudo_enabled_) {
        channel.answer_password_once(sudo_password_);
    }

    if (opts.stdin_data) {
        if (!channel.write(*opts.stdin_data)) {
            throw SessionError(ErrorKind::ChannelFailure, "Failed to write stdin for: " + given);
        }
        channel.end();
    }

    ExecResult result;
    bool closed = false;
    while (!closed) {
        auto events = channel.poll();
        if (events.empty()) {
            channel.wait(SSH_POLL_INTERVAL_MS);
            continue;
        }
        for (auto& ev : events) {
            switch (ev.type) {
            case ShellEventType::DataChunk:
                (ev.stream == StreamKind::Stdout ? result.stdout_data : result.stderr_data) += ev.data;
                break;
            case ShellEventType::Closed:
                result.exit_code = ev.exit_code;
                result.signal = ev.signal;
                closed = true;
                break;
            case ShellEventType::Errored:
                throw SessionError(ErrorKind::ChannelFailure, ev.data);
            default:
                break;
            }
        }
    }

    trim(result.stdout_data);
    trim(result.stderr_data);
    shuttle_log_exec("exec", command, result);
    return result;
}

static std::string join_command(const std::string& command, const std::vector<std::string>& args) {
    if (args.empty()) return command;
    return command + " " + shell_escape(args);
}

static ExecCommandOptions to_command_options(const ExecOptions& opts) {
    ExecCommandOptions out;
    out.cwd = opts.cwd;
    out.stdin_data = opts.stdin_data;
    out.channel = opts.channel;
    return out;
}

std::string Session::exec(const std::string& command, const std::vector<std::string>& args,
                          const ExecOptions& opts) {
    auto result = exec_command(join_command(command, args), to_command_options(opts));

    if (opts.stream == StreamKind::Stderr) {
        return result.stderr_data;
    }
    if (!result.stderr_data.empty()) {
        throw SessionError(ErrorKind::CommandFailure, result.stderr_data);
    }
    return result.stdout_data;
}

ExecResult Session::exec_both(const std::string& command, const std::vector<std::string>& args,
                              const ExecOptions& opts) {
    return exec_command(join_command(command, args), to_command_options(opts));
}

ExecResult Session::exec_sudo_command(const std::string& command) {
    if (!sudo_enabled_) {
        return exec_command(command);
    }

    ExecCommandOptions opts;
    opts.use_sudo = true;
    opts.channel.pty = true;
    return exec_command(fmt::format(SUDO_EXEC_COMMAND, base64_encode(command), sudo_user_), opts);
}

// ── Files ──────────────────────────────────────────────────────

void Session::mkdir(const std::string& path, MkdirMode mode, SftpHandle* sftp) {
    require_connection();
    if (path.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "path must be a non-empty string");
    }

    if (mode == MkdirMode::Exec) {
        exec("mkdir", {"-p", path});
        return;
    }

    SftpLease lease(*this, sftp);
    EnsureDirectoryOp op(*lease, path, transfer_.dir_mode);
    run_op(op, *lease);
}

void Session::get_file(const std::string& local_path, const std::string& remote_path,
                       SftpHandle* sftp, const std::optional<TransferOptions>& opts) {
    require_connection();
    if (local_path.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "localFile must be a non-empty string");
    }
    if (remote_path.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "remoteFile must be a non-empty string");
    }

    fs::path parent = fs::path(local_path).parent_path();
    std::error_code ec;
    if (!parent.empty() && !fs::is_directory(parent, ec)) {
        throw SessionError(ErrorKind::LocalNotFound,
                           "local directory does not exist at " + parent.string());
    }

    SftpLease lease(*this, sftp);
    auto op = (*lease).fast_get(remote_path, local_path, opts.value_or(transfer_.transfer_options()));
    run_op(*op, *lease);
    shuttle_log(fmt::format("get {} -> {}", remote_path, local_path));
}

void Session::put_file(const std::string& local_path, const std::string& remote_path,
                       SftpHandle* sftp, const std::optional<TransferOptions>& opts) {
    require_connection();
    if (local_path.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "localFile must be a non-empty string");
    }
    if (remote_path.empty()) {
        throw SessionError(ErrorKind::InvalidArgument, "remoteFile must be a non-empty string");
    }
    std::error_code ec;
    if (!fs::exists(local_path, ec)) {
        throw SessionError(ErrorKind::LocalNotFound, "localFile does not exist at " + local_path);
    }

    SftpLease lease(*this, sftp);
    PutFileOp op(*lease, local_path, remote_path, opts.value_or(transfer_.transfer_options()),
                 nullptr, transfer_.dir_mode);
    run_op(op, *lease);
    shuttle_log(fmt::format("put {} -> {}", local_path, remote_path));
}

void Session::put_files(const std::vector<LocalRemotePair>& files, SftpHandle* sftp,
                        size_t max_at_once, const std::optional<TransferOptions>& opts) {
    require_connection();
    size_t window = max_at_once ? max_at_once : transfer_.concurrency;
    validate_put_files(files, window);

    SftpLease lease(*this, sftp);
    ::put_files(*lease, files, window,
                opts.value_or(transfer_.transfer_options()), transfer_.dir_mode);
}

bool Session::put_directory(const std::string& local_root, const std::string& remote_root,
                            const PutDirectoryOptions& options, SftpHandle* sftp,
                            const std::optional<TransferOptions>& opts) {
    require_connection();
    validate_put_directory(local_root, remote_root, transfer_.concurrency);

    SftpLease lease(*this, sftp);
    return ::put_directory(*lease, local_root, remote_root, options,
                           opts.value_or(transfer_.transfer_options()),
                           transfer_.concurrency, transfer_.dir_mode);
}

// ── Shells ─────────────────────────────────────────────────────

ShellChannel Session::open_pty(const std::string& command) {
    ChannelOptions opts;
    opts.pty = true;
    return ShellChannel(require_connection().open_channel(command, opts), hook_);
}

ShellChannel Session::shell() {
    return open_pty(SHELL_COMMAND);
}

ShellChannel Session::sudo_shell() {
    if (!sudo_enabled_) {
        return shell();
    }
    ShellChannel channel = open_pty(fmt::format(SUDO_SHELL_COMMAND, sudo_user_));
    channel.answer_password_once(sudo_password_);
    return channel;
}

std::string Session::run_commands_in_shell(const std::vector<ShellCommand>& commands, bool sudo) {
    bool privileged = sudo && sudo_enabled_;
    ShellChannel channel = privileged
        ? open_pty(fmt::format(SUDO_SHELL_COMMAND, sudo_user_))
        : shell();

    std::optional<std::string> credential;
    if (privileged) credential = sudo_password_;

    ShellDriver driver(channel, std::deque<ShellCommand>(commands.begin(), commands.end()),
                       credential);
    return driver.run();
}
