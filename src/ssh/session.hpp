#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <transfer/directory_transfer.hpp>
#include "remote.hpp"
#include "shell_channel.hpp"
#include "shell_driver.hpp"

using TransportFactory = std::function<std::unique_ptr<RemoteTransport>()>;

enum class MkdirMode {
    Exec,   // `mkdir -p` over a command channel
    Sftp,   // idempotent SFTP mkdir with parent recovery
};

// One reference-counted connection and everything built on it.
//
// connect() and dispose() are an explicit acquire/release pair: the first
// connect() opens the transport, later calls only take a reference, and the
// transport is torn down when the last reference is released. Every other
// operation requires a live transport and throws SessionError(NotConnected)
// otherwise.
//
// Operations that take an optional SftpHandle* use the caller's handle when
// given (and leave it open); otherwise they open one for the call and end it
// afterwards.
class Session {
public:
    explicit Session(ConnectConfig config = {}, TransportFactory factory = nullptr);
    ~Session();

    void connect(const std::optional<ConnectConfig>& config = std::nullopt,
                 StatusCallback callback = nullptr);
    void dispose();

    bool is_connected() const { return transport_ != nullptr; }
    int references() const { return references_; }

    void enable_sudo_mode(const std::string& password, const std::string& user = DEFAULT_SUDO_USER);
    void disable_sudo_mode();
    bool sudo_mode() const { return sudo_enabled_; }

    // Observer for every stdout/stderr chunk of every channel this session opens.
    void set_output_hook(OutputHook hook) { hook_ = std::move(hook); }

    void set_transfer_config(const TransferConfig& transfer) { transfer_ = transfer; }
    const TransferConfig& transfer_config() const { return transfer_; }

    std::unique_ptr<SftpHandle> request_sftp();

    // ── Commands ─────────────────────────────────────────────
    ExecResult exec_command(const std::string& command, const ExecCommandOptions& opts = {});

    // `command` followed by the shell-escaped `args`. Returns the stream named
    // by opts.stream; with Stdout, any stderr output throws CommandFailure.
    std::string exec(const std::string& command,
                     const std::vector<std::string>& args = {},
                     const ExecOptions& opts = {});

    // Like exec() but returns both streams and never checks stderr.
    ExecResult exec_both(const std::string& command,
                         const std::vector<std::string>& args = {},
                         const ExecOptions& opts = {});

    ExecResult exec_sudo_command(const std::string& command);

    // ── Files ────────────────────────────────────────────────
    void mkdir(const std::string& path, MkdirMode mode = MkdirMode::Sftp, SftpHandle* sftp = nullptr);

    void get_file(const std::string& local_path, const std::string& remote_path,
                  SftpHandle* sftp = nullptr, const std::optional<TransferOptions>& opts = std::nullopt);
    void put_file(const std::string& local_path, const std::string& remote_path,
                  SftpHandle* sftp = nullptr, const std::optional<TransferOptions>& opts = std::nullopt);

    // max_at_once == 0 uses the configured transfer concurrency.
    void put_files(const std::vector<LocalRemotePair>& files, SftpHandle* sftp = nullptr,
                   size_t max_at_once = 0, const std::optional<TransferOptions>& opts = std::nullopt);

    bool put_directory(const std::string& local_root, const std::string& remote_root,
                       const PutDirectoryOptions& options = {}, SftpHandle* sftp = nullptr,
                       const std::optional<TransferOptions>& opts = std::nullopt);

    // ── Shells ───────────────────────────────────────────────
    ShellChannel shell();

    // Privileged shell that answers the first password prompt. Falls back to
    // shell() when sudo mode is off.
    ShellChannel sudo_shell();

    // Run `commands` one per prompt and return the captured stdout.
    std::string run_commands_in_shell(const std::vector<ShellCommand>& commands, bool sudo = false);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

private:
    ConnectConfig config_;
    TransportFactory factory_;
    std::unique_ptr<RemoteTransport> transport_;
    int references_ = 0;

    bool sudo_enabled_ = false;
    std::string sudo_password_;
    std::string sudo_user_ = DEFAULT_SUDO_USER;

    OutputHook hook_;
    TransferConfig transfer_;

    RemoteTransport& require_connection();
    ShellChannel open_pty(const std::string& command);
    void teardown();

    // Borrow the caller's SFTP handle, or open one that is ended on scope exit.
    class SftpLease {
    public:
        SftpLease(Session& session, SftpHandle* given);
        ~SftpLease();
        SftpHandle& operator*() { return *handle_; }

    private:
        std::unique_ptr<SftpHandle> owned_;
        SftpHandle* handle_;
    };
};
