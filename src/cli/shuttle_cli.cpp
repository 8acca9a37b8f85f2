#include "shuttle_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <iostream>
#include <fmt/format.h>

ShuttleCLI::ShuttleCLI(const std::string& config_path) : config_path_(config_path) {
    register_commands();
}

ShuttleCLI::~ShuttleCLI() {
    if (session_) session_->dispose();
}

void ShuttleCLI::add_command(const std::string& name, const std::string& args,
                             CommandHandler handler, const std::string& help) {
    commands_[name] = {args, std::move(handler), help};
}

Session& ShuttleCLI::session() {
    if (session_ && session_->is_connected()) return *session_;

    if (!config_) {
        auto result = config_path_.empty() ? Config::load() : Config::load(config_path_);
        if (result.is_err()) {
            throw SessionError(ErrorKind::InvalidArgument, result.error);
        }
        config_ = result.value;
    }

    session_ = std::make_unique<Session>(config_->connect());
    session_->set_transfer_config(config_->transfer());
    if (config_->has_sudo()) {
        session_->enable_sudo_mode(config_->sudo().password, config_->sudo().user);
    }
    session_->set_output_hook([](StreamKind stream, const std::string& chunk) {
        if (stream == StreamKind::Stderr) std::cerr << chunk << std::flush;
    });

    session_->connect(std::nullopt, [](const std::string& msg) {
        std::cerr << theme::log(msg);
    });
    return *session_;
}

bool ShuttleCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'shuttle --help' for available commands.");
        return false;
    }

    try {
        it->second.handler(*this, args);
        return true;
    } catch (const TransferError& e) {
        std::cout << theme::fail(e.what());
        for (const auto& pair : e.transferred()) {
            std::cout << theme::step(fmt::format("transferred {} -> {}", pair.local, pair.remote));
        }
    } catch (const SessionError& e) {
        std::cout << theme::fail(fmt::format("{}: {}", error_kind_name(e.kind()), e.what()));
    } catch (const std::exception& e) {
        std::cout << theme::fail(e.what());
    }
    return false;
}

void ShuttleCLI::print_help() const {
    std::cout << theme::section("Usage");
    std::cout << theme::dim("    shuttle [--config PATH] <command> [args...]") << "\n";
    std::cout << theme::section("Commands");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::usage(name, entry.args, entry.help);
    }
    std::cout << "\n";
}

// ── Commands ───────────────────────────────────────────────────

static void require_args(const ShuttleCLI::Args& args, size_t count, const std::string& usage) {
    if (args.size() < count) {
        throw SessionError(ErrorKind::InvalidArgument, "Usage: shuttle " + usage);
    }
}

void ShuttleCLI::register_commands() {
    add_command("exec", "<cmd> [args...]", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 1, "exec <cmd> [args...]");
        Args rest(args.begin() + 1, args.end());
        auto result = cli.session().exec_both(args[0], rest);
        if (!result.stdout_data.empty()) std::cout << result.stdout_data << "\n";
        if (result.failed()) {
            throw SessionError(ErrorKind::CommandFailure,
                               fmt::format("exited with {}", result.signal ? *result.signal
                                                                           : std::to_string(result.exit_code)));
        }
    }, "Run a command and print its output");

    add_command("mkdir", "<path>", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 1, "mkdir <path>");
        cli.session().mkdir(args[0]);
        std::cout << theme::ok("Created " + args[0]);
    }, "Create a remote directory and its parents");

    add_command("get", "<remote> <local>", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 2, "get <remote> <local>");
        cli.session().get_file(args[1], args[0]);
        std::cout << theme::ok(fmt::format("{} -> {}", args[0], args[1]));
    }, "Download one file");

    add_command("put", "<local> <remote>", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 2, "put <local> <remote>");
        cli.session().put_file(args[0], args[1]);
        std::cout << theme::ok(fmt::format("{} -> {}", args[0], args[1]));
    }, "Upload one file");

    add_command("putdir", "<local> <remote>", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 2, "putdir <local> <remote>");
        PutDirectoryOptions opts;
        opts.tick = [](const std::string& local, const std::string& remote,
                       const std::optional<RemoteError>& error) {
            if (error) {
                std::cout << theme::fail(fmt::format("{}: {}", local, error->message));
            } else {
                std::cout << theme::ok(fmt::format("{} -> {}", local, remote));
            }
        };
        if (!cli.session().put_directory(args[0], args[1], opts)) {
            throw SessionError(ErrorKind::ChannelFailure, "Some files failed to transfer");
        }
    }, "Mirror a local directory");

    add_command("shell", "[+]<cmd>...", [](ShuttleCLI& cli, const Args& args) {
        require_args(args, 1, "shell [+]<cmd>...");
        std::vector<ShellCommand> commands;
        bool sudo = false;
        for (const auto& arg : args) {
            if (arg == "--sudo") {
                sudo = true;
            } else if (!arg.empty() && arg[0] == '+') {
                commands.emplace_back(arg.substr(1), true);
            } else {
                commands.emplace_back(arg);
            }
        }
        std::string output = cli.session().run_commands_in_shell(commands, sudo);
        if (!output.empty()) std::cout << output << "\n";
    }, "Run commands in one shell; '+' captures, --sudo elevates");
}
