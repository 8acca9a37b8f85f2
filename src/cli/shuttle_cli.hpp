#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/session.hpp>

class ShuttleCLI {
public:
    using Args = std::vector<std::string>;
    using CommandHandler = std::function<void(ShuttleCLI&, const Args&)>;

    // `config_path` empty means ~/.shuttle/config.yaml.
    explicit ShuttleCLI(const std::string& config_path = "");
    ~ShuttleCLI();

    void add_command(const std::string& name, const std::string& args,
                     CommandHandler handler, const std::string& help);

    // Run one command; false when it failed (the error is already printed).
    bool execute_command(const std::string& command, const Args& args);
    void print_help() const;

    // Connected session built from the loaded config (connects on first use).
    Session& session();

private:
    struct Entry {
        std::string args;
        CommandHandler handler;
        std::string help;
    };

    std::string config_path_;
    std::optional<Config> config_;
    std::unique_ptr<Session> session_;
    std::map<std::string, Entry> commands_;

    void register_commands();
};
