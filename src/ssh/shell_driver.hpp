#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>
#include "shell_channel.hpp"

// One entry of a shell script. Bare strings are run without capture.
struct ShellCommand {
    std::string cmd;
    bool output = false;   // record what this command prints

    ShellCommand(const char* c) : cmd(c) {}
    ShellCommand(std::string c, bool capture = false) : cmd(std::move(c)), output(capture) {}
};

// Drives a FIFO of commands over one shell channel, using Prompt events as the
// synchronization points: a command is written only after the previous
// command's prompt has been seen, and an empty queue closes the channel.
//
// Output is recorded only while a capturing command is active (from its
// dispatch to the next prompt). With a credential configured, the first
// password request is answered immediately, independent of the queue.
class ShellDriver {
public:
    enum class State {
        AwaitingPrompt,
        Dispatching,
        Closed,
    };

    ShellDriver(ShellChannel& channel, std::deque<ShellCommand> commands,
                std::optional<std::string> credential = std::nullopt);

    // Feed one event through the state machine.
    void handle(const ShellEvent& event);

    // Poll the channel until it closes. Returns the trimmed captured stdout;
    // throws SessionError(CommandFailure) with the trimmed captured stderr if
    // any was recorded, or SessionError(ChannelFailure) when the channel errors.
    std::string run();

    State state() const { return state_; }
    bool recording() const { return recording_; }
    size_t remaining() const { return commands_.size(); }
    int password_responses() const { return password_responses_; }

    std::string captured_stdout() const;
    std::string captured_stderr() const;

private:
    ShellChannel& channel_;
    std::deque<ShellCommand> commands_;
    std::optional<std::string> credential_;
    State state_ = State::AwaitingPrompt;
    bool recording_ = false;
    int password_responses_ = 0;
    std::vector<std::string> stdout_;
    std::vector<std::string> stderr_;
    std::optional<std::string> channel_error_;

    void dispatch_next();
    void answer_password();
};
