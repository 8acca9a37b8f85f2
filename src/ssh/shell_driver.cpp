#include "shell_driver.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static std::string join_trimmed(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) out += p;
    trim(out);
    return out;
}

ShellDriver::ShellDriver(ShellChannel& channel, std::deque<ShellCommand> commands,
                         std::optional<std::string> credential)
    : channel_(channel), commands_(std::move(commands)), credential_(std::move(credential)) {}

void ShellDriver::handle(const ShellEvent& event) {
    if (state_ == State::Closed) return;

    switch (event.type) {
    case ShellEventType::Prompt:
        state_ = State::Dispatching;
        dispatch_next();
        break;

    case ShellEventType::PasswordRequested:
        answer_password();
        break;

    case ShellEventType::DataChunk:
        if (!recording_) break;
        if (event.stream == StreamKind::Stdout) {
            stdout_.push_back(event.data);
        } else {
            stderr_.push_back(event.data);
        }
        break;

    case ShellEventType::Closed:
        state_ = State::Closed;
        break;

    case ShellEventType::Errored:
        channel_error_ = event.data;
        state_ = State::Closed;
        break;
    }
}

void ShellDriver::dispatch_next() {
    recording_ = false;

    if (commands_.empty()) {
        channel_.close();
        state_ = State::AwaitingPrompt;
        return;
    }

    ShellCommand next = std::move(commands_.front());
    commands_.pop_front();
    recording_ = next.output;

    shuttle_log("Command: " + next.cmd);
    if (!channel_.write(next.cmd + "\n")) {
        channel_error_ = "Failed to write command to shell: " + next.cmd;
        channel_.close();
    }
    state_ = State::AwaitingPrompt;
}

void ShellDriver::answer_password() {
    if (!credential_) return;
    if (password_responses_ > 0) {
        shuttle_log("Password requested again; not answering");
        return;
    }
    shuttle_log("Password requested; sending credential");
    password_responses_++;
    if (!channel_.write(*credential_ + "\n")) {
        channel_error_ = "Failed to send password";
        channel_.close();
    }
}

std::string ShellDriver::run() {
    while (state_ != State::Closed) {
        auto events = channel_.poll();
        if (events.empty()) {
            channel_.wait(SSH_POLL_INTERVAL_MS);
            continue;
        }
        for (const auto& ev : events) {
            handle(ev);
        }
    }

    if (channel_error_) {
        throw SessionError(ErrorKind::ChannelFailure, *channel_error_);
    }
    if (!stderr_.empty()) {
        throw SessionError(ErrorKind::CommandFailure, join_trimmed(stderr_));
    }
    return join_trimmed(stdout_);
}

std::string ShellDriver::captured_stdout() const {
    return join_trimmed(stdout_);
}

std::string ShellDriver::captured_stderr() const {
    return join_trimmed(stderr_);
}
