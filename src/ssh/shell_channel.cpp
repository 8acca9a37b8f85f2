#include "shell_channel.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>

ShellChannel::ShellChannel(std::unique_ptr<RemoteStream> stream, OutputHook hook)
    : stream_(std::move(stream)), hook_(std::move(hook)) {}

ShellChannel::~ShellChannel() {
    close_stream();
}

void ShellChannel::close_stream() {
    if (!stream_ || closed_) return;
    stream_->close();
    closed_ = true;
}

static bool is_marker(const ShellEvent& ev) {
    return ev.type == ShellEventType::Prompt || ev.type == ShellEventType::PasswordRequested;
}

bool ShellChannel::drain(StreamKind kind, std::vector<ShellEvent>& events) {
    bool& eof = (kind == StreamKind::Stdout) ? stdout_eof_ : stderr_eof_;

    while (!eof) {
        std::string buf;
        auto status = stream_->read(kind, buf);

        if (status == ReadStatus::Again) break;
        if (status == ReadStatus::Eof) {
            eof = true;
            break;
        }
        if (status == ReadStatus::Error) {
            return false;
        }

        if (kind == StreamKind::Stderr) {
            if (hook_) hook_(StreamKind::Stderr, buf);
            events.push_back(ShellEvent::chunk(StreamKind::Stderr, std::move(buf)));
            continue;
        }

        bool marker = false;
        for (auto& ev : detector_.feed(buf)) {
            if (is_marker(ev)) marker = true;
            if (ev.type == ShellEventType::DataChunk && hook_) {
                hook_(StreamKind::Stdout, ev.data);
            }
            if (ev.type == ShellEventType::PasswordRequested && password_response_) {
                shuttle_log("Password requested; sending credential");
                if (!stream_->write(*password_response_ + "\n")) {
                    shuttle_log("Failed to send password: " + stream_->last_error());
                }
                password_response_.reset();
            }
            events.push_back(std::move(ev));
        }
        // Stdout past a prompt belongs to the next round
        if (marker) break;
    }
    return true;
}

std::vector<ShellEvent> ShellChannel::poll() {
    std::vector<ShellEvent> events;
    if (finished_ || !stream_) return events;

    // Stderr read now was written before the prompt that ends this round,
    // so it goes ahead of that prompt.
    std::vector<ShellEvent> errors;
    bool ok = drain(StreamKind::Stdout, events) && drain(StreamKind::Stderr, errors);
    auto marker = std::find_if(events.begin(), events.end(), is_marker);
    events.insert(marker, std::make_move_iterator(errors.begin()),
                  std::make_move_iterator(errors.end()));

    if (!ok) {
        std::string msg = stream_->last_error();
        shuttle_log(fmt::format("Channel read error: {}", msg));
        finished_ = true;
        close_stream();
        ShellEvent ev{ShellEventType::Errored};
        ev.data = msg.empty() ? "Channel read error" : msg;
        events.push_back(std::move(ev));
        return events;
    }

    if ((stdout_eof_ && stderr_eof_) || close_requested_) {
        close_stream();
        finished_ = true;
        ShellEvent ev{ShellEventType::Closed};
        ev.exit_code = stream_->exit_status();
        ev.signal = stream_->exit_signal();
        events.push_back(std::move(ev));
    }

    return events;
}

void ShellChannel::wait(int timeout_ms) {
    if (stream_ && !finished_) stream_->wait(timeout_ms);
}

bool ShellChannel::write(const std::string& data) {
    if (!stream_ || closed_) return false;
    return stream_->write(data);
}

void ShellChannel::end() {
    if (stream_ && !closed_) stream_->send_eof();
}

void ShellChannel::close() {
    close_requested_ = true;
}

void ShellChannel::answer_password_once(std::string credential) {
    password_response_ = std::move(credential);
}
