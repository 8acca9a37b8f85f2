#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "prompt_detector.hpp"
#include "remote.hpp"

// A remote channel whose stdout runs through a PromptDetector. Owns the
// stream; the channel is closed on destruction.
//
// poll() never blocks. It reads stdout up to and including the first prompt
// or password request, then drains stderr and places those chunks ahead of
// that marker, so everything a command printed precedes the prompt ending
// it. Remaining stdout is left for the next poll(). Once both streams reach EOF
// (or the channel was closed locally) a single Closed event carries the exit
// status, after which poll() returns nothing.
class ShellChannel {
public:
    explicit ShellChannel(std::unique_ptr<RemoteStream> stream, OutputHook hook = nullptr);
    ~ShellChannel();

    std::vector<ShellEvent> poll();
    void wait(int timeout_ms);

    bool write(const std::string& data);
    void end();      // send EOF on stdin
    void close();    // request close; Closed follows on the next poll()

    // Write `credential` + "\n" on the first password prompt seen from now
    // on. The PasswordRequested event is still reported.
    void answer_password_once(std::string credential);

    bool finished() const { return finished_; }

    // Non-copyable, movable
    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;
    ShellChannel(ShellChannel&&) = default;
    ShellChannel& operator=(ShellChannel&&) = default;

private:
    std::unique_ptr<RemoteStream> stream_;
    PromptDetector detector_;
    OutputHook hook_;
    std::optional<std::string> password_response_;
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;
    bool close_requested_ = false;
    bool closed_ = false;
    bool finished_ = false;

    // Read one stream dry (stdout stops after a marker event); false when
    // the stream errored.
    bool drain(StreamKind kind, std::vector<ShellEvent>& events);
    void close_stream();
};
