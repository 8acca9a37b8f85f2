#pragma once

#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class ShellEventType {
    Prompt,              // a line ended in "$ ": the shell is ready
    PasswordRequested,   // "[sudo] password for ..." line
    DataChunk,           // forwarded output
    Closed,              // channel finished; exit status attached
    Errored,             // channel read failed
};

struct ShellEvent {
    ShellEventType type;
    StreamKind stream = StreamKind::Stdout;
    std::string data;                   // DataChunk payload, or Errored message
    int exit_code = 0;                  // Closed only
    std::optional<std::string> signal;  // Closed only

    static ShellEvent prompt() { return {ShellEventType::Prompt}; }
    static ShellEvent password() { return {ShellEventType::PasswordRequested}; }
    static ShellEvent chunk(StreamKind stream, std::string data) {
        return {ShellEventType::DataChunk, stream, std::move(data)};
    }
};

// Splits pseudo-terminal output on "\r\n" and recovers the two structural
// markers remote shells interleave with ordinary output.
//
// Each sub-chunk (the separator itself is a sub-chunk) is classified in order:
//   "[sudo] password for..." with no line break   -> PasswordRequested,
//                                                   then the next "\r\n" is swallowed
//   ends with "$ "                                 -> Prompt
//   equals the pending swallow token               -> dropped once
//   anything else                                  -> forwarded as DataChunk
//
// A literal "\r\n" that arrives while a swallow is pending is dropped even
// when it was real output; the two cannot be told apart.
class PromptDetector {
public:
    std::vector<ShellEvent> feed(const std::string& chunk);

    bool swallow_pending() const { return ignore_chunk_.has_value(); }

    static bool is_password_prompt(const std::string& line);
    static bool is_shell_prompt(const std::string& line);

private:
    std::optional<std::string> ignore_chunk_;
};
