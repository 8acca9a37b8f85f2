#include "prompt_detector.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <cstring>

bool PromptDetector::is_password_prompt(const std::string& line) {
    static const size_t prefix_len = std::strlen(SUDO_PASSWORD_PREFIX);
    if (line.compare(0, prefix_len, SUDO_PASSWORD_PREFIX) != 0) return false;
    // The rest of the line may be anything except another line break
    return line.find_first_of("\r\n", prefix_len) == std::string::npos;
}

bool PromptDetector::is_shell_prompt(const std::string& line) {
    static const size_t suffix_len = std::strlen(SHELL_PROMPT_SUFFIX);
    return line.size() >= suffix_len &&
           line.compare(line.size() - suffix_len, suffix_len, SHELL_PROMPT_SUFFIX) == 0;
}

std::vector<ShellEvent> PromptDetector::feed(const std::string& chunk) {
    std::vector<ShellEvent> events;
    std::string pending;

    auto flush = [&]() {
        if (!pending.empty()) {
            events.push_back(ShellEvent::chunk(StreamKind::Stdout, std::move(pending)));
            pending.clear();
        }
    };

    for (const auto& piece : split_keep(chunk, LINE_SEPARATOR)) {
        if (is_password_prompt(piece)) {
            flush();
            events.push_back(ShellEvent::password());
            ignore_chunk_ = LINE_SEPARATOR;
        } else if (is_shell_prompt(piece)) {
            flush();
            events.push_back(ShellEvent::prompt());
        } else if (ignore_chunk_ && *ignore_chunk_ == piece) {
            ignore_chunk_.reset();
        } else {
            pending += piece;
        }
    }
    flush();

    return events;
}
