#pragma once

#include <string>
#include <vector>

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Copying variant of trim().
inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string base64_encode(const std::string& input);

// Quote one argument for a POSIX shell. Arguments made only of
// [A-Za-z0-9_/:=-] are returned bare.
std::string shell_escape(const std::string& arg);

// shell_escape() every argument and join them with single spaces.
std::string shell_escape(const std::vector<std::string>& args);

// Split on a literal separator, keeping each separator as its own element
// (empty pieces between separators are kept as well).
std::vector<std::string> split_keep(const std::string& str, const std::string& sep);

// POSIX-style dirname/join for remote paths (always '/').
std::string remote_dirname(const std::string& path);
std::string remote_join(const std::string& base, const std::string& rel);
