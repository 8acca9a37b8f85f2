#include "utils.hpp"

static const char B64_CHARS[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& input) {
    std::string out;
    out.reserve(((input.size() + 2) / 3) * 4);
    const auto* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t len = input.size();
    for (size_t i = 0; i < len; i += 3) {
        unsigned val = data[i] << 16;
        if (i + 1 < len) val |= data[i + 1] << 8;
        if (i + 2 < len) val |= data[i + 2];
        out += B64_CHARS[(val >> 18) & 0x3F];
        out += B64_CHARS[(val >> 12) & 0x3F];
        out += (i + 1 < len) ? B64_CHARS[(val >> 6) & 0x3F] : '=';
        out += (i + 2 < len) ? B64_CHARS[val & 0x3F] : '=';
    }
    return out;
}

static bool is_shell_safe(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '/' || c == ':' || c == '=' || c == '-';
}

std::string shell_escape(const std::string& arg) {
    if (arg.empty()) return "''";

    bool safe = true;
    for (char c : arg) {
        if (!is_shell_safe(c)) { safe = false; break; }
    }
    if (safe) return arg;

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";

    // Drop the empty '' pairs produced by leading/trailing quotes
    while (out.size() > 2 && out.compare(0, 2, "''") == 0) {
        out.erase(0, 2);
    }
    while (out.size() > 2 && out.compare(out.size() - 2, 2, "''") == 0 &&
           out.compare(out.size() - 3, 1, "\\") != 0) {
        out.erase(out.size() - 2);
    }
    return out;
}

std::string shell_escape(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += shell_escape(a);
    }
    return out;
}

std::vector<std::string> split_keep(const std::string& str, const std::string& sep) {
    std::vector<std::string> parts;
    if (sep.empty()) {
        parts.push_back(str);
        return parts;
    }
    size_t start = 0;
    while (true) {
        auto pos = str.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        parts.push_back(sep);
        start = pos + sep.size();
    }
    return parts;
}

std::string remote_dirname(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();

    auto slash = p.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";

    p.erase(slash);
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

std::string remote_join(const std::string& base, const std::string& rel) {
    std::string out = base;
    while (out.size() > 1 && out.back() == '/') out.pop_back();

    std::string tail = rel;
    while (!tail.empty() && tail.front() == '/') tail.erase(0, 1);
    if (tail.empty() || tail == ".") return out;

    if (out.empty() || out == ".") return tail;
    if (out.back() != '/') out += '/';
    return out + tail;
}
