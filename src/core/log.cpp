#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>

std::string shuttle_log_path() {
    const char* env = std::getenv("SHUTTLE_LOG");
    if (env && *env) return env;
    static std::string path = (platform::temp_dir() / "shuttle_debug.log").string();
    return path;
}

void shuttle_log(const std::string& msg) {
    std::ofstream out(shuttle_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    out << fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void shuttle_log_exec(const std::string& label, const std::string& cmd, const ExecResult& r) {
    shuttle_log(fmt::format("{} CMD: {}", label, cmd));
    shuttle_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                            r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        shuttle_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
    if (r.signal)
        shuttle_log(fmt::format("{} signal={}", label, *r.signal));
}
