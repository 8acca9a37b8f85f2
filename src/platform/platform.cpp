#include "platform.hpp"
#include <cstdlib>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <io.h>
#else
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

bool readable(const fs::path& path) {
#ifdef _WIN32
    return _waccess(path.c_str(), 4) == 0;
#else
    return access(path.c_str(), R_OK) == 0;
#endif
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

} // namespace platform
