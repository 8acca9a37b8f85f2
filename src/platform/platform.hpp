#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// True when the current user can read the path.
bool readable(const std::filesystem::path& path);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
