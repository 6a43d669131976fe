#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// True where files carry a Unix execute permission bit.
bool supports_exec_bit();

// Adds rwxr-xr-x to a regular file. No-op returning true where the
// platform has no execute bit. On failure returns false and fills err.
bool make_executable(const std::filesystem::path& path, std::string& err);

// True if the owner execute bit is set (always false without an execute bit).
bool is_executable(const std::filesystem::path& path);

} // namespace platform
