#include "platform.hpp"
#include <core/constants.hpp>
#include <cstdlib>
#include <system_error>

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
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path(".");
    return p;
}

bool supports_exec_bit() {
#ifdef _WIN32
    return false;
#else
    return true;
#endif
}

bool make_executable(const fs::path& path, std::string& err) {
    if (!supports_exec_bit()) {
        return true;
    }
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(EXECUTABLE_MODE),
                    fs::perm_options::replace, ec);
    if (ec) {
        err = ec.message();
        return false;
    }
    return true;
}

bool is_executable(const fs::path& path) {
    if (!supports_exec_bit()) {
        return false;
    }
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec) return false;
    return (st.permissions() & fs::perms::owner_exec) != fs::perms::none;
}

} // namespace platform
