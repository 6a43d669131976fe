#include "directory_structure.hpp"
#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <templates/builtin_templates.hpp>
#include <cstdlib>
#include <fstream>
#include <system_error>

fs::path get_penlab_root() {
    const char* override_dir = std::getenv(PENLAB_HOME_ENV);
    if (override_dir && *override_dir) {
        return fs::path(override_dir);
    }
    return platform::home_dir() / ".penlab";
}

fs::path get_templates_dir(const fs::path& root) {
    return root / TEMPLATES_DIR_NAME;
}

fs::path get_global_config_path(const fs::path& root) {
    return root / CONFIG_FILE_NAME;
}

Result<void> ensure_penlab_structure(const fs::path& root) {
    std::error_code ec;
    fs::create_directories(get_templates_dir(root), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + get_templates_dir(root).string() + ": " + ec.message());
    }

    fs::path config_path = get_global_config_path(root);
    if (!fs::exists(config_path)) {
        auto saved = GlobalConfig::defaults().save(config_path);
        if (saved.is_err()) {
            return saved;
        }
    }

    // Built-in templates are only written when the user has none by that name
    for (const auto& builtin : builtin_templates()) {
        fs::path dest = get_templates_dir(root) / (builtin.name + TEMPLATE_EXTENSION);
        if (fs::exists(dest)) continue;

        std::ofstream out(dest);
        if (!out) {
            return Result<void>::Err("Failed to write template " + dest.string());
        }
        out << builtin.yaml;
    }

    return Result<void>::Ok();
}
