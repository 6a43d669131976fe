#pragma once

#include <filesystem>
#include <string>
#include "types.hpp"

namespace fs = std::filesystem;

// Base penlab directory: $PENLAB_HOME, or ~/.penlab
fs::path get_penlab_root();

// <root>/templates
fs::path get_templates_dir(const fs::path& root = get_penlab_root());

// <root>/config.yaml
fs::path get_global_config_path(const fs::path& root = get_penlab_root());

// Ensures <root>, <root>/templates, a default config.yaml and the built-in
// templates exist. Never overwrites existing files.
Result<void> ensure_penlab_structure(const fs::path& root = get_penlab_root());
