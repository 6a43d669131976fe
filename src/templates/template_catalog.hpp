#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include <core/types.hpp>
#include "template_document.hpp"

namespace fs = std::filesystem;

// <dir>/<name>.yaml, then <dir>/<name>.yml. Empty path if neither exists.
fs::path find_template_file(const fs::path& templates_dir, const std::string& name);

// Parse a template file. YAML syntax errors come back as Err.
Result<YAML::Node> read_template_file(const fs::path& path);

struct TemplateLoad {
    std::optional<TemplateDocument> document;  // set only when errors is empty
    std::vector<std::string> errors;

    bool ok() const { return document.has_value(); }
};

// Locate, parse and validate a template by name.
TemplateLoad load_template(const fs::path& templates_dir, const std::string& name);

// Template files in `templates_dir` (.yaml and .yml), sorted by file name.
std::vector<fs::path> list_template_files(const fs::path& templates_dir);

struct TemplateSummary {
    std::string name;         // `name` field, else the file stem
    std::string version;      // "?" if the file cannot be read
    std::string description;
    std::vector<std::string> tags;
    bool readable = true;
};

TemplateSummary summarize_template(const fs::path& path);

// Validate `source` and copy it to <templates_dir>/<sanitized name>.yaml.
// The name comes from the document's `name` field, or the file stem.
// Overwrites an existing template of the same name.
Result<fs::path> import_template(const fs::path& source, const fs::path& templates_dir);
