#include "project_metadata.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <system_error>

// ── Path helpers ────────────────────────────────────────────

fs::path ProjectMetadata::metadata_path(const fs::path& project_path) {
    return project_path / PROJECT_METADATA_FILE;
}

static std::string lookup(const VariableMap& vars, const char* key) {
    auto it = vars.find(key);
    return it == vars.end() ? std::string() : it->second;
}

// Explicit nulls and non-scalars read as `fallback`
static std::string scalar_or(const YAML::Node& node, const std::string& fallback = "") {
    if (node && node.IsScalar()) {
        return node.Scalar();
    }
    return fallback;
}

// ── Build ───────────────────────────────────────────────────

ProjectMetadata ProjectMetadata::from_variables(const fs::path& project_path,
                                                const VariableMap& variables,
                                                const std::string& template_name) {
    ProjectMetadata meta;
    meta.name = lookup(variables, VAR_PROJECT_NAME);
    meta.template_name = template_name;
    meta.target = lookup(variables, VAR_TARGET);
    meta.your_ip = lookup(variables, VAR_YOUR_IP);
    meta.author = lookup(variables, VAR_AUTHOR);
    meta.created = now_timestamp();

    std::error_code ec;
    fs::path abs = fs::absolute(project_path, ec);
    meta.path = (ec ? project_path : abs).lexically_normal().string();
    return meta;
}

// ── Load ────────────────────────────────────────────────────

Result<ProjectMetadata> ProjectMetadata::load(const fs::path& project_path) {
    auto path = metadata_path(project_path);

    if (!fs::exists(path)) {
        return Result<ProjectMetadata>::Err("Project metadata not found: " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<ProjectMetadata>::Err("Project metadata is not a mapping: " + path.string());
        }

        ProjectMetadata meta;
        meta.name = scalar_or(root["name"], project_path.filename().string());
        meta.template_name = scalar_or(root["template"]);
        meta.target = scalar_or(root["target"]);
        meta.your_ip = scalar_or(root["your-ip"]);
        meta.author = scalar_or(root["author"]);
        meta.created = scalar_or(root["created"]);
        meta.path = scalar_or(root["path"], project_path.string());

        return Result<ProjectMetadata>::Ok(meta);
    } catch (const std::exception& e) {
        return Result<ProjectMetadata>::Err("Failed to load project metadata: " + std::string(e.what()));
    }
}

// ── Save ────────────────────────────────────────────────────

Result<void> ProjectMetadata::save(const fs::path& project_path) const {
    auto file = metadata_path(project_path);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << name;
    out << YAML::Key << "template" << YAML::Value << template_name;
    out << YAML::Key << "target" << YAML::Value << target;
    out << YAML::Key << "your-ip" << YAML::Value << your_ip;
    out << YAML::Key << "author" << YAML::Value << author;
    out << YAML::Key << "created" << YAML::Value << created;
    out << YAML::Key << "path" << YAML::Value << path;
    out << YAML::EndMap;

    std::ofstream fout(file.string(), std::ios::trunc);
    if (!fout) {
        return Result<void>::Err("Cannot write " + file.string());
    }
    fout << out.c_str() << "\n";
    if (!fout) {
        return Result<void>::Err("Failed writing " + file.string());
    }
    return Result<void>::Ok();
}
