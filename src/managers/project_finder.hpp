#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

struct ProjectEntry {
    std::string name;
    std::string template_name = "N/A";
    std::string target = "-";
    std::string created = "-";
    std::string path;
    bool metadata_ok = true;     // false when .penlab.yaml exists but is unreadable
};

// Immediate subdirectories of `dir` that hold a .penlab.yaml, sorted by
// directory name. A corrupt metadata file still lists the project, with
// the fields it could not read left at their placeholders.
std::vector<ProjectEntry> scan_projects(const fs::path& dir);

// Nearest directory at or above `start` holding a .penlab.yaml.
std::optional<fs::path> find_project_root(const fs::path& start);
