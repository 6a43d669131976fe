#include "project_finder.hpp"
#include "project_metadata.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <system_error>

static std::string or_placeholder(const std::string& value, const std::string& placeholder) {
    return value.empty() ? placeholder : value;
}

std::vector<ProjectEntry> scan_projects(const fs::path& dir) {
    std::vector<ProjectEntry> projects;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        penlab_log("projects", "cannot scan " + dir.string() + ": " + ec.message());
        return projects;
    }

    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec)) continue;
        if (!fs::exists(entry.path() / PROJECT_METADATA_FILE, entry_ec)) continue;

        ProjectEntry project;
        project.name = entry.path().filename().string();
        project.path = fs::absolute(entry.path(), entry_ec).string();

        auto meta = ProjectMetadata::load(entry.path());
        if (meta.is_ok()) {
            project.name = or_placeholder(meta.value.name, project.name);
            project.template_name = or_placeholder(meta.value.template_name, "N/A");
            project.target = or_placeholder(meta.value.target, "-");
            project.created = or_placeholder(meta.value.created, "-");
        } else {
            project.metadata_ok = false;
            penlab_log("projects", meta.error);
        }
        projects.push_back(project);
    }
    if (ec) {
        penlab_log("projects", "scan of " + dir.string() + " stopped early: " + ec.message());
    }

    std::sort(projects.begin(), projects.end(), [](const ProjectEntry& a, const ProjectEntry& b) {
        return fs::path(a.path).filename().string() < fs::path(b.path).filename().string();
    });
    return projects;
}

std::optional<fs::path> find_project_root(const fs::path& start) {
    std::error_code ec;
    fs::path current = fs::absolute(start, ec);
    if (ec) return std::nullopt;
    current = current.lexically_normal();

    while (true) {
        if (fs::exists(current / PROJECT_METADATA_FILE, ec)) {
            return current;
        }
        if (!current.has_parent_path() || current.parent_path() == current) {
            break;
        }
        current = current.parent_path();
    }
    return std::nullopt;
}
