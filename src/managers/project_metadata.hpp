#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Contents of <project>/.penlab.yaml
class ProjectMetadata {
public:
    // Fields
    std::string name;
    std::string template_name;
    std::string target;
    std::string your_ip;
    std::string author;
    std::string created;        // YYYY-MM-DD HH:MM:SS, local time
    std::string path;           // absolute project path

    // Static factory methods
    static ProjectMetadata from_variables(const fs::path& project_path,
                                          const VariableMap& variables,
                                          const std::string& template_name);
    static Result<ProjectMetadata> load(const fs::path& project_path);

    // Writes (overwrites) .penlab.yaml at the project root.
    Result<void> save(const fs::path& project_path) const;

    static fs::path metadata_path(const fs::path& project_path);
};
