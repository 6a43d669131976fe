#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace YAML { class Node; }

struct FileNode {
    std::string name;             // raw, before substitution/sanitization
    std::string content;          // free text, substituted but never sanitized
    bool executable = false;
};

struct DirNode {
    std::string dir;              // raw, before substitution/sanitization
    std::vector<FileNode> files;
    std::vector<DirNode> subdirs;
};

struct TemplateDocument {
    std::string name;
    std::string version;
    std::string description;
    std::string author;
    std::vector<std::string> tags;
    OrderedPairs variables;       // key -> description / default, declaration order
    std::vector<DirNode> structure;
    std::vector<FileNode> global_files;

    // Build from a YAML node that already passed validate_template().
    // Shape is trusted; only values are read.
    static TemplateDocument from_yaml(const YAML::Node& root);

    // Template-declared variables as a resolution source.
    VariableMap variable_defaults() const;

    // Number of directories and files the template declares.
    size_t count_dirs() const;
    size_t count_files() const;
};
