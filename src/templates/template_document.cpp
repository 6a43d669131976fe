#include "template_document.hpp"
#include <yaml-cpp/yaml.h>

static std::string scalar_or(const YAML::Node& node, const std::string& fallback = "") {
    if (node && node.IsScalar()) {
        return node.Scalar();
    }
    return fallback;
}

static FileNode parse_file_node(const YAML::Node& node) {
    FileNode f;
    f.name = scalar_or(node["name"]);
    f.content = scalar_or(node["content"]);
    if (node["executable"] && node["executable"].IsScalar()) {
        f.executable = node["executable"].as<bool>(false);
    }
    return f;
}

static std::vector<FileNode> parse_file_list(const YAML::Node& node) {
    std::vector<FileNode> files;
    if (!node || !node.IsSequence()) return files;
    for (const auto& f : node) {
        files.push_back(parse_file_node(f));
    }
    return files;
}

static DirNode parse_dir_node(const YAML::Node& node) {
    DirNode d;
    d.dir = scalar_or(node["dir"]);
    d.files = parse_file_list(node["files"]);
    if (node["subdirs"] && node["subdirs"].IsSequence()) {
        for (const auto& sub : node["subdirs"]) {
            d.subdirs.push_back(parse_dir_node(sub));
        }
    }
    return d;
}

TemplateDocument TemplateDocument::from_yaml(const YAML::Node& root) {
    TemplateDocument doc;
    if (!root || !root.IsMap()) {
        return doc;
    }

    doc.name = scalar_or(root["name"]);
    doc.version = scalar_or(root["version"]);
    doc.description = scalar_or(root["description"]);
    doc.author = scalar_or(root["author"]);

    const YAML::Node tags = root["tags"];
    if (tags && tags.IsSequence()) {
        for (const auto& t : tags) {
            doc.tags.push_back(scalar_or(t));
        }
    } else if (tags && tags.IsScalar()) {
        doc.tags.push_back(tags.Scalar());
    }

    const YAML::Node vars = root["variables"];
    if (vars && vars.IsMap()) {
        for (const auto& kv : vars) {
            doc.variables.emplace_back(kv.first.as<std::string>(""), scalar_or(kv.second));
        }
    }

    const YAML::Node structure = root["structure"];
    if (structure && structure.IsSequence()) {
        for (const auto& item : structure) {
            doc.structure.push_back(parse_dir_node(item));
        }
    }

    doc.global_files = parse_file_list(root["global_files"]);
    return doc;
}

VariableMap TemplateDocument::variable_defaults() const {
    VariableMap out;
    for (const auto& [key, value] : variables) {
        out[key] = value;
    }
    return out;
}

static size_t count_dirs_in(const std::vector<DirNode>& nodes) {
    size_t n = 0;
    for (const auto& d : nodes) {
        n += 1 + count_dirs_in(d.subdirs);
    }
    return n;
}

static size_t count_files_in(const std::vector<DirNode>& nodes) {
    size_t n = 0;
    for (const auto& d : nodes) {
        n += d.files.size() + count_files_in(d.subdirs);
    }
    return n;
}

size_t TemplateDocument::count_dirs() const {
    return count_dirs_in(structure);
}

size_t TemplateDocument::count_files() const {
    return count_files_in(structure) + global_files.size();
}
