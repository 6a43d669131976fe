#pragma once

#include <string>
#include <vector>

namespace YAML { class Node; }

struct TemplateValidation {
    bool valid = true;
    std::vector<std::string> errors;

    void add_error(const std::string& error) {
        valid = false;
        errors.push_back(error);
    }
};

// What a YAML scalar would load as. Quoted scalars are always String;
// plain scalars follow the YAML core schema.
enum class ScalarKind { Null, Bool, Integer, Float, String };

ScalarKind classify_scalar(const YAML::Node& node);

// Structural check of a parsed template. Every violation is collected,
// including those nested in structure/subdirs/files, so callers can show
// them all at once. An empty (null) document is valid.
TemplateValidation validate_template(const YAML::Node& root);
