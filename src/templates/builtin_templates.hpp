#pragma once

#include <string>
#include <vector>

struct BuiltinTemplate {
    std::string name;        // file stem under the templates dir, e.g. "default"
    std::string yaml;        // full template document
};

// Templates installed into an empty templates directory on first use.
const std::vector<BuiltinTemplate>& builtin_templates();

// Returns nullptr if no built-in template has that name.
const BuiltinTemplate* get_builtin_template(const std::string& name);
