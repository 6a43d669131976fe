#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Resolve one variable from an ordered list of sources (highest precedence
// first). The first source holding a non-empty value for `key` wins; an
// explicit empty string falls through to the next source. Returns
// `fallback` when no source has a value. Null entries in `sources` are
// skipped.
std::string resolve_variable(const std::string& key,
                             const std::vector<const VariableMap*>& sources,
                             const std::string& fallback = "");

// Inputs for building the full variable set of one `init` run.
struct VariableInputs {
    std::string project_name;
    std::string date;              // YYYY-MM-DD; today if empty
    VariableMap cli;               // --target, --your-ip, --var k=v
    VariableMap template_defaults; // template `variables:` block
    VariableMap global_config;     // ~/.penlab/config.yaml
};

// Build the variable set: project-name and date directly, target / your-ip /
// author through resolve_variable with their hardcoded fallbacks, then every
// template-declared key (fallback ""). Every value is a string.
VariableMap build_variable_set(const VariableInputs& inputs);

// Replace each {key} whose key is in `vars` with its value. Single
// left-to-right pass: unknown tokens stay literal and substituted values are
// not scanned again.
std::string substitute_variables(const std::string& text, const VariableMap& vars);
