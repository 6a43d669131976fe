#include "template_validator.hpp"
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <regex>

ScalarKind classify_scalar(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return ScalarKind::Null;
    }

    const std::string& tag = node.Tag();
    if (tag == "!" || tag == "tag:yaml.org,2002:str") {
        return ScalarKind::String;
    }

    const std::string& v = node.Scalar();
    if (v.empty() || v == "~" || v == "null" || v == "Null" || v == "NULL") {
        return ScalarKind::Null;
    }
    if (v == "true" || v == "True" || v == "TRUE" ||
        v == "false" || v == "False" || v == "FALSE") {
        return ScalarKind::Bool;
    }

    static const std::regex int_re(R"([-+]?[0-9]+|0o[0-7]+|0x[0-9a-fA-F]+)");
    static const std::regex float_re(
        R"([-+]?(\.[0-9]+|[0-9]+(\.[0-9]*)?)([eE][-+]?[0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))");
    if (std::regex_match(v, int_re)) {
        return ScalarKind::Integer;
    }
    if (std::regex_match(v, float_re)) {
        return ScalarKind::Float;
    }
    return ScalarKind::String;
}

// name/version/dir: text or number
static bool is_text_or_number(const YAML::Node& node) {
    if (!node.IsScalar()) return false;
    auto kind = classify_scalar(node);
    return kind == ScalarKind::String || kind == ScalarKind::Integer || kind == ScalarKind::Float;
}

static bool is_text(const YAML::Node& node) {
    return node.IsScalar() && classify_scalar(node) == ScalarKind::String;
}

static bool is_boolean(const YAML::Node& node) {
    // Quoted "true" is a string; plain yes/no/on/off decode like yaml-cpp does
    if (!node.IsScalar() || node.Tag() == "!") {
        return false;
    }
    bool ignored;
    return YAML::convert<bool>::decode(node, ignored);
}

static void validate_file_node(const YAML::Node& f, const std::string& where,
                               TemplateValidation& result) {
    if (!f.IsMap()) {
        result.add_error(fmt::format("{} must be a mapping.", where));
        return;
    }

    if (!f["name"]) {
        result.add_error(fmt::format("{} is missing \"name\".", where));
    } else if (!is_text_or_number(f["name"])) {
        result.add_error(fmt::format("{}.name must be text.", where));
    }

    if (f["content"] && !is_text(f["content"])) {
        result.add_error(fmt::format("{}.content must be text.", where));
    }

    if (f["executable"] && !is_boolean(f["executable"])) {
        result.add_error(fmt::format("{}.executable must be a boolean (true/false).", where));
    }
}

static void validate_file_list(const YAML::Node& files, const std::string& where,
                               TemplateValidation& result) {
    if (!files.IsSequence()) {
        result.add_error(fmt::format("{} must be a list.", where));
        return;
    }
    for (size_t j = 0; j < files.size(); j++) {
        validate_file_node(files[j], fmt::format("{}[{}]", where, j), result);
    }
}

static void validate_dir_node(const YAML::Node& item, const std::string& where,
                              TemplateValidation& result) {
    if (!item.IsMap()) {
        result.add_error(fmt::format("{} must be a mapping.", where));
        return;
    }

    if (!item["dir"]) {
        result.add_error(fmt::format("{} is missing \"dir\".", where));
    } else if (!is_text_or_number(item["dir"])) {
        result.add_error(fmt::format("{}.dir must be text.", where));
    }

    if (item["subdirs"]) {
        const YAML::Node subdirs = item["subdirs"];
        if (!subdirs.IsSequence()) {
            result.add_error(fmt::format("{}.subdirs must be a list.", where));
        } else {
            for (size_t k = 0; k < subdirs.size(); k++) {
                validate_dir_node(subdirs[k], fmt::format("{}.subdirs[{}]", where, k), result);
            }
        }
    }

    if (item["files"]) {
        validate_file_list(item["files"], where + ".files", result);
    }
}

TemplateValidation validate_template(const YAML::Node& root) {
    TemplateValidation result;

    // An empty document loads as null and is treated as an empty mapping
    if (!root || root.IsNull()) {
        return result;
    }

    if (!root.IsMap()) {
        result.add_error("The template must be a mapping at the top level.");
        return result;
    }

    if (root["name"] && !is_text_or_number(root["name"])) {
        result.add_error("Field \"name\" must be text.");
    }

    if (root["version"] && !is_text_or_number(root["version"])) {
        result.add_error("Field \"version\" must be text or a number.");
    }

    if (root["description"] && !is_text(root["description"])) {
        result.add_error("Field \"description\" must be text.");
    }

    if (root["tags"]) {
        const YAML::Node tags = root["tags"];
        if (tags.IsSequence()) {
            for (size_t i = 0; i < tags.size(); i++) {
                if (!is_text_or_number(tags[i])) {
                    result.add_error(fmt::format("Tag at position {} is not valid text or a number.", i));
                }
            }
        } else if (!is_text_or_number(tags)) {
            result.add_error("Field \"tags\" must be a list of strings or a single string/number.");
        }
    }

    if (root["variables"] && !root["variables"].IsMap()) {
        result.add_error("Field \"variables\" must be a mapping (key: value).");
    }

    if (root["structure"]) {
        const YAML::Node structure = root["structure"];
        if (!structure.IsSequence()) {
            result.add_error("Field \"structure\" must be a list.");
        } else {
            for (size_t idx = 0; idx < structure.size(); idx++) {
                validate_dir_node(structure[idx], fmt::format("structure[{}]", idx), result);
            }
        }
    }

    if (root["global_files"]) {
        validate_file_list(root["global_files"], "global_files", result);
    }

    return result;
}
