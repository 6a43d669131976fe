#include "variables.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>

std::string resolve_variable(const std::string& key,
                             const std::vector<const VariableMap*>& sources,
                             const std::string& fallback) {
    for (const auto* source : sources) {
        if (!source) continue;
        auto it = source->find(key);
        if (it != source->end() && !it->second.empty()) {
            return it->second;
        }
    }
    return fallback;
}

VariableMap build_variable_set(const VariableInputs& in) {
    const std::vector<const VariableMap*> sources = {
        &in.cli, &in.template_defaults, &in.global_config
    };

    VariableMap vars;
    vars[VAR_PROJECT_NAME] = in.project_name;
    vars[VAR_DATE] = in.date.empty() ? today_date() : in.date;
    vars[VAR_TARGET] = resolve_variable(VAR_TARGET, sources, FALLBACK_TARGET);
    vars[VAR_YOUR_IP] = resolve_variable(VAR_YOUR_IP, sources, FALLBACK_YOUR_IP);
    vars[VAR_AUTHOR] = resolve_variable(VAR_AUTHOR, sources, FALLBACK_AUTHOR);

    for (const auto& [key, _] : in.template_defaults) {
        if (vars.count(key)) continue;
        vars[key] = resolve_variable(key, sources);
    }

    return vars;
}

std::string substitute_variables(const std::string& text, const VariableMap& vars) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find('{', pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);

        size_t close = text.find('}', open + 1);
        if (close == std::string::npos) {
            out.append(text, open, std::string::npos);
            break;
        }

        // "{{x}" : the token starts at the innermost brace
        size_t inner = text.rfind('{', close);
        if (inner != open) {
            out.append(text, open, inner - open);
            open = inner;
        }

        auto it = vars.find(text.substr(open + 1, close - open - 1));
        if (it != vars.end()) {
            out += it->second;
        } else {
            out.append(text, open, close - open + 1);
        }
        pos = close + 1;
    }

    return out;
}
