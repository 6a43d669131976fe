#include "args.hpp"

ParsedArgs parse_args(const std::vector<std::string>& args,
                      const std::set<std::string>& value_options) {
    ParsedArgs parsed;
    bool only_positional = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
            parsed.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }

        // --key=value / --key value / -k value / --flag
        bool is_long = arg.compare(0, 2, "--") == 0;
        std::string name = arg.substr(is_long ? 2 : 1);
        std::string value;
        bool inline_value = false;

        auto eq = name.find('=');
        if (is_long && eq != std::string::npos) {
            value = name.substr(eq + 1);
            name = name.substr(0, eq);
            inline_value = true;
        }

        if (value_options.count(name)) {
            if (!inline_value) {
                if (i + 1 >= args.size()) {
                    parsed.errors.push_back(arg + " needs a value");
                    continue;
                }
                value = args[++i];
            }
            parsed.options[name].push_back(value);
        } else if (inline_value) {
            parsed.errors.push_back("--" + name + " does not take a value");
        } else {
            parsed.flags.insert(name);
        }
    }

    return parsed;
}

bool ParsedArgs::has_flag(const std::string& long_name, const std::string& short_name) const {
    if (flags.count(long_name)) return true;
    return !short_name.empty() && flags.count(short_name);
}

bool ParsedArgs::has(const std::string& long_name, const std::string& short_name) const {
    if (options.count(long_name)) return true;
    return !short_name.empty() && options.count(short_name);
}

std::string ParsedArgs::get(const std::string& long_name, const std::string& short_name,
                            const std::string& fallback) const {
    auto it = options.find(long_name);
    if (it != options.end() && !it->second.empty()) {
        return it->second.back();
    }
    if (!short_name.empty()) {
        it = options.find(short_name);
        if (it != options.end() && !it->second.empty()) {
            return it->second.back();
        }
    }
    return fallback;
}

std::vector<std::string> ParsedArgs::all(const std::string& long_name, const std::string& short_name) const {
    std::vector<std::string> values;
    for (const auto& key : {long_name, short_name}) {
        if (key.empty()) continue;
        auto it = options.find(key);
        if (it != options.end()) {
            values.insert(values.end(), it->second.begin(), it->second.end());
        }
    }
    return values;
}
