#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <system_error>

GlobalConfig GlobalConfig::defaults() {
    GlobalConfig config;
    config.entries_ = {
        {VAR_YOUR_IP, DEFAULT_CONFIG_YOUR_IP},
        {VAR_AUTHOR, get_local_username()},
        {"default_template", DEFAULT_TEMPLATE},
    };
    return config;
}

Result<GlobalConfig> GlobalConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<GlobalConfig>::Ok(defaults());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        // Empty file behaves like a fresh install
        if (root.IsNull()) {
            return Result<GlobalConfig>::Ok(defaults());
        }
        if (!root.IsMap()) {
            return Result<GlobalConfig>::Err("Config at " + path.string() + " is not a key/value mapping");
        }

        GlobalConfig config;
        for (const auto& kv : root) {
            std::string key = kv.first.as<std::string>("");
            if (key.empty()) continue;

            std::string value;
            if (kv.second.IsScalar()) {
                value = kv.second.Scalar();
            } else if (!kv.second.IsNull()) {
                YAML::Emitter flow;
                flow << YAML::Flow << kv.second;
                value = flow.c_str();
            }
            config.entries_.emplace_back(key, value);
        }
        return Result<GlobalConfig>::Ok(config);
    } catch (const std::exception& e) {
        return Result<GlobalConfig>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<void> GlobalConfig::save(const fs::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Failed to create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, value] : entries_) {
        out << YAML::Key << key << YAML::Value << value;
    }
    out << YAML::EndMap;

    std::ofstream fout(path);
    if (!fout) {
        return Result<void>::Err("Failed to write config file at " + path.string());
    }
    fout << out.c_str() << "\n";
    if (!fout) {
        return Result<void>::Err("Failed to write config file at " + path.string());
    }
    return Result<void>::Ok();
}

std::optional<std::string> GlobalConfig::get(const std::string& key) const {
    for (const auto& [k, v] : entries_) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::string GlobalConfig::get_or(const std::string& key, const std::string& fallback) const {
    auto v = get(key);
    return (v && !v->empty()) ? *v : fallback;
}

void GlobalConfig::set(const std::string& key, const std::string& value) {
    for (auto& [k, v] : entries_) {
        if (k == key) {
            v = value;
            return;
        }
    }
    entries_.emplace_back(key, value);
}

VariableMap GlobalConfig::as_variables() const {
    VariableMap vars;
    for (const auto& [k, v] : entries_) {
        vars[k] = v;
    }
    return vars;
}

std::string GlobalConfig::default_template() const {
    return get_or("default_template", DEFAULT_TEMPLATE);
}
