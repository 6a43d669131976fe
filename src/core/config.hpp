#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Global penlab configuration: a flat key/value YAML mapping.
// Known keys: your-ip, author, default_template. Any other key is kept and
// can be used as a default for template-declared variables.
class GlobalConfig {
public:
    // your-ip, author ($USER), default_template
    static GlobalConfig defaults();

    // Missing file -> defaults. Parse errors are reported.
    static Result<GlobalConfig> load(const fs::path& path);

    Result<void> save(const fs::path& path) const;

    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    void set(const std::string& key, const std::string& value);

    // Entries in file order (new keys appended).
    const OrderedPairs& entries() const { return entries_; }

    // As a variable resolution source.
    VariableMap as_variables() const;

    std::string default_template() const;

private:
    OrderedPairs entries_;
};
