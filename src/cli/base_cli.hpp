#pragma once

#include <string>
#include <vector>
#include <map>
#include <functional>
#include <optional>
#include <filesystem>
#include <core/config.hpp>

namespace fs = std::filesystem;

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help,
                    const std::string& usage = "");

    // Creates ~/.penlab (or $PENLAB_HOME) on first use and loads config.yaml.
    // Prints the failure and returns false if either step fails.
    bool require_config();

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;
    void print_usage(const std::string& command) const;

    // y/N prompt on stdin. EOF counts as the default.
    static bool confirm(const std::string& message, bool default_no = true);

    // Public state
    fs::path penlab_root;
    std::optional<GlobalConfig> config;

protected:
    struct CommandEntry {
        CommandHandler handler;
        std::string help;
        std::string usage;
    };
    std::map<std::string, CommandEntry> commands_;
};
