#include "base_cli.hpp"
#include "theme.hpp"
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() : penlab_root(get_penlab_root()) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help,
                         const std::string& usage) {
    commands_[name] = {handler, help, usage};
}

bool BaseCLI::require_config() {
    if (config.has_value()) {
        return true;
    }

    auto ensured = ensure_penlab_structure(penlab_root);
    if (ensured.is_err()) {
        std::cout << theme::fail(ensured.error);
        return false;
    }

    auto loaded = GlobalConfig::load(get_global_config_path(penlab_root));
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        std::cout << theme::step("Fix or delete " + get_global_config_path(penlab_root).string());
        return false;
    }
    config = loaded.value;
    return true;
}

bool BaseCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'penlab --help' for available commands.");
        return 1;
    }

    penlab_log("cli", command + (args.empty() ? "" : " " + join(args, " ")));
    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Projects",  {"init", "list-projects", "info"}},
        {"Templates", {"templates"}},
        {"Notes",     {"notes"}},
        {"Settings",  {"config"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::TEAL << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::RED_ACCENT
                          << fmt::format("    {:<16}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.help
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    penlab --version      Show version\n"
              << "    penlab --help         Show this help"
              << theme::color::RESET << "\n\n";
}

void BaseCLI::print_usage(const std::string& command) const {
    auto it = commands_.find(command);
    if (it == commands_.end() || it->second.usage.empty()) return;
    std::cout << theme::step("Usage: penlab " + it->second.usage);
}

bool BaseCLI::confirm(const std::string& message, bool default_no) {
    std::string suffix = default_no ? " [y/N]: " : " [Y/n]: ";
    std::cout << theme::color::YELLOW << "    " << message << suffix << theme::color::RESET;
    std::cout.flush();

    std::string answer;
    if (!std::getline(std::cin, answer)) return !default_no;
    trim(answer);
    if (answer.empty()) return !default_no;

    char c = answer[0];
    return c == 'y' || c == 'Y';
}
