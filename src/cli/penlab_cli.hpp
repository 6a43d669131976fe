#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_init_commands(BaseCLI& cli);
void register_project_commands(BaseCLI& cli);
void register_template_commands(BaseCLI& cli);
void register_config_commands(BaseCLI& cli);
void register_notes_commands(BaseCLI& cli);

class PenlabCLI : public BaseCLI {
public:
    PenlabCLI();

    // argv[1] is the command; returns the process exit code.
    int run(int argc, char** argv);

    void print_usage_banner() const;

private:
    void register_all_commands();
};
