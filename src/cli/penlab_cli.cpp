#include "penlab_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

PenlabCLI::PenlabCLI() : BaseCLI() {
    register_all_commands();
}

void PenlabCLI::register_all_commands() {
    register_init_commands(*this);
    register_project_commands(*this);
    register_template_commands(*this);
    register_config_commands(*this);
    register_notes_commands(*this);
}

void PenlabCLI::print_usage_banner() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::RED_ACCENT << "    penlab "
              << theme::color::RESET << theme::color::TEAL << "<command>"
              << theme::color::RESET << theme::color::DIM << " [options]"
              << theme::color::RESET << "\n";
    print_help();
}

int PenlabCLI::run(int argc, char** argv) {
    if (argc < 2) {
        print_usage_banner();
        return 0;
    }

    std::string cmd = argv[1];
    if (cmd == "--version" || cmd == "-V") {
        std::cout << theme::color::RED_ACCENT << theme::color::BOLD << "penlab"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << PENLAB_VERSION << theme::color::RESET << "\n";
        return 0;
    }
    if (cmd == "--help" || cmd == "-h" || cmd == "help") {
        print_usage_banner();
        return 0;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    if (!has_command(cmd)) {
        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage_banner();
        return 1;
    }
    return execute_command(cmd, args);
}
