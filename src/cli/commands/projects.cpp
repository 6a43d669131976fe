#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <managers/project_finder.hpp>
#include <managers/project_metadata.hpp>
#include <iostream>
#include <fmt/format.h>

static int do_list_projects(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {});
    fs::path dir = args.positional.empty() ? fs::current_path() : fs::path(args.positional[0]);

    auto projects = scan_projects(dir);
    if (projects.empty()) {
        std::cout << theme::info("No penlab projects in " + dir.string());
        return 0;
    }

    std::cout << theme::section("Projects");
    std::cout << theme::color::DIM
              << fmt::format("    {:<20} {:<12} {:<16} {:<20} {}", "NAME", "TEMPLATE", "TARGET", "CREATED", "PATH")
              << theme::color::RESET << "\n";
    for (const auto& p : projects) {
        std::cout << fmt::format("    {:<20} {:<12} {:<16} {:<20} ",
                                 p.name, p.template_name, p.target, p.created)
                  << theme::dim(p.path) << "\n";
        if (!p.metadata_ok) {
            std::cout << theme::warn(fmt::format("{}/{} could not be read", p.name, PROJECT_METADATA_FILE));
        }
    }
    std::cout << "\n";
    return 0;
}

static int do_info(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {});

    fs::path project_path;
    if (!args.positional.empty()) {
        project_path = fs::path(args.positional[0]);
    } else {
        auto root = find_project_root(fs::current_path());
        if (!root) {
            std::cout << theme::fail("Not inside a penlab project.");
            cli.print_usage("info");
            return 1;
        }
        project_path = *root;
    }

    auto meta = ProjectMetadata::load(project_path);
    if (meta.is_err()) {
        std::cout << theme::fail(meta.error);
        return 1;
    }
    const auto& m = meta.value;

    std::cout << theme::section(m.name);
    std::cout << theme::kv("Template", m.template_name);
    std::cout << theme::kv("Target", m.target);
    std::cout << theme::kv("Your IP", m.your_ip);
    std::cout << theme::kv("Author", m.author);
    std::cout << theme::kv("Created", m.created);
    std::cout << theme::kv("Path", m.path);
    std::cout << "\n";
    return 0;
}

void register_project_commands(BaseCLI& cli) {
    cli.add_command("list-projects", do_list_projects, "List projects in a directory",
                    "list-projects [dir]");
    cli.add_command("info", do_info, "Show a project's metadata",
                    "info [project]");
}
