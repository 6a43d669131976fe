#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/directory_structure.hpp>
#include <core/utils.hpp>
#include <templates/template_catalog.hpp>
#include <iostream>
#include <fmt/format.h>

static int templates_list(BaseCLI& cli) {
    auto files = list_template_files(get_templates_dir(cli.penlab_root));
    if (files.empty()) {
        std::cout << theme::info("No templates installed.");
        std::cout << theme::step("Add one with 'penlab templates import <file>'");
        return 0;
    }

    std::cout << theme::section("Templates");
    std::cout << theme::color::DIM
              << fmt::format("    {:<16} {:<8} {:<44} {}", "NAME", "VERSION", "DESCRIPTION", "TAGS")
              << theme::color::RESET << "\n";
    for (const auto& file : files) {
        auto s = summarize_template(file);
        std::string description = s.readable ? s.description : "could not be loaded";
        if (description.empty()) description = "-";
        std::cout << fmt::format("    {:<16} {:<8} {:<44} ", s.name, s.version, description)
                  << theme::yellow(join(s.tags, ", ")) << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int templates_show(BaseCLI& cli, const std::string& name) {
    auto load = load_template(get_templates_dir(cli.penlab_root), name);
    if (!load.ok()) {
        for (const auto& err : load.errors) {
            std::cout << theme::fail(err);
        }
        return 1;
    }
    const auto& doc = *load.document;

    std::cout << theme::section(doc.name);
    std::cout << theme::kv("Version", doc.version.empty() ? "1.0" : doc.version);
    std::cout << theme::kv("Author", doc.author.empty() ? "unknown" : doc.author);
    std::cout << theme::kv("Tags", join(doc.tags, ", "));
    std::cout << theme::kv("Layout", fmt::format("{} directories, {} files",
                                                 doc.count_dirs(), doc.count_files()));
    if (!doc.description.empty()) {
        std::cout << "\n    " << doc.description << "\n";
    }

    if (!doc.variables.empty()) {
        std::cout << theme::section("Variables");
        for (const auto& [key, desc] : doc.variables) {
            std::cout << "    " << theme::yellow("{" + key + "}")
                      << (desc.empty() ? "" : theme::dim("  " + desc)) << "\n";
        }
    }
    std::cout << "\n";
    return 0;
}

static int templates_import(BaseCLI& cli, const std::string& file) {
    auto imported = import_template(file, get_templates_dir(cli.penlab_root));
    if (imported.is_err()) {
        std::cout << theme::fail(imported.error);
        return 1;
    }
    std::cout << theme::ok("Template '" + imported.value.stem().string() + "' imported");
    std::cout << theme::dim("    " + imported.value.string()) << "\n";
    return 0;
}

static int do_templates(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {});
    if (!cli.require_config()) return 1;

    const std::string sub = args.positional.empty() ? "list" : args.positional[0];
    if (sub == "list") {
        return templates_list(cli);
    }
    if ((sub == "show" || sub == "import") && args.positional.size() == 2) {
        return sub == "show" ? templates_show(cli, args.positional[1])
                             : templates_import(cli, args.positional[1]);
    }

    std::cout << theme::fail("Unknown or incomplete templates command: " + sub);
    cli.print_usage("templates");
    return 1;
}

void register_template_commands(BaseCLI& cli) {
    cli.add_command("templates", do_templates, "List, show or import templates",
                    "templates list | show <name> | import <file>");
}
