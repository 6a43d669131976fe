#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/directory_structure.hpp>
#include <iostream>
#include <fmt/format.h>

static int config_show(BaseCLI& cli) {
    const auto& config = cli.config.value();

    std::cout << theme::section("Configuration");
    for (const auto& [key, value] : config.entries()) {
        std::cout << theme::kv(key, value.empty() ? theme::dim("(empty)") : value);
    }
    std::cout << "\n" << theme::dim("    " + get_global_config_path(cli.penlab_root).string()) << "\n\n";
    return 0;
}

static int config_set(BaseCLI& cli, const std::string& key, const std::string& value) {
    auto& config = cli.config.value();
    config.set(key, value);

    auto saved = config.save(get_global_config_path(cli.penlab_root));
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} = \"{}\"", key, value));
    return 0;
}

static int do_config(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {});
    if (!cli.require_config()) return 1;

    const std::string sub = args.positional.empty() ? "show" : args.positional[0];
    if (sub == "show" && args.positional.size() <= 1) {
        return config_show(cli);
    }
    if (sub == "set" && args.positional.size() == 3 && !args.positional[1].empty()) {
        return config_set(cli, args.positional[1], args.positional[2]);
    }

    std::cout << theme::fail("Unknown or incomplete config command: " + sub);
    cli.print_usage("config");
    return 1;
}

void register_config_commands(BaseCLI& cli) {
    cli.add_command("config", do_config, "Show or change global settings",
                    "config show | set <key> <value>");
}
