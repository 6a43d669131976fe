#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <core/path_safety.hpp>
#include <managers/project_metadata.hpp>
#include <templates/materializer.hpp>
#include <templates/template_catalog.hpp>
#include <templates/variables.hpp>
#include <iostream>
#include <fmt/format.h>

static bool is_valid_project_name(const std::string& name) {
    if (name.empty()) return false;
    if (fs::path(name).is_absolute()) return false;
    for (const char* bad : {"..", "/", "\\"}) {
        if (name.find(bad) != std::string::npos) return false;
    }
    return true;
}

// --var key=value, repeatable
static bool parse_var_assignments(const std::vector<std::string>& raw, VariableMap& out) {
    for (const auto& assignment : raw) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            std::cout << theme::fail("Invalid --var '" + assignment + "', expected key=value");
            return false;
        }
        out[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
    return true;
}

static void render_outcomes(const std::vector<Outcome>& outcomes) {
    for (const auto& o : outcomes) {
        std::string indent(4 + 2 * o.depth, ' ');
        std::string label = o.path.filename().string();
        if (o.type == EntryType::Directory) label += "/";

        switch (o.kind) {
            case OutcomeKind::Created:
            case OutcomeKind::Planned:
                if (o.type == EntryType::Directory) {
                    std::cout << indent << theme::teal(label);
                } else {
                    std::cout << indent << label;
                }
                if (o.executable) std::cout << theme::green(" *");
                std::cout << "\n";
                break;
            case OutcomeKind::Rejected:
                std::cout << indent << theme::yellow(label) << theme::dim("  skipped: " + o.error) << "\n";
                break;
            case OutcomeKind::Failed:
                std::cout << indent << theme::red(label) << theme::dim("  failed: " + o.error) << "\n";
                break;
        }
    }
}

static int do_init(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {"t", "template", "target", "your-ip", "var"});
    if (!args.errors.empty() || args.positional.size() != 1) {
        for (const auto& err : args.errors) {
            std::cout << theme::fail(err);
        }
        if (args.positional.empty()) std::cout << theme::fail("Missing project name.");
        if (args.positional.size() > 1) std::cout << theme::fail("Too many arguments.");
        cli.print_usage("init");
        return 1;
    }

    const std::string project_name = args.positional[0];
    const bool dry_run = args.has_flag("dry-run");
    const bool force = args.has_flag("force");
    const bool assume_yes = args.has_flag("yes", "y");

    if (!is_valid_project_name(project_name)) {
        std::cout << theme::fail("Invalid project name: " + project_name);
        std::cout << theme::step("Use a plain name without '/', '\\' or '..'");
        return 1;
    }

    if (!cli.require_config()) return 1;
    const GlobalConfig& config = cli.config.value();
    const std::string template_name = args.get("template", "t", config.default_template());

    std::cout << theme::section(dry_run ? "penlab init (dry run)" : "penlab init");
    std::cout << theme::kv("Project", theme::bold(project_name));
    std::cout << theme::kv("Template", template_name);

    // ── Template ──────────────────────────────────────────
    auto load = load_template(get_templates_dir(cli.penlab_root), template_name);
    if (!load.ok()) {
        std::cout << "\n";
        for (const auto& err : load.errors) {
            std::cout << theme::fail(err);
        }
        std::cout << theme::step("Run 'penlab templates list' to see installed templates.");
        return 1;
    }
    const TemplateDocument& doc = *load.document;

    // ── Variables ─────────────────────────────────────────
    VariableInputs inputs;
    inputs.project_name = project_name;
    if (!parse_var_assignments(args.all("var"), inputs.cli)) return 1;
    if (args.has("target")) inputs.cli[VAR_TARGET] = args.get("target");
    if (args.has("your-ip")) inputs.cli[VAR_YOUR_IP] = args.get("your-ip");
    inputs.template_defaults = doc.variable_defaults();
    inputs.global_config = config.as_variables();
    VariableMap variables = build_variable_set(inputs);

    std::cout << theme::kv("Target", variables[VAR_TARGET]);
    std::cout << theme::kv("Your IP", variables[VAR_YOUR_IP]);

    // ── Location ──────────────────────────────────────────
    std::string safe_name = sanitize_name(project_name, std::string(1, DIR_REPLACEMENT));
    fs::path cwd = fs::current_path();
    fs::path project_path = cwd / safe_name;
    if (safe_name.empty() || safe_name == "." || !is_strictly_within_directory(cwd, project_path)) {
        std::cout << theme::fail("Invalid project name: it would be created outside " + cwd.string());
        return 1;
    }
    std::cout << theme::kv("Location", project_path.string());
    std::cout << "\n";

    std::error_code ec;
    if (fs::exists(project_path, ec)) {
        if (dry_run) {
            std::cout << theme::warn("Directory already exists; --force would remove it first.");
        } else if (!force) {
            std::cout << theme::fail("Directory " + project_path.string() + " already exists.");
            std::cout << theme::step("Use --force to replace it.");
            return 1;
        } else {
            if (!assume_yes) {
                std::cout << theme::warn("This removes the existing directory:");
                std::cout << theme::dim("      " + project_path.string()) << "\n";
                if (!BaseCLI::confirm("Continue?")) {
                    std::cout << theme::info("Cancelled.");
                    return 1;
                }
            }
            fs::remove_all(project_path, ec);
            if (ec) {
                std::cout << theme::fail("Failed to remove existing directory: " + ec.message());
                return 1;
            }
            penlab_log("init", "removed existing " + project_path.string());
            std::cout << theme::ok("Existing directory removed.");
        }
    }

    // ── Dry run ───────────────────────────────────────────
    if (dry_run) {
        StructureMaterializer planner(variables, MaterializeMode::DryRun);
        auto outcomes = planner.materialize_template(project_path, doc);

        std::cout << "  " << theme::bold(safe_name + "/") << "\n";
        render_outcomes(outcomes);

        auto summary = summarize_outcomes(outcomes);
        std::cout << "\n";
        std::cout << theme::info(fmt::format("{} entries planned, {} skipped. Nothing was written.",
                                             summary.planned, summary.rejected));
        return 0;
    }

    // ── Apply ─────────────────────────────────────────────
    fs::create_directories(project_path, ec);
    if (ec) {
        std::cout << theme::fail("Failed to create project directory: " + ec.message());
        return 1;
    }

    StructureMaterializer materializer(variables, MaterializeMode::Apply);
    auto outcomes = materializer.materialize_template(project_path, doc);

    std::cout << "  " << theme::bold(safe_name + "/") << "\n";
    render_outcomes(outcomes);
    std::cout << "\n";

    auto meta = ProjectMetadata::from_variables(project_path, variables, template_name);
    auto saved = meta.save(project_path);
    if (saved.is_err()) {
        std::cout << theme::warn("Project metadata not written: " + saved.error);
    }

    auto summary = summarize_outcomes(outcomes);
    if (summary.rejected > 0) {
        std::cout << theme::warn(fmt::format("{} entries skipped (unsafe names).", summary.rejected));
    }
    if (summary.failed > 0) {
        std::cout << theme::fail(fmt::format("{} entries could not be created.", summary.failed));
        return 1;
    }

    std::cout << theme::ok(fmt::format("Project created ({} entries) at {}",
                                       summary.created, project_path.string()));
    return 0;
}

void register_init_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Create a project from a template",
                    "init <name> [-t template] [--target IP] [--your-ip IP] [--var key=value]... "
                    "[--force] [--dry-run] [-y]");
}
