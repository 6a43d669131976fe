#include "template_catalog.hpp"
#include "template_validator.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/path_safety.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>

fs::path find_template_file(const fs::path& templates_dir, const std::string& name) {
    for (const char* ext : {TEMPLATE_EXTENSION, TEMPLATE_EXTENSION_ALT}) {
        fs::path candidate = templates_dir / (name + ext);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return {};
}

Result<YAML::Node> read_template_file(const fs::path& path) {
    try {
        return Result<YAML::Node>::Ok(YAML::LoadFile(path.string()));
    } catch (const YAML::ParserException& e) {
        return Result<YAML::Node>::Err(fmt::format("Invalid YAML in {}: {}", path.string(), e.what()));
    } catch (const std::exception& e) {
        return Result<YAML::Node>::Err(fmt::format("Cannot read {}: {}", path.string(), e.what()));
    }
}

TemplateLoad load_template(const fs::path& templates_dir, const std::string& name) {
    TemplateLoad load;

    fs::path path = find_template_file(templates_dir, name);
    if (path.empty()) {
        load.errors.push_back(fmt::format("Template '{}' not found in {}", name, templates_dir.string()));
        return load;
    }

    auto parsed = read_template_file(path);
    if (parsed.is_err()) {
        load.errors.push_back(parsed.error);
        return load;
    }

    auto validation = validate_template(parsed.value);
    if (!validation.valid) {
        load.errors = validation.errors;
        penlab_log("templates", fmt::format("{} failed validation ({} errors)",
                                            path.string(), validation.errors.size()));
        return load;
    }

    load.document = TemplateDocument::from_yaml(parsed.value);
    if (load.document->name.empty()) {
        load.document->name = name;
    }
    return load;
}

static bool has_template_extension(const fs::path& p) {
    auto ext = p.extension().string();
    return ext == TEMPLATE_EXTENSION || ext == TEMPLATE_EXTENSION_ALT;
}

std::vector<fs::path> list_template_files(const fs::path& templates_dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(templates_dir, ec)) {
        return files;
    }

    fs::directory_iterator it(templates_dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && has_template_extension(it->path())) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        penlab_log("templates", "listing " + templates_dir.string() + " failed: " + ec.message());
    }
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return files;
}

TemplateSummary summarize_template(const fs::path& path) {
    TemplateSummary summary;
    summary.name = path.stem().string();

    auto parsed = read_template_file(path);
    if (parsed.is_err() || (!parsed.value.IsNull() && !parsed.value.IsMap())) {
        summary.version = "?";
        summary.readable = false;
        return summary;
    }

    auto doc = TemplateDocument::from_yaml(parsed.value);
    if (!doc.name.empty()) summary.name = doc.name;
    summary.version = doc.version.empty() ? "1.0" : doc.version;
    summary.description = doc.description;
    summary.tags = doc.tags;
    return summary;
}

Result<fs::path> import_template(const fs::path& source, const fs::path& templates_dir) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return Result<fs::path>::Err("Template file not found: " + source.string());
    }

    auto parsed = read_template_file(source);
    if (parsed.is_err()) {
        return Result<fs::path>::Err(parsed.error);
    }

    auto validation = validate_template(parsed.value);
    if (!validation.valid) {
        std::string msg = "Template is invalid:";
        for (const auto& err : validation.errors) {
            msg += "\n  - " + err;
        }
        return Result<fs::path>::Err(msg);
    }

    auto doc = TemplateDocument::from_yaml(parsed.value);
    std::string name = sanitize_name(doc.name.empty() ? source.stem().string() : doc.name,
                                     std::string(1, FILE_REPLACEMENT));
    if (name.empty() || name == "." || name == "..") {
        return Result<fs::path>::Err("Template has no usable name");
    }

    fs::create_directories(templates_dir, ec);
    if (ec) {
        return Result<fs::path>::Err("Failed to create " + templates_dir.string() + ": " + ec.message());
    }

    fs::path dest = templates_dir / (name + TEMPLATE_EXTENSION);
    if (!is_strictly_within_directory(templates_dir, dest)) {
        return Result<fs::path>::Err("Template name escapes the templates directory: " + name);
    }

    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return Result<fs::path>::Err("Failed to copy template: " + ec.message());
    }

    penlab_log("templates", "imported " + source.string() + " as " + dest.string());
    return Result<fs::path>::Ok(dest);
}
