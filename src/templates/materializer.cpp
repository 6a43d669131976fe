#include "materializer.hpp"
#include "variables.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/path_safety.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <system_error>

StructureMaterializer::StructureMaterializer(const VariableMap& variables, MaterializeMode mode)
    : variables_(variables), mode_(mode) {}

std::string StructureMaterializer::dir_segment(const std::string& raw) const {
    return sanitize_name(substitute_variables(raw, variables_), std::string(1, DIR_REPLACEMENT));
}

std::string StructureMaterializer::file_segment(const std::string& raw) const {
    return sanitize_name(substitute_variables(raw, variables_), std::string(1, FILE_REPLACEMENT));
}

// A generated segment must name a child of `base`: "" and "." would alias
// the parent itself, ".." (which contains no invalid chars) escapes it.
static bool accept_segment(const fs::path& base, const std::string& segment) {
    if (segment.empty() || segment == ".") {
        return false;
    }
    return is_strictly_within_directory(base, base / segment);
}

std::vector<Outcome> StructureMaterializer::materialize(const fs::path& base,
                                                        const std::vector<DirNode>& structure) {
    std::vector<Outcome> out;
    walk_dirs(base, structure, 0, out);
    return out;
}

std::vector<Outcome> StructureMaterializer::materialize_files(const fs::path& base,
                                                              const std::vector<FileNode>& files) {
    std::vector<Outcome> out;
    walk_files(base, files, 0, out);
    return out;
}

std::vector<Outcome> StructureMaterializer::materialize_template(const fs::path& root,
                                                                 const TemplateDocument& doc) {
    std::vector<Outcome> out;
    walk_dirs(root, doc.structure, 0, out);
    walk_files(root, doc.global_files, 0, out);
    return out;
}

void StructureMaterializer::walk_dirs(const fs::path& base, const std::vector<DirNode>& nodes,
                                      int depth, std::vector<Outcome>& out) {
    for (const auto& node : nodes) {
        std::string name = dir_segment(node.dir);
        fs::path dir_path = base / name;

        if (!accept_segment(base, name)) {
            std::string reason = fmt::format("path escapes {}", base.string());
            penlab_log("materialize", fmt::format("rejected directory '{}' -> {}", node.dir, dir_path.string()));
            skip_subtree(base, node, depth, OutcomeKind::Rejected, reason, "parent directory rejected", out);
            continue;
        }

        if (mode_ == MaterializeMode::Apply) {
            std::error_code ec;
            fs::create_directories(dir_path, ec);
            if (!ec && !fs::is_directory(dir_path, ec)) {
                ec = std::make_error_code(std::errc::not_a_directory);
            }
            if (ec) {
                penlab_log("materialize", fmt::format("mkdir {} failed: {}", dir_path.string(), ec.message()));
                skip_subtree(base, node, depth, OutcomeKind::Failed, ec.message(), "parent directory failed", out);
                continue;
            }
            out.push_back({OutcomeKind::Created, EntryType::Directory, dir_path, depth, false, ""});
        } else {
            out.push_back({OutcomeKind::Planned, EntryType::Directory, dir_path, depth, false, ""});
        }

        walk_files(dir_path, node.files, depth + 1, out);
        walk_dirs(dir_path, node.subdirs, depth + 1, out);
    }
}

void StructureMaterializer::walk_files(const fs::path& base, const std::vector<FileNode>& files,
                                       int depth, std::vector<Outcome>& out) {
    for (const auto& file : files) {
        std::string name = file_segment(file.name);
        fs::path file_path = base / name;

        if (!accept_segment(base, name)) {
            penlab_log("materialize", fmt::format("rejected file '{}' -> {}", file.name, file_path.string()));
            out.push_back({OutcomeKind::Rejected, EntryType::File, file_path, depth, file.executable,
                           fmt::format("path escapes {}", base.string())});
            continue;
        }

        if (mode_ == MaterializeMode::DryRun) {
            out.push_back({OutcomeKind::Planned, EntryType::File, file_path, depth, file.executable, ""});
            continue;
        }

        std::string content = substitute_variables(file.content, variables_);

        errno = 0;
        std::ofstream f(file_path, std::ios::binary | std::ios::trunc);
        if (!f) {
            std::string err = errno ? std::strerror(errno) : "cannot open for writing";
            penlab_log("materialize", fmt::format("open {} failed: {}", file_path.string(), err));
            out.push_back({OutcomeKind::Failed, EntryType::File, file_path, depth, file.executable, err});
            continue;
        }
        f << content;
        f.close();
        if (f.fail()) {
            penlab_log("materialize", fmt::format("write {} failed", file_path.string()));
            out.push_back({OutcomeKind::Failed, EntryType::File, file_path, depth, file.executable,
                           "write failed"});
            continue;
        }

        if (file.executable) {
            std::string err;
            if (!platform::make_executable(file_path, err)) {
                penlab_log("materialize", fmt::format("chmod {} failed: {}", file_path.string(), err));
            }
        }

        out.push_back({OutcomeKind::Created, EntryType::File, file_path, depth, file.executable, ""});
    }
}

void StructureMaterializer::skip_subtree(const fs::path& base, const DirNode& node, int depth,
                                         OutcomeKind kind, const std::string& reason,
                                         const std::string& child_reason, std::vector<Outcome>& out) {
    fs::path dir_path = base / dir_segment(node.dir);
    out.push_back({kind, EntryType::Directory, dir_path, depth, false, reason});

    for (const auto& file : node.files) {
        out.push_back({kind, EntryType::File, dir_path / file_segment(file.name),
                       depth + 1, file.executable, child_reason});
    }
    for (const auto& sub : node.subdirs) {
        skip_subtree(dir_path, sub, depth + 1, kind, child_reason, child_reason, out);
    }
}

OutcomeSummary summarize_outcomes(const std::vector<Outcome>& outcomes) {
    OutcomeSummary s;
    for (const auto& o : outcomes) {
        switch (o.kind) {
            case OutcomeKind::Created:  s.created++;  break;
            case OutcomeKind::Planned:  s.planned++;  break;
            case OutcomeKind::Rejected: s.rejected++; break;
            case OutcomeKind::Failed:   s.failed++;   break;
        }
    }
    return s;
}

const char* outcome_kind_name(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::Created:  return "created";
        case OutcomeKind::Planned:  return "planned";
        case OutcomeKind::Rejected: return "rejected";
        case OutcomeKind::Failed:   return "failed";
    }
    return "unknown";
}
