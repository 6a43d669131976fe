#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "template_document.hpp"

namespace fs = std::filesystem;

enum class MaterializeMode { Apply, DryRun };

enum class OutcomeKind {
    Created,    // apply: entry exists on disk now
    Planned,    // dry-run: entry would be created
    Rejected,   // name escaped its parent; skipped with its subtree
    Failed,     // filesystem error while applying; a failed directory fails its subtree
};

enum class EntryType { Directory, File };

struct Outcome {
    OutcomeKind kind;
    EntryType type;
    fs::path path;
    int depth = 0;              // 0 = directly under the materialization root
    bool executable = false;    // files only
    std::string error;          // Failed / Rejected reason
};

// Turns template nodes into filesystem entries (Apply) or an equivalent
// trace (DryRun). Every decision (substitution, sanitization, containment)
// is identical in both modes; only the mutation differs. Errors are returned
// as outcomes, nothing is thrown and nothing is printed.
class StructureMaterializer {
public:
    StructureMaterializer(const VariableMap& variables, MaterializeMode mode);

    // Walk `structure` below `base`, depth-first pre-order: a directory,
    // then its files, then its subdirs.
    std::vector<Outcome> materialize(const fs::path& base, const std::vector<DirNode>& structure);

    // Create `files` directly inside `base`.
    std::vector<Outcome> materialize_files(const fs::path& base, const std::vector<FileNode>& files);

    // structure, then global_files anchored at `root`.
    std::vector<Outcome> materialize_template(const fs::path& root, const TemplateDocument& doc);

    MaterializeMode mode() const { return mode_; }

private:
    VariableMap variables_;
    MaterializeMode mode_;

    void walk_dirs(const fs::path& base, const std::vector<DirNode>& nodes, int depth,
                   std::vector<Outcome>& out);
    void walk_files(const fs::path& base, const std::vector<FileNode>& files, int depth,
                    std::vector<Outcome>& out);
    // Emit `kind` for `node` and every descendant without touching disk.
    void skip_subtree(const fs::path& base, const DirNode& node, int depth,
                      OutcomeKind kind, const std::string& reason,
                      const std::string& child_reason, std::vector<Outcome>& out);

    std::string dir_segment(const std::string& raw) const;
    std::string file_segment(const std::string& raw) const;
};

// Summary counts for rendering.
struct OutcomeSummary {
    size_t created = 0;
    size_t planned = 0;
    size_t rejected = 0;
    size_t failed = 0;
};

OutcomeSummary summarize_outcomes(const std::vector<Outcome>& outcomes);

const char* outcome_kind_name(OutcomeKind kind);
