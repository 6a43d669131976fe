#include "note_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <system_error>

NoteStore::NoteStore(const fs::path& project_root)
    : notes_path_(project_root / PROJECT_STATE_DIR / NOTES_FILE) {}

static std::string scalar_or_empty(const YAML::Node& node) {
    return (node && node.IsScalar()) ? node.Scalar() : std::string();
}

static Result<std::vector<Note>> read_notes(const fs::path& path) {
    std::vector<Note> notes;
    if (!fs::exists(path)) {
        return Result<std::vector<Note>>::Ok(notes);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<std::vector<Note>>::Ok(notes);
        }
        if (!root["notes"] || !root["notes"].IsSequence()) {
            return Result<std::vector<Note>>::Err("Malformed notes file: " + path.string());
        }

        for (const auto& n : root["notes"]) {
            Note note;
            note.id = n["id"].as<int>(0);
            note.content = scalar_or_empty(n["content"]);
            note.timestamp = scalar_or_empty(n["timestamp"]);
            note.author = scalar_or_empty(n["author"]);
            if (n["tags"] && n["tags"].IsSequence()) {
                for (const auto& t : n["tags"]) {
                    if (t.IsScalar()) note.tags.push_back(t.Scalar());
                }
            }
            if (note.id > 0) {
                notes.push_back(note);
            }
        }
    } catch (const std::exception& e) {
        return Result<std::vector<Note>>::Err("Failed to read notes: " + std::string(e.what()));
    }
    return Result<std::vector<Note>>::Ok(notes);
}

std::vector<Note> NoteStore::load() const {
    auto result = read_notes(notes_path_);
    if (result.is_err()) {
        penlab_log("notes", result.error);
        return {};
    }
    return result.value;
}

Result<void> NoteStore::save(const std::vector<Note>& notes) const {
    std::error_code ec;
    fs::create_directories(notes_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + notes_path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "notes" << YAML::Value << YAML::BeginSeq;
    for (const auto& n : notes) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << n.id;
        out << YAML::Key << "content" << YAML::Value << n.content;
        out << YAML::Key << "timestamp" << YAML::Value << n.timestamp;
        out << YAML::Key << "tags" << YAML::Value << YAML::Flow << n.tags;
        out << YAML::Key << "author" << YAML::Value << n.author;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(notes_path_, std::ios::trunc);
    if (!fout) {
        return Result<void>::Err("Cannot write " + notes_path_.string());
    }
    fout << out.c_str() << "\n";
    if (!fout) {
        return Result<void>::Err("Failed writing " + notes_path_.string());
    }
    return Result<void>::Ok();
}

Result<Note> NoteStore::add(const std::string& content, const std::vector<std::string>& tags,
                            const std::string& author) {
    // A corrupt file is reported rather than overwritten
    auto existing = read_notes(notes_path_);
    if (existing.is_err()) {
        return Result<Note>::Err(existing.error);
    }
    auto notes = existing.value;

    int max_id = 0;
    for (const auto& n : notes) {
        max_id = std::max(max_id, n.id);
    }

    Note note;
    note.id = max_id + 1;
    note.content = content;
    note.timestamp = now_iso();
    note.tags = tags;
    note.author = author;
    notes.push_back(note);

    auto saved = save(notes);
    if (saved.is_err()) {
        return Result<Note>::Err(saved.error);
    }
    return Result<Note>::Ok(note);
}

std::optional<Note> NoteStore::find(int id) const {
    for (const auto& n : load()) {
        if (n.id == id) return n;
    }
    return std::nullopt;
}

Result<bool> NoteStore::remove(int id) {
    auto existing = read_notes(notes_path_);
    if (existing.is_err()) {
        return Result<bool>::Err(existing.error);
    }
    auto notes = existing.value;

    auto it = std::remove_if(notes.begin(), notes.end(), [id](const Note& n) { return n.id == id; });
    if (it == notes.end()) {
        return Result<bool>::Ok(false);
    }
    notes.erase(it, notes.end());

    auto saved = save(notes);
    if (saved.is_err()) {
        return Result<bool>::Err(saved.error);
    }
    return Result<bool>::Ok(true);
}

std::vector<Note> NoteStore::search(const std::string& keyword) const {
    std::vector<Note> matches;
    std::string needle = to_lower(keyword);

    for (const auto& n : load()) {
        bool hit = to_lower(n.content).find(needle) != std::string::npos;
        for (const auto& t : n.tags) {
            if (hit) break;
            hit = to_lower(t).find(needle) != std::string::npos;
        }
        if (hit) matches.push_back(n);
    }
    return matches;
}
