#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct Note {
    int id = 0;
    std::string content;
    std::string timestamp;          // ISO timestamp
    std::vector<std::string> tags;
    std::string author;
};

// Per-project notes, kept in <project>/.penlab/notes.yaml
class NoteStore {
public:
    explicit NoteStore(const fs::path& project_root);

    std::vector<Note> load() const;
    Result<void> save(const std::vector<Note>& notes) const;

    // Appends a note with id = max existing id + 1.
    Result<Note> add(const std::string& content, const std::vector<std::string>& tags,
                     const std::string& author);
    std::optional<Note> find(int id) const;
    // False if no note had that id.
    Result<bool> remove(int id);
    // Case-insensitive match on content or any tag.
    std::vector<Note> search(const std::string& keyword) const;

    const fs::path& path() const { return notes_path_; }

private:
    fs::path notes_path_;
};
