#include "../base_cli.hpp"
#include "../args.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <managers/note_store.hpp>
#include <managers/project_finder.hpp>
#include <iostream>
#include <fmt/format.h>

static std::string preview(const std::string& content, size_t max_len = 60) {
    std::string line = content.substr(0, content.find('\n'));
    if (line.size() > max_len) {
        line = line.substr(0, max_len - 3) + "...";
    }
    return line;
}

static void print_note_table(const std::vector<Note>& notes) {
    std::cout << theme::color::DIM
              << fmt::format("    {:<5} {:<12} {:<20} {}", "ID", "DATE", "TAGS", "CONTENT")
              << theme::color::RESET << "\n";
    for (const auto& n : notes) {
        std::string date = n.timestamp.substr(0, n.timestamp.find('T'));
        std::cout << fmt::format("    {:<5} {:<12} ", n.id, date)
                  << theme::color::YELLOW << fmt::format("{:<20}", join(n.tags, ", ")) << theme::color::RESET
                  << " " << preview(n.content) << "\n";
    }
    std::cout << "\n";
}

static bool parse_note_id(const std::string& raw, int& id) {
    id = safe_stoi(raw, 0);
    if (id <= 0) {
        std::cout << theme::fail("Invalid note id: " + raw);
        return false;
    }
    return true;
}

static int notes_add(NoteStore& store, const ParsedArgs& args) {
    if (args.positional.size() != 2) return -1;

    auto added = store.add(args.positional[1], args.all("tag", "t"),
                           args.get("author", "a", get_local_username()));
    if (added.is_err()) {
        std::cout << theme::fail(added.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Note #{} added", added.value.id));
    return 0;
}

static int notes_list(NoteStore& store) {
    auto notes = store.load();
    if (notes.empty()) {
        std::cout << theme::info("No notes yet for this project.");
        return 0;
    }
    std::cout << theme::section("Notes");
    print_note_table(notes);
    return 0;
}

static int notes_view(NoteStore& store, const std::string& raw_id) {
    int id = 0;
    if (!parse_note_id(raw_id, id)) return 1;

    auto note = store.find(id);
    if (!note) {
        std::cout << theme::fail(fmt::format("No note with id {}", id));
        return 1;
    }

    std::cout << theme::section(fmt::format("Note #{}", note->id));
    std::cout << theme::kv("Author", note->author);
    std::cout << theme::kv("Date", note->timestamp);
    std::cout << theme::kv("Tags", join(note->tags, ", "));
    std::cout << "\n" << note->content << "\n\n";
    return 0;
}

static int notes_delete(NoteStore& store, const std::string& raw_id) {
    int id = 0;
    if (!parse_note_id(raw_id, id)) return 1;

    auto removed = store.remove(id);
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    if (!removed.value) {
        std::cout << theme::fail(fmt::format("No note with id {}", id));
        return 1;
    }
    std::cout << theme::ok(fmt::format("Note #{} deleted", id));
    return 0;
}

static int notes_search(NoteStore& store, const std::string& keyword) {
    auto matches = store.search(keyword);
    if (matches.empty()) {
        std::cout << theme::info("No notes match '" + keyword + "'");
        return 0;
    }
    std::cout << theme::section("Results for '" + keyword + "'");
    print_note_table(matches);
    return 0;
}

static int do_notes(BaseCLI& cli, const std::vector<std::string>& argv) {
    auto args = parse_args(argv, {"tag", "t", "author", "a"});
    for (const auto& err : args.errors) {
        std::cout << theme::fail(err);
    }
    if (!args.errors.empty()) return 1;

    auto root = find_project_root(fs::current_path());
    if (!root) {
        std::cout << theme::fail("Not inside a penlab project.");
        std::cout << theme::step("Run this from a directory created by 'penlab init'.");
        return 1;
    }
    NoteStore store(*root);

    const std::string sub = args.positional.empty() ? "list" : args.positional[0];
    const size_t n = args.positional.size();
    int rc = -1;

    if (sub == "add") {
        rc = notes_add(store, args);
    } else if (sub == "list" && n <= 1) {
        rc = notes_list(store);
    } else if (sub == "view" && n == 2) {
        rc = notes_view(store, args.positional[1]);
    } else if (sub == "delete" && n == 2) {
        rc = notes_delete(store, args.positional[1]);
    } else if (sub == "search" && n == 2) {
        rc = notes_search(store, args.positional[1]);
    }

    if (rc < 0) {
        std::cout << theme::fail("Unknown or incomplete notes command: " + sub);
        cli.print_usage("notes");
        return 1;
    }
    return rc;
}

void register_notes_commands(BaseCLI& cli) {
    cli.add_command("notes", do_notes, "Project notes (add, list, view, delete, search)",
                    "notes add <text> [-t tag]... [-a author] | list | view <id> | delete <id> | search <keyword>");
}
