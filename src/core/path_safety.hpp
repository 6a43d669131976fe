#pragma once

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// Characters that never survive into a generated path segment.
// NUL is handled separately since it terminates C strings.
constexpr const char* INVALID_SEGMENT_CHARS = "<>:\"/\\|?*";

// Map an arbitrary string to a single safe path segment:
//   - every char in INVALID_SEGMENT_CHARS and NUL becomes `replacement`
//   - whitespace runs (ASCII and the Unicode space characters such as
//     NBSP) collapse to one space, ends are trimmed
//   - result is cut to MAX_SEGMENT_LENGTH bytes without splitting a
//     UTF-8 sequence
// Invalid characters inside `replacement` itself are dropped, so the
// output never contains a separator. Pure and total.
std::string sanitize_name(const std::string& raw, const std::string& replacement = "_");

// True if `target` is `base` or lies below it. Both paths are made absolute
// and symlink-resolved as far as they exist; any non-existent tail is
// normalized lexically so the check works before the entry is created.
// The match is component-wise: /a/bc is not within /a/b.
// Returns false on any resolution error, never throws.
bool is_within_directory(const fs::path& base, const fs::path& target);

// True if `target` lies below `base` and is not `base` itself.
bool is_strictly_within_directory(const fs::path& base, const fs::path& target);
