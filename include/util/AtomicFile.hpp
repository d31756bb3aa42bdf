#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cadenza::util {

// Writes `contents` to a temporary sibling and renames it over `path`, so a
// crash mid-write never leaves a truncated document behind. Creates the parent
// directory if needed. On failure returns false and describes why in `error`.
bool write_file_atomically(const std::filesystem::path& path, const std::string& contents, std::string& error);

// Whole-file read; std::nullopt if the file is missing or unreadable.
std::optional<std::string> read_file(const std::filesystem::path& path);

}  // namespace cadenza::util
