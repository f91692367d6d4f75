#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace tabula::core::paths {

// Directory of the current executable; empty if unavailable.
std::filesystem::path executable_dir();

// Common search roots for project-relative files (.env): cwd and the
// executable directory, each with two parents, de-duplicated in order.
std::vector<std::filesystem::path> project_search_paths();

// Sibling path used while a file is being replaced: "<path>.tmp".
std::filesystem::path temp_path_for(const std::filesystem::path& path);

// Whole file contents. Throws std::system_error.
std::vector<uint8_t> read_file(const std::filesystem::path& path);

// Write to temp_path_for(path), fsync, then rename over path.
// On failure the temp file is removed and path is left untouched.
// Throws std::system_error.
void write_file_atomic(const std::filesystem::path& path, const std::vector<uint8_t>& bytes);

// Regular files directly under dir whose name ends in extension, sorted.
// Throws std::filesystem::filesystem_error.
std::vector<std::filesystem::path> list_files(const std::filesystem::path& dir,
                                              const std::string& extension);

} // namespace tabula::core::paths
