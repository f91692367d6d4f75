#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tabula::core::config {

// One KEY=VALUE line of a .env file. Blank lines and '#' comments yield
// nullopt; surrounding whitespace and matching quotes are stripped.
std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& line);

// Load the first .env found in the project search roots (then extra paths).
// Variables already set in the environment win. Idempotent; returns the
// file that was loaded, if any.
std::optional<std::filesystem::path> load_dotenv(
    const std::vector<std::filesystem::path>& extra_search_paths = {});

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Decimal unsigned integer, nullopt on anything else.
std::optional<uint64_t> parse_u64(const std::string& text);

} // namespace tabula::core::config
