#include "core/config.hpp"
#include "core/paths.hpp"
#include <cstdlib>
#include <fstream>

namespace tabula::core::config {

namespace {

std::string trim(const std::string& s, const char* chars = " \t\r\n") {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

} // namespace

std::optional<std::pair<std::string, std::string>> parse_dotenv_line(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#') {
        return std::nullopt;
    }

    size_t eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
        return std::nullopt;
    }

    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    if (key.rfind("export ", 0) == 0) {
        key = trim(key.substr(7));
    }
    if (key.empty()) {
        return std::nullopt;
    }

    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
    }
    return std::make_pair(key, value);
}

std::optional<std::filesystem::path> load_dotenv(const std::vector<std::filesystem::path>& extra_search_paths) {
    static bool loaded = false;
    static std::optional<std::filesystem::path> loaded_from;
    if (loaded) return loaded_from;
    loaded = true;

    std::vector<std::filesystem::path> search_paths = paths::project_search_paths();
    search_paths.insert(search_paths.end(), extra_search_paths.begin(), extra_search_paths.end());

    for (const auto& base : search_paths) {
        auto env_path = base / ".env";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(env_path, ec)) {
            continue;
        }

        std::ifstream file(env_path);
        std::string line;
        while (std::getline(file, line)) {
            auto entry = parse_dotenv_line(line);
            if (entry && std::getenv(entry->first.c_str()) == nullptr) {
                setenv(entry->first.c_str(), entry->second.c_str(), 0);
            }
        }
        loaded_from = env_path;
        break;
    }
    return loaded_from;
}

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

std::optional<uint64_t> parse_u64(const std::string& text) {
    if (text.empty() || text.size() > 20) {
        return std::nullopt;
    }

    uint64_t result = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (result > (UINT64_MAX - digit) / 10) return std::nullopt;
        result = result * 10 + digit;
    }
    return result;
}

} // namespace tabula::core::config
