#include "storage/store_config.hpp"
#include "storage/error.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <system_error>

namespace tabula::storage {

StoreConfig load_store_config(StoreConfig defaults) {
    StoreConfig config = std::move(defaults);

    std::string data_dir = core::config::get_env(kEnvDataDir);
    if (!data_dir.empty()) {
        config.data_dir = data_dir;
    }

    std::string key_hex = core::config::get_env(kEnvEncryptionKey);
    if (!key_hex.empty()) {
        auto key = Crypto::key_from_hex(key_hex);
        if (key.size() != Crypto::kKeySize) {
            throw StoreError(ErrorCode::CONFIG,
                             std::string(kEnvEncryptionKey) + " must be " +
                             std::to_string(Crypto::kKeySize * 2) + " hex characters");
        }
        config.encryption_key = std::move(key);
    }

    std::string max_size = core::config::get_env(kEnvMaxFileSize);
    if (!max_size.empty()) {
        auto parsed = core::config::parse_u64(max_size);
        if (!parsed) {
            throw StoreError(ErrorCode::CONFIG,
                             std::string(kEnvMaxFileSize) + " is not a byte count: '" + max_size + "'");
        }
        config.max_file_size = *parsed;
    }

    return config;
}

std::vector<uint8_t> load_or_create_key_file(const std::filesystem::path& path) {
    std::error_code ec;
    bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        throw StoreError(ErrorCode::IO, "cannot access " + path.string() + ": " + ec.message());
    }

    try {
        if (exists) {
            auto bytes = core::paths::read_file(path);
            std::string hex(bytes.begin(), bytes.end());
            while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back()))) {
                hex.pop_back();
            }

            auto key = Crypto::key_from_hex(hex);
            if (key.size() != Crypto::kKeySize) {
                throw StoreError(ErrorCode::CONFIG, "key file " + path.string() + " does not hold a " +
                                 std::to_string(Crypto::kKeySize) + "-byte key");
            }
            return key;
        }

        auto key = Crypto::generate_key();
        std::string hex = Crypto::key_to_hex(key) + "\n";
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        core::paths::write_file_atomic(path, std::vector<uint8_t>(hex.begin(), hex.end()));
        spdlog::info("Wrote new encryption key to {}", path.string());
        return key;
    } catch (const std::system_error& e) {
        throw StoreError(ErrorCode::IO, e.what());
    }
}

} // namespace tabula::storage
