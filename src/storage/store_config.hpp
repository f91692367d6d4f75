#pragma once
#include "storage/store.hpp"

namespace tabula::storage {

constexpr const char* kEnvDataDir = "TABULA_DATA_DIR";
constexpr const char* kEnvEncryptionKey = "TABULA_ENCRYPTION_KEY";
constexpr const char* kEnvMaxFileSize = "TABULA_MAX_FILE_SIZE";

// Overlay TABULA_* environment variables on defaults. Unset or empty
// variables keep the default. Throws StoreError(CONFIG) for a malformed key
// or size.
StoreConfig load_store_config(StoreConfig defaults = {});

// Read the hex key stored at path, or generate one and write it there
// (creating parent directories). Throws StoreError(IO) when the file cannot
// be read or written and StoreError(CONFIG) when it holds a malformed key.
std::vector<uint8_t> load_or_create_key_file(const std::filesystem::path& path);

} // namespace tabula::storage
