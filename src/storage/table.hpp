#pragma once
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "storage/crypto.hpp"
#include "storage/record.hpp"

namespace tabula::storage {

// Extension of table snapshot files inside a data directory.
constexpr const char* kTableFileExtension = ".db";

/**
 * One named collection of records backed by a single snapshot file.
 *
 * Mutations only touch memory and mark the table dirty; save() writes the
 * whole index. The file on disk always holds the snapshot of the last
 * successful save.
 */
class Table {
public:
    using Predicate = std::function<bool(const Record&)>;

    // Loads directory/<name>.db when it exists. Throws StoreError when the
    // file cannot be read, decrypted or decoded.
    static Table open(const std::string& name,
                      const std::filesystem::path& directory,
                      std::shared_ptr<const Crypto> crypto,
                      uint64_t max_file_size = 0);

    // Throws DUPLICATE_IDENTIFIER if record.id is already present.
    std::string insert(Record record);

    std::optional<Record> find_by_id(const std::string& id) const;

    // Throws RECORD_NOT_FOUND.
    void update(const std::string& id, Fields data);
    void erase(const std::string& id);

    // Order is unspecified.
    std::vector<Record> find_all() const;
    std::vector<Record> find_where(const Predicate& predicate) const;

    /**
     * Write the snapshot if dirty.
     *
     * The snapshot goes to <file>.tmp first and is renamed over the table
     * file, so the file is always either the old or the new snapshot. On
     * failure the table stays dirty.
     */
    void save();

    size_t count() const { return records_.size(); }
    bool is_dirty() const { return dirty_; }
    const std::string& name() const { return name_; }
    const std::filesystem::path& file_path() const { return file_path_; }

private:
    Table(std::string name, std::filesystem::path file_path,
          std::shared_ptr<const Crypto> crypto, uint64_t max_file_size);

    void load();

    std::string name_;
    std::filesystem::path file_path_;
    std::shared_ptr<const Crypto> crypto_;
    uint64_t max_file_size_;    // 0 = unlimited
    RecordIndex records_;
    bool dirty_ = false;
};

// <directory>/<name>.db
std::filesystem::path table_file_path(const std::filesystem::path& directory, const std::string& name);

// Table names map 1:1 to files: non-empty, [A-Za-z0-9_-] only.
bool is_valid_table_name(const std::string& name);

} // namespace tabula::storage
