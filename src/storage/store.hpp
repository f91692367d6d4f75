#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>
#include "storage/crypto.hpp"
#include "storage/table.hpp"

namespace tabula::storage {

struct StoreConfig {
    std::filesystem::path data_dir = "./data";
    std::optional<std::vector<uint8_t>> encryption_key;     // 32 bytes when set
    uint64_t max_file_size = 10 * 1024 * 1024;              // Per snapshot, 0 = unlimited
};

/**
 * Registry of the tables stored in one data directory.
 *
 * Opening scans the directory for *.db files and loads every table; one
 * unreadable table fails the whole open. Writes stay in memory until
 * save_all() or close(). The destructor never saves: call close() and
 * handle its errors, or use with_store().
 *
 * Not thread-safe. Callers sharing a Store serialize access themselves.
 */
class Store {
public:
    explicit Store(StoreConfig config);
    ~Store();

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    // No-op if the table exists. Throws CONFIG for an invalid name.
    void create_table(const std::string& name);

    // Removes the table and its file. No-op if absent.
    void drop_table(const std::string& name);

    bool has_table(const std::string& name) const;

    // Creates the table on first use. Returns the new record id.
    std::string insert(const std::string& table, Fields data);

    // The rest throw TABLE_NOT_FOUND for an unknown table.
    std::optional<Record> find_by_id(const std::string& table, const std::string& id) const;
    void update(const std::string& table, const std::string& id, Fields data);
    void erase(const std::string& table, const std::string& id);
    std::vector<Record> find_all(const std::string& table) const;
    std::vector<Record> find_where(const std::string& table, const Table::Predicate& predicate) const;
    size_t count(const std::string& table) const;

    // Saves every dirty table. Stops at the first failure; tables saved
    // before it stay saved.
    void save_all();

    std::vector<std::string> list_tables() const;

    // Flushes all dirty tables once. Later calls are no-ops. After a
    // successful close every other operation throws CONFIG.
    void close();

    bool is_closed() const { return closed_; }
    bool is_encrypted() const { return crypto_ != nullptr; }
    const StoreConfig& config() const { return config_; }

private:
    StoreConfig config_;
    std::shared_ptr<const Crypto> crypto_;
    std::unordered_map<std::string, Table> tables_;
    bool closed_ = false;

    void load_existing_tables();
    void ensure_open() const;
    Table& get_table(const std::string& name);
    const Table& get_table(const std::string& name) const;
};

// Open a store, run fn(store), then close() it so save errors reach the
// caller. If fn throws, nothing is saved and the exception propagates.
template <typename Fn>
auto with_store(StoreConfig config, Fn&& fn) {
    Store store(std::move(config));
    if constexpr (std::is_void_v<decltype(fn(store))>) {
        std::forward<Fn>(fn)(store);
        store.close();
    } else {
        auto result = std::forward<Fn>(fn)(store);
        store.close();
        return result;
    }
}

} // namespace tabula::storage
