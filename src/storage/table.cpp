#include "storage/table.hpp"
#include "storage/codec.hpp"
#include "storage/error.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace tabula::storage {

Table::Table(std::string name, fs::path file_path,
             std::shared_ptr<const Crypto> crypto, uint64_t max_file_size)
    : name_(std::move(name))
    , file_path_(std::move(file_path))
    , crypto_(std::move(crypto))
    , max_file_size_(max_file_size) {}

Table Table::open(const std::string& name, const fs::path& directory,
                  std::shared_ptr<const Crypto> crypto, uint64_t max_file_size) {
    Table table(name, table_file_path(directory, name), std::move(crypto), max_file_size);

    std::error_code ec;
    bool exists = fs::exists(table.file_path_, ec);
    if (ec) {
        throw StoreError(ErrorCode::IO, "cannot access " + table.file_path_.string() + ": " + ec.message());
    }
    if (exists) {
        table.load();
    } else {
        // No file yet: the first save() must create one even if empty
        table.dirty_ = true;
    }

    spdlog::debug("Table '{}' opened with {} records ({})", table.name_, table.records_.size(),
                  exists ? "loaded" : "new");
    return table;
}

std::string Table::insert(Record record) {
    if (records_.count(record.id) > 0) {
        throw StoreError(ErrorCode::DUPLICATE_IDENTIFIER,
                         "duplicate record id '" + record.id + "' in table '" + name_ + "'");
    }

    std::string id = record.id;
    records_.emplace(id, std::move(record));
    dirty_ = true;
    return id;
}

std::optional<Record> Table::find_by_id(const std::string& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Table::update(const std::string& id, Fields data) {
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw StoreError(ErrorCode::RECORD_NOT_FOUND,
                         "record '" + id + "' not found in table '" + name_ + "'");
    }

    it->second.replace(std::move(data));
    dirty_ = true;
}

void Table::erase(const std::string& id) {
    if (records_.erase(id) == 0) {
        throw StoreError(ErrorCode::RECORD_NOT_FOUND,
                         "record '" + id + "' not found in table '" + name_ + "'");
    }
    dirty_ = true;
}

std::vector<Record> Table::find_all() const {
    std::vector<Record> result;
    result.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        result.push_back(record);
    }
    return result;
}

std::vector<Record> Table::find_where(const Predicate& predicate) const {
    std::vector<Record> result;
    for (const auto& [id, record] : records_) {
        if (predicate(record)) {
            result.push_back(record);
        }
    }
    return result;
}

void Table::save() {
    if (!dirty_) {
        return;
    }

    std::vector<uint8_t> bytes = codec::encode_snapshot(records_);
    if (crypto_) {
        bytes = crypto_->encrypt(bytes);
    }

    if (max_file_size_ > 0 && bytes.size() > max_file_size_) {
        throw StoreError(ErrorCode::IO,
                         "snapshot of table '" + name_ + "' is " + std::to_string(bytes.size()) +
                         " bytes, exceeding the limit of " + std::to_string(max_file_size_));
    }

    try {
        core::paths::write_file_atomic(file_path_, bytes);
    } catch (const std::system_error& e) {
        throw StoreError(ErrorCode::IO, e.what());
    }

    dirty_ = false;
    spdlog::debug("Table '{}' saved: {} records, {} bytes", name_, records_.size(), bytes.size());
}

void Table::load() {
    std::vector<uint8_t> bytes;
    try {
        bytes = core::paths::read_file(file_path_);
    } catch (const std::system_error& e) {
        throw StoreError(ErrorCode::IO, e.what());
    }

    if (bytes.empty()) {
        records_.clear();
        dirty_ = false;
        return;
    }

    try {
        if (crypto_) {
            bytes = crypto_->decrypt(bytes);
        }
        records_ = codec::decode_snapshot(bytes);
    } catch (const StoreError& e) {
        throw StoreError(e.code(), "table '" + name_ + "': " + e.what());
    }
    dirty_ = false;
}

fs::path table_file_path(const fs::path& directory, const std::string& name) {
    return directory / (name + kTableFileExtension);
}

bool is_valid_table_name(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace tabula::storage
