#include "storage/store.hpp"
#include "storage/error.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace tabula::storage {

namespace {

void check_depth(const Fields& data) {
    for (const auto& [field, value] : data) {
        if (!value.within_depth(kMaxValueDepth)) {
            throw StoreError(ErrorCode::SERIALIZATION,
                             "field '" + field + "' nests deeper than " +
                             std::to_string(kMaxValueDepth) + " levels");
        }
    }
}

} // namespace

Store::Store(StoreConfig config) : config_(std::move(config)) {
    std::error_code ec;
    fs::create_directories(config_.data_dir, ec);
    if (ec) {
        throw StoreError(ErrorCode::IO,
                         "cannot create data directory " + config_.data_dir.string() + ": " + ec.message());
    }

    if (config_.encryption_key) {
        crypto_ = std::make_shared<Crypto>(*config_.encryption_key);
    }

    load_existing_tables();

    spdlog::info("Store opened at {} ({} tables, encryption {})",
                 config_.data_dir.string(), tables_.size(), crypto_ ? "on" : "off");
}

Store::~Store() {
    if (closed_) {
        return;
    }

    std::vector<std::string> unsaved;
    for (const auto& [name, table] : tables_) {
        if (table.is_dirty()) {
            unsaved.push_back(name);
        }
    }
    if (!unsaved.empty()) {
        spdlog::warn("Store at {} destroyed without close(); {} table(s) not saved",
                     config_.data_dir.string(), unsaved.size());
        for (const auto& name : unsaved) {
            spdlog::warn("  unsaved table: {}", name);
        }
    }
}

void Store::load_existing_tables() {
    std::vector<fs::path> files;
    try {
        files = core::paths::list_files(config_.data_dir, kTableFileExtension);
    } catch (const fs::filesystem_error& e) {
        throw StoreError(ErrorCode::IO, e.what());
    }

    for (const auto& file : files) {
        std::string name = file.stem().string();
        if (!is_valid_table_name(name)) {
            spdlog::warn("Ignoring {}: not a valid table name", file.string());
            continue;
        }

        tables_.emplace(name, Table::open(name, config_.data_dir, crypto_, config_.max_file_size));
        spdlog::debug("Discovered table '{}'", name);
    }
}

void Store::ensure_open() const {
    if (closed_) {
        throw StoreError(ErrorCode::CONFIG, "store at " + config_.data_dir.string() + " is closed");
    }
}

Table& Store::get_table(const std::string& name) {
    ensure_open();
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        throw StoreError(ErrorCode::TABLE_NOT_FOUND, "table '" + name + "' not found");
    }
    return it->second;
}

const Table& Store::get_table(const std::string& name) const {
    ensure_open();
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        throw StoreError(ErrorCode::TABLE_NOT_FOUND, "table '" + name + "' not found");
    }
    return it->second;
}

void Store::create_table(const std::string& name) {
    ensure_open();
    if (tables_.count(name) > 0) {
        return;
    }
    if (!is_valid_table_name(name)) {
        throw StoreError(ErrorCode::CONFIG, "invalid table name '" + name + "'");
    }

    tables_.emplace(name, Table::open(name, config_.data_dir, crypto_, config_.max_file_size));
    spdlog::info("Created table '{}'", name);
}

void Store::drop_table(const std::string& name) {
    ensure_open();
    auto it = tables_.find(name);
    if (it == tables_.end()) {
        return;
    }

    fs::path file = it->second.file_path();
    std::error_code ec;
    fs::remove(file, ec);
    if (ec) {
        throw StoreError(ErrorCode::IO, "cannot remove " + file.string() + ": " + ec.message());
    }

    tables_.erase(it);
    spdlog::info("Dropped table '{}'", name);
}

bool Store::has_table(const std::string& name) const {
    return tables_.count(name) > 0;
}

std::string Store::insert(const std::string& table, Fields data) {
    ensure_open();
    check_depth(data);
    create_table(table);
    return get_table(table).insert(Record::create(std::move(data)));
}

std::optional<Record> Store::find_by_id(const std::string& table, const std::string& id) const {
    return get_table(table).find_by_id(id);
}

void Store::update(const std::string& table, const std::string& id, Fields data) {
    Table& t = get_table(table);
    check_depth(data);
    t.update(id, std::move(data));
}

void Store::erase(const std::string& table, const std::string& id) {
    get_table(table).erase(id);
}

std::vector<Record> Store::find_all(const std::string& table) const {
    return get_table(table).find_all();
}

std::vector<Record> Store::find_where(const std::string& table, const Table::Predicate& predicate) const {
    return get_table(table).find_where(predicate);
}

size_t Store::count(const std::string& table) const {
    return get_table(table).count();
}

void Store::save_all() {
    ensure_open();
    for (auto& [name, table] : tables_) {
        table.save();
    }
}

std::vector<std::string> Store::list_tables() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, table] : tables_) {
        names.push_back(name);
    }
    return names;
}

void Store::close() {
    if (closed_) {
        return;
    }

    save_all();
    closed_ = true;
    spdlog::info("Store at {} closed", config_.data_dir.string());
}

} // namespace tabula::storage
