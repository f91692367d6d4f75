#pragma once
#include <nlohmann/json.hpp>
#include "server/module.hpp"
#include "storage/store.hpp"

namespace tabula::server {

// insert / find / update / delete / count
class RecordHandlers : public RouterModule {
public:
    explicit RecordHandlers(storage::Store& store) : store_(store) {}
    void register_handlers(RequestRouter& router) override;

private:
    storage::Store& store_;

    nlohmann::json handle_insert(const nlohmann::json& req);
    nlohmann::json handle_find(const nlohmann::json& req);
    nlohmann::json handle_update(const nlohmann::json& req);
    nlohmann::json handle_delete(const nlohmann::json& req);
    nlohmann::json handle_count(const nlohmann::json& req);
};

// tables / create_table / drop_table / save
class TableHandlers : public RouterModule {
public:
    explicit TableHandlers(storage::Store& store) : store_(store) {}
    void register_handlers(RequestRouter& router) override;

private:
    storage::Store& store_;

    nlohmann::json handle_tables(const nlohmann::json& req);
    nlohmann::json handle_create(const nlohmann::json& req);
    nlohmann::json handle_drop(const nlohmann::json& req);
    nlohmann::json handle_save(const nlohmann::json& req);
};

} // namespace tabula::server
