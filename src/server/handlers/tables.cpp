#include "server/handlers.hpp"
#include "server/request_router.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace tabula::server {

void TableHandlers::register_handlers(RequestRouter& router) {
    router.register_handler(RequestOp::TABLES,
        [this](const json& req) { return handle_tables(req); });
    router.register_handler(RequestOp::CREATE_TABLE,
        [this](const json& req) { return handle_create(req); });
    router.register_handler(RequestOp::DROP_TABLE,
        [this](const json& req) { return handle_drop(req); });
    router.register_handler(RequestOp::SAVE,
        [this](const json& req) { return handle_save(req); });
}

json TableHandlers::handle_tables(const json&) {
    auto names = store_.list_tables();
    std::sort(names.begin(), names.end());

    json tables = json::array();
    for (const auto& name : names) {
        tables.push_back(json{{"name", name}, {"count", store_.count(name)}});
    }
    return ok_response(tables);
}

json TableHandlers::handle_create(const json& req) {
    std::string table = req.value("table", "");
    if (table.empty()) {
        return error_response("table is required");
    }
    store_.create_table(table);
    return ok_response(json{{"table", table}});
}

json TableHandlers::handle_drop(const json& req) {
    std::string table = req.value("table", "");
    if (table.empty()) {
        return error_response("table is required");
    }
    store_.drop_table(table);
    return ok_response(json{{"table", table}});
}

json TableHandlers::handle_save(const json&) {
    store_.save_all();
    spdlog::debug("Saved all tables on request");
    return ok_response();
}

} // namespace tabula::server
