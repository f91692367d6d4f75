#include "server/handlers.hpp"
#include "server/json_convert.hpp"
#include "server/request_router.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace tabula::server {

namespace {

std::string string_field(const json& req, const char* field) {
    auto it = req.find(field);
    if (it == req.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

json records_to_json(const std::vector<storage::Record>& records) {
    json arr = json::array();
    for (const auto& record : records) {
        arr.push_back(record_to_json(record));
    }
    return arr;
}

} // namespace

void RecordHandlers::register_handlers(RequestRouter& router) {
    router.register_handler(RequestOp::INSERT,
        [this](const json& req) { return handle_insert(req); });
    router.register_handler(RequestOp::FIND,
        [this](const json& req) { return handle_find(req); });
    router.register_handler(RequestOp::UPDATE,
        [this](const json& req) { return handle_update(req); });
    router.register_handler(RequestOp::DELETE,
        [this](const json& req) { return handle_delete(req); });
    router.register_handler(RequestOp::COUNT,
        [this](const json& req) { return handle_count(req); });
}

json RecordHandlers::handle_insert(const json& req) {
    std::string table = string_field(req, "table");
    if (table.empty()) {
        return error_response("table is required");
    }
    if (!req.contains("data")) {
        return error_response("data is required");
    }

    std::string id = store_.insert(table, fields_from_json(req["data"]));
    spdlog::debug("Inserted record {} into '{}'", id, table);
    return ok_response(json{{"id", id}});
}

json RecordHandlers::handle_find(const json& req) {
    std::string table = string_field(req, "table");
    if (table.empty()) {
        return error_response("table is required");
    }

    std::string id = string_field(req, "id");
    if (!id.empty()) {
        auto record = store_.find_by_id(table, id);
        if (!record) {
            return error_response("record '" + id + "' not found", "RECORD_NOT_FOUND");
        }
        return ok_response(record_to_json(*record));
    }

    if (req.contains("query") && !req["query"].is_null()) {
        storage::Fields query = fields_from_json(req["query"]);
        auto records = store_.find_where(table, [&query](const storage::Record& r) {
            for (const auto& [field, expected] : query) {
                auto it = r.data.find(field);
                if (it == r.data.end() || it->second != expected) {
                    return false;
                }
            }
            return true;
        });
        return ok_response(records_to_json(records));
    }

    return ok_response(records_to_json(store_.find_all(table)));
}

json RecordHandlers::handle_update(const json& req) {
    std::string table = string_field(req, "table");
    std::string id = string_field(req, "id");
    if (table.empty() || id.empty()) {
        return error_response("table and id are required");
    }
    if (!req.contains("data")) {
        return error_response("data is required");
    }

    store_.update(table, id, fields_from_json(req["data"]));
    return ok_response(json{{"id", id}});
}

json RecordHandlers::handle_delete(const json& req) {
    std::string table = string_field(req, "table");
    std::string id = string_field(req, "id");
    if (table.empty() || id.empty()) {
        return error_response("table and id are required");
    }

    store_.erase(table, id);
    return ok_response(json{{"id", id}});
}

json RecordHandlers::handle_count(const json& req) {
    std::string table = string_field(req, "table");
    if (table.empty()) {
        return error_response("table is required");
    }
    return ok_response(json{{"count", store_.count(table)}});
}

} // namespace tabula::server
