#include "server/request_router.hpp"
#include "server/handlers.hpp"
#include "storage/error.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace tabula::server {

json ok_response(const json& data) {
    json response;
    response["success"] = true;
    if (!data.is_null()) {
        response["data"] = data;
    }
    return response;
}

json error_response(const std::string& message, const std::string& code) {
    json response;
    response["success"] = false;
    response["error"] = message;
    response["code"] = code;
    return response;
}

std::string to_wire(const json& response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

RequestRouter::RequestRouter(storage::Store& store, bool auto_save)
    : store_(store), auto_save_(auto_save) {
    add_module(std::make_unique<RecordHandlers>(store_));
    add_module(std::make_unique<TableHandlers>(store_));
}

json RequestRouter::handle(const json& request) {
    if (!request.is_object()) {
        return error_response("request must be a JSON object");
    }

    auto op_field = request.find("op");
    if (op_field == request.end() || !op_field->is_string()) {
        return error_response("op must be a string");
    }

    std::string op_name = op_field->get<std::string>();
    RequestOp op = request_op_from_string(op_name);
    auto it = handlers_.find(op);
    if (it == handlers_.end()) {
        spdlog::warn("Unknown request op: '{}'", op_name);
        return error_response("unknown op '" + op_name + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    json response;
    try {
        response = it->second(request);
    } catch (const storage::StoreError& e) {
        spdlog::debug("Request '{}' failed: {}", op_name, e.what());
        return error_response(e.what(), storage::error_code_to_string(e.code()));
    } catch (const json::exception& e) {
        return error_response(std::string("invalid request: ") + e.what());
    }

    if (auto_save_ && request_op_mutates(op) && response.value("success", false)) {
        save_after(op_name, response);
    }
    return response;
}

void RequestRouter::save_after(const std::string& op_name, json& response) {
    // The mutation is already applied in memory; a failed save only means it
    // is not on disk yet and stays pending for the next save.
    try {
        store_.save_all();
        response["saved"] = true;
    } catch (const storage::StoreError& e) {
        spdlog::warn("Auto-save after '{}' failed: {}", op_name, e.what());
        response["saved"] = false;
        response["save_error"] = e.what();
        response["save_code"] = storage::error_code_to_string(e.code());
    }
}

json RequestRouter::handle_raw(const std::string& body) {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::parse_error& e) {
        return error_response(std::string("JSON parse error: ") + e.what());
    }
    return handle(request);
}

void RequestRouter::register_handler(RequestOp op, Handler handler) {
    handlers_[op] = std::move(handler);
}

void RequestRouter::add_module(std::unique_ptr<RouterModule> module) {
    module->register_handlers(*this);
    modules_.push_back(std::move(module));
}

} // namespace tabula::server
