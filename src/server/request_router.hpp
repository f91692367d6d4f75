#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "server/module.hpp"
#include "storage/store.hpp"

namespace tabula::server {

enum class RequestOp {
    INSERT,
    FIND,
    UPDATE,
    DELETE,
    TABLES,
    COUNT,
    SAVE,
    CREATE_TABLE,
    DROP_TABLE,
    UNKNOWN
};

inline const char* request_op_to_string(RequestOp op) {
    switch (op) {
        case RequestOp::INSERT:       return "insert";
        case RequestOp::FIND:         return "find";
        case RequestOp::UPDATE:       return "update";
        case RequestOp::DELETE:       return "delete";
        case RequestOp::TABLES:       return "tables";
        case RequestOp::COUNT:        return "count";
        case RequestOp::SAVE:         return "save";
        case RequestOp::CREATE_TABLE: return "create_table";
        case RequestOp::DROP_TABLE:   return "drop_table";
        default: return "unknown";
    }
}

inline RequestOp request_op_from_string(const std::string& str) {
    if (str == "insert")       return RequestOp::INSERT;
    if (str == "find")         return RequestOp::FIND;
    if (str == "update")       return RequestOp::UPDATE;
    if (str == "delete")       return RequestOp::DELETE;
    if (str == "tables")       return RequestOp::TABLES;
    if (str == "count")        return RequestOp::COUNT;
    if (str == "save")         return RequestOp::SAVE;
    if (str == "create_table") return RequestOp::CREATE_TABLE;
    if (str == "drop_table")   return RequestOp::DROP_TABLE;
    return RequestOp::UNKNOWN;
}

// Operations that change the store and trigger an auto-save.
inline bool request_op_mutates(RequestOp op) {
    return op == RequestOp::INSERT || op == RequestOp::UPDATE || op == RequestOp::DELETE ||
           op == RequestOp::CREATE_TABLE || op == RequestOp::DROP_TABLE;
}

// Response envelopes: {"success": true, "data": ...} and
// {"success": false, "error": "...", "code": "..."}.
nlohmann::json ok_response(const nlohmann::json& data = nullptr);
nlohmann::json error_response(const std::string& message, const std::string& code = "BAD_REQUEST");

// Serialize a response; invalid UTF-8 in stored strings is replaced, not thrown.
std::string to_wire(const nlohmann::json& response);

/**
 * Dispatch table from request envelopes to store operations.
 *
 * Envelope: {"op": "...", "table": "...", "id"?: "...", "data"?: {...},
 * "query"?: {...}}. Every call holds one mutex for its whole duration,
 * including any save, so concurrent callers never interleave on the store.
 * Store errors come back as error responses, never as exceptions.
 *
 * With auto_save, a successful mutation is followed by save_all() and the
 * reply carries "saved": true, or "saved": false with "save_error" and
 * "save_code". The mutation stays applied either way.
 */
class RequestRouter {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    explicit RequestRouter(storage::Store& store, bool auto_save = true);

    nlohmann::json handle(const nlohmann::json& request);

    // Parses body as the envelope; malformed JSON becomes an error response.
    nlohmann::json handle_raw(const std::string& body);

    void register_handler(RequestOp op, Handler handler);

    // Takes ownership and lets the module register its handlers.
    void add_module(std::unique_ptr<RouterModule> module);

    storage::Store& store() { return store_; }

private:
    storage::Store& store_;
    bool auto_save_;
    std::unordered_map<RequestOp, Handler> handlers_;
    std::vector<std::unique_ptr<RouterModule>> modules_;
    std::mutex mutex_;

    void save_after(const std::string& op_name, nlohmann::json& response);
};

} // namespace tabula::server
