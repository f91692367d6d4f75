#include "server/json_convert.hpp"
#include "storage/codec.hpp"
#include "storage/error.hpp"

using json = nlohmann::json;
using tabula::storage::codec::BytesForm;

namespace tabula::server {

storage::Value value_from_json(const json& j) {
    return storage::codec::value_from_json(j, BytesForm::BASE64_OBJECT);
}

json value_to_json(const storage::Value& value) {
    return storage::codec::value_to_json(value, BytesForm::BASE64_OBJECT);
}

storage::Fields fields_from_json(const json& j) {
    if (!j.is_object()) {
        throw storage::StoreError(storage::ErrorCode::SERIALIZATION, "record data must be a JSON object");
    }

    storage::Fields fields;
    for (auto it = j.begin(); it != j.end(); ++it) {
        fields.emplace(it.key(), value_from_json(it.value()));
    }
    return fields;
}

json fields_to_json(const storage::Fields& fields) {
    json obj = json::object();
    for (const auto& [key, value] : fields) {
        obj[key] = value_to_json(value);
    }
    return obj;
}

json record_to_json(const storage::Record& record) {
    json j;
    j["id"] = record.id;
    j["data"] = fields_to_json(record.data);
    j["created_at"] = record.created_at;
    j["updated_at"] = record.updated_at;
    return j;
}

} // namespace tabula::server
