#pragma once
#include <nlohmann/json.hpp>
#include "storage/record.hpp"

namespace tabula::server {

// Request JSON -> Value. Integers become INT, other numbers FLOAT, the
// {"$bytes": "<base64>"} shape becomes BYTES. Throws StoreError(SERIALIZATION)
// for bad base64, integers beyond int64 or nesting beyond kMaxValueDepth.
storage::Value value_from_json(const nlohmann::json& j);
nlohmann::json value_to_json(const storage::Value& value);

// Throws StoreError(SERIALIZATION) unless j is an object.
storage::Fields fields_from_json(const nlohmann::json& j);
nlohmann::json fields_to_json(const storage::Fields& fields);

nlohmann::json record_to_json(const storage::Record& record);

} // namespace tabula::server
