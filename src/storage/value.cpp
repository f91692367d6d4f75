#include "storage/value.hpp"
#include <algorithm>

namespace tabula::storage {

std::optional<bool> Value::as_bool() const {
    if (auto* b = std::get_if<bool>(&data_)) return *b;
    return std::nullopt;
}

std::optional<int64_t> Value::as_int() const {
    if (auto* i = std::get_if<int64_t>(&data_)) return *i;
    return std::nullopt;
}

std::optional<double> Value::as_float() const {
    if (auto* d = std::get_if<double>(&data_)) return *d;
    return std::nullopt;
}

const std::string* Value::as_string() const {
    return std::get_if<std::string>(&data_);
}

const Value::Bytes* Value::as_bytes() const {
    return std::get_if<Bytes>(&data_);
}

const Value::Array* Value::as_array() const {
    return std::get_if<Array>(&data_);
}

const Value::Object* Value::as_object() const {
    return std::get_if<Object>(&data_);
}

size_t Value::depth() const {
    size_t deepest = 0;
    if (auto* arr = as_array()) {
        for (const auto& item : *arr) {
            deepest = std::max(deepest, item.depth());
        }
    } else if (auto* obj = as_object()) {
        for (const auto& [key, item] : *obj) {
            deepest = std::max(deepest, item.depth());
        }
    }
    return deepest + 1;
}

bool Value::within_depth(size_t limit) const {
    if (limit == 0) {
        return false;
    }

    if (auto* arr = as_array()) {
        return std::all_of(arr->begin(), arr->end(),
                           [limit](const Value& v) { return v.within_depth(limit - 1); });
    }
    if (auto* obj = as_object()) {
        return std::all_of(obj->begin(), obj->end(),
                           [limit](const auto& kv) { return kv.second.within_depth(limit - 1); });
    }
    return true;
}

} // namespace tabula::storage
