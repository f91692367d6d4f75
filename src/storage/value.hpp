#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula::storage {

// Maximum nesting of Array/Object values accepted by the store and the codec.
constexpr size_t kMaxValueDepth = 64;

enum class ValueType {
    NULL_VALUE,
    BOOL,
    INT,
    FLOAT,
    STRING,
    BYTES,
    ARRAY,
    OBJECT
};

inline const char* value_type_to_string(ValueType type) {
    switch (type) {
        case ValueType::NULL_VALUE: return "null";
        case ValueType::BOOL:       return "bool";
        case ValueType::INT:        return "int";
        case ValueType::FLOAT:      return "float";
        case ValueType::STRING:     return "string";
        case ValueType::BYTES:      return "bytes";
        case ValueType::ARRAY:      return "array";
        case ValueType::OBJECT:     return "object";
        default: return "unknown";
    }
}

/**
 * A storable field value.
 *
 * Equality is structural and never coerces between INT and FLOAT, so
 * Value(1) != Value(1.0). The as_* accessors return an empty view for any
 * other variant instead of failing.
 */
class Value {
public:
    using Bytes = std::vector<uint8_t>;
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    // Any integral type except bool. Unsigned values above INT64_MAX wrap.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    ValueType type() const { return static_cast<ValueType>(data_.index()); }

    bool is_null() const { return type() == ValueType::NULL_VALUE; }

    std::optional<bool> as_bool() const;
    std::optional<int64_t> as_int() const;
    std::optional<double> as_float() const;
    const std::string* as_string() const;
    const Bytes* as_bytes() const;
    const Array* as_array() const;
    const Object* as_object() const;

    // Nesting depth: scalars and empty containers are 1.
    size_t depth() const;

    // True if depth() <= limit. Stops descending once the limit is reached.
    bool within_depth(size_t limit) const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    // Alternative order matches ValueType.
    std::variant<std::monostate, bool, int64_t, double, std::string, Bytes, Array, Object> data_;
};

} // namespace tabula::storage
