#include "storage/codec.hpp"
#include "storage/error.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <limits>
#include <string>

using json = nlohmann::json;

namespace tabula::storage::codec {

namespace {

// Snapshot map -> record map -> data map -> field values.
constexpr size_t kEnvelopeDepth = 3;

// SAX pass over raw MessagePack that rejects documents nested deeper than
// max_depth before any DOM is built.
class DepthGuard {
public:
    explicit DepthGuard(size_t max_depth) : max_depth_(max_depth) {}

    bool null() { return true; }
    bool boolean(bool) { return true; }
    bool number_integer(json::number_integer_t) { return true; }
    bool number_unsigned(json::number_unsigned_t) { return true; }
    bool number_float(json::number_float_t, const json::string_t&) { return true; }
    bool string(json::string_t&) { return true; }
    bool binary(json::binary_t&) { return true; }
    bool key(json::string_t&) { return true; }

    bool start_object(size_t) { return enter(); }
    bool end_object() { --depth_; return true; }
    bool start_array(size_t) { return enter(); }
    bool end_array() { --depth_; return true; }

    bool parse_error(size_t position, const std::string&, const json::exception& ex) {
        error_ = "malformed snapshot at byte " + std::to_string(position) + ": " + ex.what();
        return false;
    }

    const std::string& error() const { return error_; }

private:
    bool enter() {
        if (++depth_ > max_depth_) {
            error_ = "snapshot nesting exceeds " + std::to_string(max_depth_) + " levels";
            return false;
        }
        return true;
    }

    size_t max_depth_;
    size_t depth_ = 0;
    std::string error_;
};

[[noreturn]] void malformed(const std::string& what) {
    throw StoreError(ErrorCode::SERIALIZATION, what);
}

Value from_json_bounded(const json& j, BytesForm form, size_t depth_left) {
    if (depth_left == 0) {
        malformed("value nesting exceeds " + std::to_string(kMaxValueDepth) + " levels");
    }

    switch (j.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(j.get<bool>());
        case json::value_t::number_integer:
            return Value(j.get<int64_t>());
        case json::value_t::number_unsigned: {
            auto u = j.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                malformed("integer out of int64 range");
            }
            return Value(static_cast<int64_t>(u));
        }
        case json::value_t::number_float:
            return Value(j.get<double>());
        case json::value_t::string:
            return Value(j.get<std::string>());
        case json::value_t::binary: {
            const auto& bin = j.get_binary();
            return Value(Value::Bytes(bin.begin(), bin.end()));
        }
        case json::value_t::array: {
            Value::Array arr;
            arr.reserve(j.size());
            for (const auto& item : j) {
                arr.push_back(from_json_bounded(item, form, depth_left - 1));
            }
            return Value(std::move(arr));
        }
        case json::value_t::object: {
            if (form == BytesForm::BASE64_OBJECT && j.size() == 1 &&
                j.contains(kBytesKey) && j[kBytesKey].is_string()) {
                auto bytes = base64_decode(j[kBytesKey].get<std::string>());
                if (!bytes) {
                    malformed(std::string("invalid base64 in ") + kBytesKey + " value");
                }
                return Value(std::move(*bytes));
            }
            Value::Object obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                obj.emplace(it.key(), from_json_bounded(it.value(), form, depth_left - 1));
            }
            return Value(std::move(obj));
        }
        default:
            malformed("unsupported json value type");
    }
}

uint64_t read_timestamp(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number_unsigned()) {
        // Non-negative integers decode as unsigned
        malformed(std::string("record field '") + field + "' missing or not an unsigned integer");
    }
    return it->get<uint64_t>();
}

Record record_from_json(const std::string& key, const json& j) {
    if (!j.is_object()) {
        malformed("record '" + key + "' is not a map");
    }

    Record record;

    auto id = j.find("id");
    if (id == j.end() || !id->is_string()) {
        malformed("record '" + key + "' has no string id");
    }
    record.id = id->get<std::string>();
    if (record.id != key) {
        malformed("record id '" + record.id + "' does not match index key '" + key + "'");
    }

    auto data = j.find("data");
    if (data == j.end() || !data->is_object()) {
        malformed("record '" + key + "' has no data map");
    }
    for (auto it = data->begin(); it != data->end(); ++it) {
        record.data.emplace(it.key(), from_json_bounded(it.value(), BytesForm::BINARY, kMaxValueDepth));
    }

    record.created_at = read_timestamp(j, "created_at");
    record.updated_at = read_timestamp(j, "updated_at");
    if (record.created_at > record.updated_at) {
        malformed("record '" + key + "' has created_at after updated_at");
    }
    return record;
}

} // namespace

json value_to_json(const Value& value, BytesForm form) {
    switch (value.type()) {
        case ValueType::NULL_VALUE:
            return nullptr;
        case ValueType::BOOL:
            return *value.as_bool();
        case ValueType::INT:
            return *value.as_int();
        case ValueType::FLOAT:
            return *value.as_float();
        case ValueType::STRING:
            return *value.as_string();
        case ValueType::BYTES:
            if (form == BytesForm::BASE64_OBJECT) {
                return json{{kBytesKey, base64_encode(*value.as_bytes())}};
            }
            return json::binary(*value.as_bytes());
        case ValueType::ARRAY: {
            json arr = json::array();
            for (const auto& item : *value.as_array()) {
                arr.push_back(value_to_json(item, form));
            }
            return arr;
        }
        case ValueType::OBJECT: {
            json obj = json::object();
            for (const auto& [k, v] : *value.as_object()) {
                obj[k] = value_to_json(v, form);
            }
            return obj;
        }
    }
    malformed("unknown value type");
}

Value value_from_json(const json& j, BytesForm form) {
    return from_json_bounded(j, form, kMaxValueDepth);
}

std::string base64_encode(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        return "";
    }

    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              bytes.data(), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) {
        return std::vector<uint8_t>{};
    }
    if (text.size() % 4 != 0 || text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }

    // EVP_DecodeBlock reads '=' as a zero digit wherever it appears and
    // skips surrounding whitespace, so the shape is checked here
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (padding == 1 && text[text.size() - 2] == '=') padding++;
    for (size_t i = 0; i < text.size() - padding; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isalnum(c) && c != '+' && c != '/') {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(3 * text.size() / 4);
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) {
        return std::nullopt;
    }

    // Padding still counts as decoded zero bytes
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

std::vector<uint8_t> encode_snapshot(const RecordIndex& records) {
    json snapshot = json::object();

    for (const auto& [id, record] : records) {
        json data = json::object();
        for (const auto& [field, value] : record.data) {
            if (!value.within_depth(kMaxValueDepth)) {
                malformed("field '" + field + "' of record '" + id + "' nests deeper than " +
                          std::to_string(kMaxValueDepth) + " levels");
            }
            data[field] = value_to_json(value);
        }

        json entry;
        entry["id"] = record.id;
        entry["data"] = std::move(data);
        entry["created_at"] = record.created_at;
        entry["updated_at"] = record.updated_at;
        snapshot[id] = std::move(entry);
    }

    return json::to_msgpack(snapshot);
}

RecordIndex decode_snapshot(const std::vector<uint8_t>& bytes) {
    DepthGuard guard(kEnvelopeDepth + kMaxValueDepth);
    if (!json::sax_parse(bytes, &guard, json::input_format_t::msgpack)) {
        malformed(guard.error().empty() ? "malformed snapshot" : guard.error());
    }

    json snapshot;
    try {
        snapshot = json::from_msgpack(bytes);
    } catch (const json::exception& e) {
        malformed(std::string("malformed snapshot: ") + e.what());
    }

    if (!snapshot.is_object()) {
        malformed("snapshot root is not a map");
    }

    RecordIndex records;
    records.reserve(snapshot.size());
    for (auto it = snapshot.begin(); it != snapshot.end(); ++it) {
        records.emplace(it.key(), record_from_json(it.key(), it.value()));
    }
    return records;
}

} // namespace tabula::storage::codec
