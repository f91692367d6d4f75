#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "storage/record.hpp"

namespace tabula::storage::codec {

// Snapshot of a table index as MessagePack:
//   { id: { "id": str, "data": map, "created_at": uint, "updated_at": uint }, ... }
// Value variants map onto nil/bool/int/float/str/bin/array/map.
// All functions throw StoreError(SERIALIZATION) on failure.

std::vector<uint8_t> encode_snapshot(const RecordIndex& records);
RecordIndex decode_snapshot(const std::vector<uint8_t>& bytes);

// How Bytes appear in json: json::binary_t for MessagePack, or the
// {"$bytes": "<base64>"} object for text JSON.
enum class BytesForm {
    BINARY,
    BASE64_OBJECT
};

constexpr const char* kBytesKey = "$bytes";

// Value <-> json. Decoding maps integers to INT and other numbers to FLOAT,
// and is bounded by kMaxValueDepth without recursing past it.
nlohmann::json value_to_json(const Value& value, BytesForm form = BytesForm::BINARY);
Value value_from_json(const nlohmann::json& j, BytesForm form = BytesForm::BINARY);

// Standard alphabet with '=' padding. Decoding returns nullopt for a length
// that is not a multiple of 4, characters outside the alphabet, or '='
// anywhere but the last two positions.
std::string base64_encode(const std::vector<uint8_t>& bytes);
std::optional<std::vector<uint8_t>> base64_decode(const std::string& text);

} // namespace tabula::storage::codec
