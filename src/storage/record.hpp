#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include "storage/value.hpp"

namespace tabula::storage {

// Field name -> value. Keys are unique; order carries no meaning.
using Fields = Value::Object;

struct Record {
    std::string id;
    Fields data;
    uint64_t created_at = 0;   // Seconds since epoch
    uint64_t updated_at = 0;

    // New record with a fresh random id and both timestamps set to now.
    static Record create(Fields data);

    // Replace the whole field map (no per-field merge) and touch updated_at.
    void replace(Fields data);

    bool operator==(const Record& other) const {
        return id == other.id && data == other.data &&
               created_at == other.created_at && updated_at == other.updated_at;
    }
    bool operator!=(const Record& other) const { return !(*this == other); }
};

// id -> Record. Iteration order is unspecified.
using RecordIndex = std::unordered_map<std::string, Record>;

// Random RFC 4122 version 4 identifier in canonical text form.
std::string generate_record_id();

// Current wall-clock time in seconds since the Unix epoch.
uint64_t unix_now();

} // namespace tabula::storage
