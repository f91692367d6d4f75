#pragma once
#include <stdexcept>
#include <string>

namespace tabula::storage {

enum class ErrorCode {
    IO,                     // Directory or file unreadable/unwritable
    SERIALIZATION,          // Malformed snapshot payload or value too deep
    ENCRYPTION,             // Bad key length, or authentication failure
    TABLE_NOT_FOUND,
    RECORD_NOT_FOUND,
    DUPLICATE_IDENTIFIER,
    CONFIG
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::IO:                   return "IO";
        case ErrorCode::SERIALIZATION:        return "SERIALIZATION";
        case ErrorCode::ENCRYPTION:           return "ENCRYPTION";
        case ErrorCode::TABLE_NOT_FOUND:      return "TABLE_NOT_FOUND";
        case ErrorCode::RECORD_NOT_FOUND:     return "RECORD_NOT_FOUND";
        case ErrorCode::DUPLICATE_IDENTIFIER: return "DUPLICATE_IDENTIFIER";
        case ErrorCode::CONFIG:               return "CONFIG";
        default: return "UNKNOWN";
    }
}

// Every failure raised by the storage layer.
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace tabula::storage
