#include "storage/record.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <random>

namespace tabula::storage {

Record Record::create(Fields data) {
    Record record;
    record.id = generate_record_id();
    record.data = std::move(data);
    record.created_at = unix_now();
    record.updated_at = record.created_at;
    return record;
}

void Record::replace(Fields new_data) {
    data = std::move(new_data);
    // Clock steps backwards must not break created_at <= updated_at
    updated_at = std::max(unix_now(), created_at);
}

std::string generate_record_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

uint64_t unix_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

} // namespace tabula::storage
