#pragma once
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace tabula::core {

// Install the colored stdout logger as spdlog's default (idempotent).
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off".
std::optional<spdlog::level::level_enum> log_level_from_string(const std::string& name);

} // namespace tabula::core
