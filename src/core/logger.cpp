#include "core/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tabula::core {

void init_logger() {
    static bool initialized = false;
    if (initialized) return;
    initialized = true;

    auto logger = spdlog::stdout_color_mt("tabula");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> log_level_from_string(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    return std::nullopt;
}

} // namespace tabula::core
