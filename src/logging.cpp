// =============================================================================
// logging.cpp - spdlog setup and structured log lines
// =============================================================================

#include "podium/logging.hpp"
#include "podium/config.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace podium::observability {

namespace {

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("PODIUM_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? "info" : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("PODIUM_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern.empty() ? "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v" : config.pattern;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
    std::ostringstream out;
    bool first = true;
    for (const auto& field : fields) {
        if (!first) {
            out << ' ';
        }
        first = false;
        out << field.key << '=' << field.value;
    }
    return out.str();
}

} // namespace

LogField string_field(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField uint_field(std::string_view key, uint64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField bool_field(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

LogField address_field(std::string_view key, const Address& value) {
    return {std::string(key), to_hex(value)};
}

void initialize_logging(const LoggingConfig& config) {
    auto logger = spdlog::get(config.logger_name);
    if (!logger) {
        logger = spdlog::stdout_color_mt(config.logger_name);
    }
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto serialized = serialize_fields(fields);
    if (serialized.empty()) {
        spdlog::log(level, "{}", message);
        return;
    }
    spdlog::log(level, "{} {}", message, serialized);
}

} // namespace podium::observability
