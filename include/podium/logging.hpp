#ifndef PODIUM_LOGGING_HPP
#define PODIUM_LOGGING_HPP

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "types.hpp"

namespace podium {

struct LoggingConfig;

namespace observability {

struct LogField {
    std::string key;
    std::string value;
};

LogField string_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, int64_t value);
LogField uint_field(std::string_view key, uint64_t value);
LogField bool_field(std::string_view key, bool value);
LogField address_field(std::string_view key, const Address& value);

// Installs a stdout logger as the spdlog default. PODIUM_LOG_LEVEL and
// PODIUM_LOG_PATTERN override the config.
void initialize_logging(const LoggingConfig& config);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace observability
} // namespace podium

#define PODIUM_LOG_DEBUG(message, ...) ::podium::observability::log_debug((message), ##__VA_ARGS__)
#define PODIUM_LOG_INFO(message, ...) ::podium::observability::log_info((message), ##__VA_ARGS__)
#define PODIUM_LOG_WARN(message, ...) ::podium::observability::log_warn((message), ##__VA_ARGS__)
#define PODIUM_LOG_ERROR(message, ...) ::podium::observability::log_error((message), ##__VA_ARGS__)

#endif // PODIUM_LOGGING_HPP
