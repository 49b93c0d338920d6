/**
 * @file Logging.hpp
 * @brief Structured logging on top of spdlog
 * @copyright Dedup record linkage toolkit
 */

#ifndef DEDUP_OBSERVABILITY_LOGGING_HPP
#define DEDUP_OBSERVABILITY_LOGGING_HPP

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace dedup {
namespace observability {

/**
 * @brief Logging configuration
 *
 * DEDUP_LOG_LEVEL and DEDUP_LOG_PATTERN in the environment take precedence.
 */
struct LoggingConfig {
    std::string level = "info";     // trace, debug, info, warn, error, critical, off
    std::string pattern;            // spdlog pattern, empty for the default
};

/**
 * @brief key=value suffix appended to a log line
 */
struct LogField {
    std::string key;
    std::string value;
};

LogField stringField(std::string_view key, std::string_view value);
LogField intField(std::string_view key, std::int64_t value);
LogField doubleField(std::string_view key, double value);
LogField boolField(std::string_view key, bool value);

/**
 * @brief Install the "dedup" logger as spdlog's default logger
 *
 * Safe to call more than once; the previous logger is replaced.
 */
void initializeLogging(const LoggingConfig& config);
void shutdownLogging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void logDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::debug, message, fields);
}

inline void logInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::info, message, fields);
}

inline void logWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::warn, message, fields);
}

inline void logError(std::string_view message, std::initializer_list<LogField> fields = {}) {
    log(spdlog::level::err, message, fields);
}

} // namespace observability
} // namespace dedup

#define DEDUP_LOG_DEBUG(message, ...) ::dedup::observability::logDebug((message), ##__VA_ARGS__)
#define DEDUP_LOG_INFO(message, ...) ::dedup::observability::logInfo((message), ##__VA_ARGS__)
#define DEDUP_LOG_WARN(message, ...) ::dedup::observability::logWarn((message), ##__VA_ARGS__)
#define DEDUP_LOG_ERROR(message, ...) ::dedup::observability::logError((message), ##__VA_ARGS__)

#endif // DEDUP_OBSERVABILITY_LOGGING_HPP
