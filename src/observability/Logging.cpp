/**
 * @file Logging.cpp
 * @brief Structured logging implementation
 * @copyright Dedup record linkage toolkit
 */

#include "dedup/observability/Logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dedup {
namespace observability {

namespace {

constexpr const char* LOGGER_NAME = "dedup";
constexpr const char* DEFAULT_PATTERN = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string resolveLevel(const LoggingConfig& config) {
    if (const char* level = std::getenv("DEDUP_LOG_LEVEL")) {
        return level;
    }
    if (!config.level.empty()) {
        return config.level;
    }
    return "info";
}

std::string resolvePattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("DEDUP_LOG_PATTERN")) {
        return pattern;
    }
    if (!config.pattern.empty()) {
        return config.pattern;
    }
    return DEFAULT_PATTERN;
}

std::string serializeFields(std::initializer_list<LogField> fields) {
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

}  // anonymous namespace

LogField stringField(std::string_view key, std::string_view value) {
    return {std::string(key), std::string(value)};
}

LogField intField(std::string_view key, std::int64_t value) {
    return {std::string(key), std::to_string(value)};
}

LogField doubleField(std::string_view key, double value) {
    std::ostringstream out;
    out << value;
    return {std::string(key), out.str()};
}

LogField boolField(std::string_view key, bool value) {
    return {std::string(key), value ? "true" : "false"};
}

void initializeLogging(const LoggingConfig& config) {
    spdlog::drop(LOGGER_NAME);
    auto logger = spdlog::stdout_color_mt(LOGGER_NAME);
    logger->set_pattern(resolvePattern(config));
    logger->set_level(spdlog::level::from_str(resolveLevel(config)));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdownLogging() {
    spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
    auto serialized = serializeFields(fields);
    if (!serialized.empty()) {
        spdlog::log(level, "{} {}", message, serialized);
        return;
    }
    spdlog::log(level, "{}", message);
}

} // namespace observability
} // namespace dedup
