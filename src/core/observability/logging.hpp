#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace kutyus::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField KeyField(std::string_view key, const PublicKey& value);

// True for the level names accepted by logging.level and KUTYUS_LOG_LEVEL.
bool IsLogLevel(std::string_view level);

// Installs the "kutyus" logger as spdlog's default. KUTYUS_LOG_LEVEL and
// KUTYUS_LOG_PATTERN override the configured values; an unknown
// KUTYUS_LOG_LEVEL is ignored with a warning. Calling it again
// reapplies level and pattern to the existing logger.
void InitializeLogging(const LoggingConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

}  // namespace kutyus::observability

#define KUTYUS_LOG_DEBUG(message, ...) \
  ::kutyus::observability::LogDebug((message) __VA_OPT__(, ) __VA_ARGS__)
#define KUTYUS_LOG_INFO(message, ...) \
  ::kutyus::observability::LogInfo((message) __VA_OPT__(, ) __VA_ARGS__)
#define KUTYUS_LOG_WARN(message, ...) \
  ::kutyus::observability::LogWarn((message) __VA_OPT__(, ) __VA_ARGS__)
#define KUTYUS_LOG_ERROR(message, ...) \
  ::kutyus::observability::LogError((message) __VA_OPT__(, ) __VA_ARGS__)
