#include "core/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "core/util/text.hpp"

namespace kutyus::observability {
namespace {

constexpr const char* kLoggerName = "kutyus";

constexpr std::string_view kLevels[] = {"trace", "debug",    "info", "warn",
                                        "warning", "error", "critical", "off"};

// spdlog maps unknown names to "off", so only known names get through.
std::string ResolveLevel(const LoggingConfig& config, bool& env_ignored) {
  env_ignored = false;
  if (const char* level = std::getenv("KUTYUS_LOG_LEVEL")) {
    std::string requested = util::lowercase_copy(level);
    if (IsLogLevel(requested)) {
      return requested;
    }
    env_ignored = true;
  }
  if (IsLogLevel(config.level)) {
    return config.level;
  }
  return "info";
}

std::string ResolvePattern(const LoggingConfig& config) {
  if (const char* pattern = std::getenv("KUTYUS_LOG_PATTERN")) {
    return pattern;
  }
  if (!config.pattern.empty()) {
    return config.pattern;
  }
  return LoggingConfig{}.pattern;
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
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

}  // namespace

bool IsLogLevel(std::string_view level) {
  for (const auto known : kLevels) {
    if (level == known) {
      return true;
    }
  }
  return false;
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

// Authors are logged by their first 8 bytes.
LogField KeyField(std::string_view key, const PublicKey& value) {
  return {std::string(key), util::to_hex(value).substr(0, 16)};
}

void InitializeLogging(const LoggingConfig& config) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  bool env_ignored = false;
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config, env_ignored)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
  if (env_ignored) {
    LogWarn("KUTYUS_LOG_LEVEL ignored", {StringField("value", std::getenv("KUTYUS_LOG_LEVEL"))});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  const auto serialized_fields = SerializeFields(fields);
  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

}  // namespace kutyus::observability
