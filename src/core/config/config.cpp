#include "core/config/config.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

#include "core/observability/logging.hpp"
#include "core/util/text.hpp"

namespace kutyus {
namespace {

constexpr std::string_view kDefaultConfigFile = R"(# kutyus core configuration
# limits.max_content_type_bytes = 255
# limits.max_content_bytes = 1048576
# store.directory =
# store.record_rejections = true
# logging.level = info
# logging.pattern = %Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v
)";

Result config_error(std::string msg) {
  return Result::failure(ErrorCode::ConfigError, std::move(msg));
}

Result set_size(const std::string& key, const std::string& value, std::size_t& field) {
  const auto parsed = util::parse_unsigned(value);
  if (!parsed.has_value()) {
    return config_error("Config key " + key + " expects an unsigned integer, got '" + value + "'.");
  }
  field = static_cast<std::size_t>(*parsed);
  return Result::success();
}

Result set_bool(const std::string& key, const std::string& value, bool& field) {
  const auto parsed = util::parse_bool(value);
  if (!parsed.has_value()) {
    return config_error("Config key " + key + " expects a boolean, got '" + value + "'.");
  }
  field = *parsed;
  return Result::success();
}

}  // namespace

std::string_view default_config_text() {
  return kDefaultConfigFile;
}

Result parse_config(std::string_view text, CoreConfig& out) {
  std::string bad_line;
  const auto values = util::parse_key_values(text, &bad_line);
  if (!values.has_value()) {
    return config_error("Config line is not key = value: '" + bad_line + "'.");
  }

  CoreConfig config = out;
  for (const auto& [key, value] : *values) {
    Result applied = Result::success();
    if (key == "limits.max_content_type_bytes") {
      applied = set_size(key, value, config.limits.max_content_type_bytes);
    } else if (key == "limits.max_content_bytes") {
      applied = set_size(key, value, config.limits.max_content_bytes);
    } else if (key == "store.directory") {
      config.store.directory = value;
    } else if (key == "store.record_rejections") {
      applied = set_bool(key, value, config.store.record_rejections);
    } else if (key == "logging.level") {
      config.logging.level = util::lowercase_copy(value);
    } else if (key == "logging.pattern") {
      config.logging.pattern = value;
    } else {
      applied = config_error("Unknown config key '" + key + "'.");
    }
    if (!applied.ok) {
      return applied;
    }
  }

  const Result checked = check_config(config);
  if (!checked.ok) {
    return checked;
  }

  out = std::move(config);
  return Result::success("Config parsed.");
}

Result load_config(std::string_view path, CoreConfig& out) {
  const std::filesystem::path file{std::string{path}};
  std::ifstream in(file, std::ios::in | std::ios::binary);
  if (!in) {
    return Result::failure(ErrorCode::IoError, "Config file could not be read: " + file.string());
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  Result parsed = parse_config(ss.str(), out);
  if (parsed.ok) {
    parsed.data = file.string();
  }
  return parsed;
}

void apply_env_overrides(CoreConfig& config) {
  if (const char* dir = std::getenv("KUTYUS_STORE_DIR")) {
    config.store.directory = dir;
  }
  if (const char* level = std::getenv("KUTYUS_LOG_LEVEL")) {
    config.logging.level = util::lowercase_copy(level);
  }
  if (const char* pattern = std::getenv("KUTYUS_LOG_PATTERN")) {
    config.logging.pattern = pattern;
  }
}

Result check_config(const CoreConfig& config) {
  if (config.limits.max_content_type_bytes == 0 ||
      config.limits.max_content_type_bytes > std::numeric_limits<std::uint16_t>::max()) {
    return config_error("limits.max_content_type_bytes must be between 1 and 65535.");
  }
  // The embedded message length is a u32.
  if (config.limits.max_message_bytes() > std::numeric_limits<std::uint32_t>::max()) {
    return config_error("limits.max_content_bytes is too large for the frame format.");
  }

  if (!observability::IsLogLevel(config.logging.level)) {
    return config_error("logging.level '" + config.logging.level + "' is not a log level.");
  }
  return Result::success();
}

}  // namespace kutyus
