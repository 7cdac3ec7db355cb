#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace kutyus {

// Reads a `key = value` config file into `out`. Keys not present keep the
// values already in `out`. Recognized keys:
//   limits.max_content_type_bytes   limits.max_content_bytes
//   store.directory                 store.record_rejections
//   logging.level                   logging.pattern
Result load_config(std::string_view path, CoreConfig& out);
Result parse_config(std::string_view text, CoreConfig& out);

// Applies KUTYUS_STORE_DIR, KUTYUS_LOG_LEVEL and KUTYUS_LOG_PATTERN.
void apply_env_overrides(CoreConfig& config);

Result check_config(const CoreConfig& config);

// Commented template listing every key with its default.
std::string_view default_config_text();

}  // namespace kutyus
