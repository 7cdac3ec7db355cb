#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace kutyus::util {

std::int64_t unix_timestamp_now();

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::string to_hex(std::string_view bytes);
std::optional<std::string> from_hex(std::string_view hex);

std::string to_hex(const std::array<std::uint8_t, 32>& bytes);
std::string to_hex(const std::array<std::uint8_t, 64>& bytes);

// Parses `key = value` lines. Blank lines and lines starting with '#' are
// skipped. Returns nullopt on the first line without '=' and reports it.
std::optional<std::map<std::string, std::string>> parse_key_values(std::string_view text,
                                                                   std::string* bad_line = nullptr);

std::optional<bool> parse_bool(std::string_view value);
std::optional<std::uint64_t> parse_unsigned(std::string_view value);

}  // namespace kutyus::util
