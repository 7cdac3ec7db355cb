#pragma once

#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace kutyus::codec {

// Canonical message layout (all integers big-endian):
//   u8 version | author[32] | u64 sequence | previous[64] | i64 timestamp |
//   u16 type_len | type | u32 content_len | content
// Fixed widths and a single field order give every message exactly one
// encoding. Callers that accept untrusted input run check_message first;
// encode_message itself never fails.
std::string encode_message(const Message& message);
Result decode_message(std::string_view bytes, Message& out, const ValidationLimits& limits = {});

// Field constraints a message must satisfy to be encoded or accepted.
Result check_message(const Message& message, const ValidationLimits& limits = {});

// The bytes covered by a frame signature: the frame encoding without its
// trailing signature.
std::string signing_payload(const Digest& id, const Message& message);

// Frame layout: u8 version | id[64] | u32 message_len | message | signature[64]
std::string encode_frame(const Frame& frame);
Result decode_frame(std::string_view bytes, Frame& out, const ValidationLimits& limits = {});

}  // namespace kutyus::codec
