#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace kutyus::crypto {

// SHA-512 over arbitrary bytes.
Digest digest(std::string_view bytes);

// Content address of a message: digest(encode_message(message)).
Digest message_id(const Message& message);

// Link value for the next message of the feed: digest over the full signed
// frame encoding, signature included.
Digest frame_digest(const Frame& frame);

// `previous` of every genesis message.
constexpr Digest genesis_previous() {
  return Digest{};
}

[[nodiscard]] inline bool is_genesis_previous(const Digest& previous) {
  return previous == genesis_previous();
}

}  // namespace kutyus::crypto
