#include "core/crypto/hasher.hpp"

#include <sodium.h>

#include "core/codec/codec.hpp"

namespace kutyus::crypto {

static_assert(crypto_hash_sha512_BYTES == kDigestBytes, "digest width must match SHA-512");

Digest digest(std::string_view bytes) {
  Digest out{};
  crypto_hash_sha512(out.data(), reinterpret_cast<const unsigned char*>(bytes.data()),
                     static_cast<unsigned long long>(bytes.size()));
  return out;
}

Digest message_id(const Message& message) {
  return digest(codec::encode_message(message));
}

Digest frame_digest(const Frame& frame) {
  return digest(codec::encode_frame(frame));
}

}  // namespace kutyus::crypto
