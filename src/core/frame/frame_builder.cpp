#include "core/frame/frame_builder.hpp"

#include <utility>

#include "core/codec/codec.hpp"
#include "core/crypto/hasher.hpp"

namespace kutyus {

Result build_frame(const crypto::Signer& signer, const PublicKey& author, std::uint64_t sequence,
                   const Digest& previous, std::int64_t timestamp, const Content& content,
                   Frame& out, const ValidationLimits& limits) {
  if (sequence < 1) {
    return Result::failure(ErrorCode::InvalidSequence, "Frame sequence must be at least 1.");
  }
  if (signer.public_key() != author) {
    return Result::failure(ErrorCode::AuthorKeyMismatch,
                           "Signer key does not belong to the frame author.");
  }

  Frame frame;
  frame.message.author = author;
  frame.message.sequence = sequence;
  frame.message.previous = previous;
  frame.message.timestamp = timestamp;
  frame.message.content = content;

  const Result fields = codec::check_message(frame.message, limits);
  if (!fields.ok) {
    return fields;
  }

  frame.id = crypto::message_id(frame.message);
  frame.signature = signer.sign(codec::signing_payload(frame.id, frame.message));

  out = std::move(frame);
  return Result::success("Frame built.");
}

Result build_next_frame(const crypto::Signer& signer, const FeedState& state,
                        std::int64_t timestamp, const Content& content, Frame& out,
                        const ValidationLimits& limits) {
  if (state.is_empty()) {
    return build_frame(signer, signer.public_key(), 1, crypto::genesis_previous(), timestamp,
                       content, out, limits);
  }

  const Frame& last = *state.last;
  return build_frame(signer, last.message.author, last.message.sequence + 1,
                     crypto::frame_digest(last), timestamp, content, out, limits);
}

}  // namespace kutyus
