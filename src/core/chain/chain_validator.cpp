#include "core/chain/chain_validator.hpp"

#include <string>
#include <utility>

#include "core/codec/codec.hpp"
#include "core/crypto/hasher.hpp"

namespace kutyus {
namespace {

ValidationOutcome check_genesis(const Frame& candidate, const FeedState& state) {
  const Message& message = candidate.message;
  if (message.sequence != 1) {
    return ValidationOutcome::reject(
        ErrorCode::InvalidGenesis,
        "First frame of a feed has sequence " + std::to_string(message.sequence) + ", expected 1.",
        state);
  }
  if (!crypto::is_genesis_previous(message.previous)) {
    return ValidationOutcome::reject(ErrorCode::InvalidGenesis,
                                     "First frame of a feed links to a previous frame.", state);
  }
  return ValidationOutcome::accept(FeedState::linked(candidate));
}

ValidationOutcome check_link(const Frame& candidate, const FeedState& state) {
  const Message& message = candidate.message;
  const Frame& prev = *state.last;

  if (message.author != prev.message.author) {
    return ValidationOutcome::reject(ErrorCode::AuthorMismatch,
                                     "Frame author differs from the feed author.", state);
  }
  if (message.sequence != prev.message.sequence + 1) {
    return ValidationOutcome::reject(ErrorCode::SequenceGap,
                                     "Expected sequence " + std::to_string(prev.message.sequence + 1) +
                                         ", got " + std::to_string(message.sequence) + ".",
                                     state);
  }
  if (message.previous != crypto::frame_digest(prev)) {
    return ValidationOutcome::reject(ErrorCode::BrokenLink,
                                     "Previous link does not match the last accepted frame.", state);
  }
  if (message.timestamp < prev.message.timestamp) {
    return ValidationOutcome::reject(ErrorCode::TimeRegression,
                                     "Timestamp " + std::to_string(message.timestamp) +
                                         " is older than " + std::to_string(prev.message.timestamp) +
                                         ".",
                                     state);
  }
  return ValidationOutcome::accept(FeedState::linked(candidate));
}

}  // namespace

ChainValidator::ChainValidator(const crypto::Verifier& verifier, ValidationLimits limits)
    : verifier_(&verifier), limits_(limits) {}

ValidationOutcome ChainValidator::validate(const Frame& candidate, const FeedState& state) const {
  // Anything accepted here must survive encode/decode, or a journaled frame
  // would be dropped on replay.
  const Result fields = codec::check_message(candidate.message, limits_);
  if (!fields.ok) {
    return ValidationOutcome::reject(fields.code, fields.message, state);
  }

  if (crypto::message_id(candidate.message) != candidate.id) {
    return ValidationOutcome::reject(ErrorCode::IdMismatch,
                                     "Frame id is not the digest of its message.", state);
  }

  const std::string payload = codec::signing_payload(candidate.id, candidate.message);
  if (!verifier_->verify(candidate.message.author, payload, candidate.signature)) {
    return ValidationOutcome::reject(ErrorCode::BadSignature,
                                     "Signature does not verify under the author key.", state);
  }

  if (state.is_empty()) {
    return check_genesis(candidate, state);
  }
  return check_link(candidate, state);
}

ValidationOutcome ChainValidator::validate_bytes(std::string_view frame_bytes,
                                                 const FeedState& state) const {
  Frame candidate;
  const Result decoded = codec::decode_frame(frame_bytes, candidate, limits_);
  if (!decoded.ok) {
    return ValidationOutcome::reject(decoded.code, decoded.message, state);
  }
  return validate(candidate, state);
}

ChainOutcome ChainValidator::validate_chain(const std::vector<Frame>& frames,
                                            const FeedState& state) const {
  ChainOutcome chain;
  chain.last = ValidationOutcome::accept(state);

  for (const Frame& frame : frames) {
    ValidationOutcome outcome = validate(frame, chain.last.state);
    if (!outcome.accepted) {
      chain.last = std::move(outcome);
      return chain;
    }
    chain.last = std::move(outcome);
    ++chain.accepted_count;
  }
  return chain;
}

ValidationOutcome validate_frame(const Frame& candidate, const FeedState& state) {
  static const ChainValidator validator;
  return validator.validate(candidate, state);
}

}  // namespace kutyus
