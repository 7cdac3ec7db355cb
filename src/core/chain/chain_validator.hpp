#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "core/crypto/signer.hpp"
#include "core/model/types.hpp"

namespace kutyus {

struct ChainOutcome {
  ValidationOutcome last;
  std::size_t accepted_count = 0;  // index of the rejected frame when !last.accepted
};

// Checks candidate frames against the last accepted frame of their feed.
//
// The validator keeps no feed state of its own: the caller passes the current
// FeedState in and stores the state returned in the outcome. Calls for
// distinct feeds may run concurrently; calls for the same feed must be
// serialized by the caller, because each one advances that feed's state.
class ChainValidator {
public:
  explicit ChainValidator(const crypto::Verifier& verifier = crypto::default_verifier(),
                          ValidationLimits limits = {});

  // Order of checks: message fields against limits(), id, signature, then
  // genesis or link rules. The first failing check decides the reason.
  [[nodiscard]] ValidationOutcome validate(const Frame& candidate, const FeedState& state) const;

  // Decodes a frame before validating it; decode failures are reported as
  // TruncatedInput, InvalidEncoding or MalformedMessage rejections.
  [[nodiscard]] ValidationOutcome validate_bytes(std::string_view frame_bytes,
                                                 const FeedState& state) const;

  // Folds frames in order, stopping at the first rejection.
  [[nodiscard]] ChainOutcome validate_chain(const std::vector<Frame>& frames,
                                            const FeedState& state) const;

  [[nodiscard]] const ValidationLimits& limits() const { return limits_; }

private:
  const crypto::Verifier* verifier_;
  ValidationLimits limits_;
};

ValidationOutcome validate_frame(const Frame& candidate, const FeedState& state);

}  // namespace kutyus
