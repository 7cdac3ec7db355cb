#pragma once

#include <cstdint>

#include "core/crypto/signer.hpp"
#include "core/model/types.hpp"

namespace kutyus {

// Assembles and signs one frame. `previous` must be the genesis sentinel for
// sequence 1 and the frame digest of the preceding frame otherwise; the
// builder does not consult feed history to check it.
Result build_frame(const crypto::Signer& signer, const PublicKey& author, std::uint64_t sequence,
                   const Digest& previous, std::int64_t timestamp, const Content& content,
                   Frame& out, const ValidationLimits& limits = {});

// Builds the frame that extends `state`, deriving sequence and previous from
// its last frame, or genesis values for an empty feed.
Result build_next_frame(const crypto::Signer& signer, const FeedState& state,
                        std::int64_t timestamp, const Content& content, Frame& out,
                        const ValidationLimits& limits = {});

}  // namespace kutyus
