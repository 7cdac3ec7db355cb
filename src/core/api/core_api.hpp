#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "core/chain/chain_validator.hpp"
#include "core/crypto/signer.hpp"
#include "core/model/types.hpp"
#include "core/storage/feed_store.hpp"

namespace kutyus {

// Entry point bundling the encode/sign/validate core with a feed store.
// Until init() is called the store is in memory with default limits.
// Cursors returned by iterate() do not survive a later init().
class CoreApi {
public:
  CoreApi();

  Result init(const CoreConfig& config);

  [[nodiscard]] std::string encode(const Message& message) const;
  Result decode(std::string_view bytes, Message& out) const;

  Result build_frame(const crypto::Signer& signer, const PublicKey& author, std::uint64_t sequence,
                     const Digest& previous, std::int64_t timestamp, const Content& content,
                     Frame& out) const;
  [[nodiscard]] ValidationOutcome validate_frame(const Frame& candidate,
                                                 const FeedState& last_accepted) const;

  // Producer path: builds the next frame of the signer's feed and appends it.
  // Concurrent publishes are serialized so each one builds on the frame the
  // previous one stored.
  Result publish(const crypto::Signer& signer, std::int64_t timestamp, const Content& content,
                 Frame* published = nullptr);
  // Consumer path: decodes a received frame and appends it if it extends
  // its feed.
  Result ingest(std::string_view frame_bytes);

  [[nodiscard]] std::optional<Frame> latest(const PublicKey& author) const;
  [[nodiscard]] std::optional<Frame> get(const PublicKey& author, std::uint64_t sequence) const;
  [[nodiscard]] FeedCursor iterate(const PublicKey& author, std::uint64_t from_sequence = 1) const;
  [[nodiscard]] StoreHealth health() const;
  [[nodiscard]] const CoreConfig& config() const { return config_; }

private:
  CoreConfig config_;
  std::unique_ptr<FeedStore> store_;
  std::mutex publish_mutex_;
};

}  // namespace kutyus
