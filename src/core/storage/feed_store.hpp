#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "core/chain/chain_validator.hpp"
#include "core/model/types.hpp"

namespace kutyus {

class FeedStore;

// Lazy, restartable walk over one feed in ascending sequence order. Each
// next() reads the store, so frames appended while walking are picked up.
class FeedCursor {
public:
  FeedCursor(const FeedStore& store, const PublicKey& author, std::uint64_t from_sequence);

  std::optional<Frame> next();
  void reset() { next_sequence_ = from_sequence_; }

  [[nodiscard]] std::uint64_t position() const { return next_sequence_; }

private:
  const FeedStore* store_;
  PublicKey author_;
  std::uint64_t from_sequence_;
  std::uint64_t next_sequence_;
};

// Validated per-author frame storage. append() runs read-last, validate and
// append as one step per author; different authors never share a lock
// beyond the brief lookup of their feed.
//
// With a directory, accepted frames are journaled to frames.log (one
// hex-encoded frame per line) and replayed through the validator on open().
class FeedStore {
public:
  explicit FeedStore(const crypto::Verifier& verifier = crypto::default_verifier(),
                     ValidationLimits limits = {});

  FeedStore(const FeedStore&) = delete;
  FeedStore& operator=(const FeedStore&) = delete;

  // Not safe to call concurrently with other members.
  Result open(std::string_view directory, bool record_rejections = true);

  Result append(const Frame& frame);
  Result append_bytes(std::string_view frame_bytes);

  [[nodiscard]] std::optional<Frame> latest(const PublicKey& author) const;
  [[nodiscard]] std::optional<Frame> get(const PublicKey& author, std::uint64_t sequence) const;
  [[nodiscard]] FeedCursor iterate(const PublicKey& author, std::uint64_t from_sequence = 1) const;
  [[nodiscard]] FeedState state(const PublicKey& author) const;

  [[nodiscard]] std::vector<PublicKey> authors() const;
  [[nodiscard]] std::uint64_t feed_length(const PublicKey& author) const;
  [[nodiscard]] StoreHealth health() const;
  [[nodiscard]] const ChainValidator& validator() const { return validator_; }

private:
  struct Feed {
    mutable std::mutex mutex;
    std::vector<Frame> frames;
  };

  enum class ApplyStatus { Appended, AlreadyStored, Rejected };

  [[nodiscard]] std::shared_ptr<Feed> find_feed(const PublicKey& author) const;
  std::shared_ptr<Feed> find_or_create_feed(const PublicKey& author);
  // Existing feed of the frame's author. For an unknown author the frame is
  // checked as a genesis first and the feed is created only if it passes;
  // otherwise returns nullptr with the rejection in `outcome`.
  std::shared_ptr<Feed> feed_for(const Frame& frame, ValidationOutcome& outcome);
  Result reject(const Frame& frame, const ValidationOutcome& outcome);

  // Caller holds feed.mutex.
  ApplyStatus check_locked(const Feed& feed, const Frame& frame, ValidationOutcome& outcome) const;

  Result load_journal();
  Result persist_frame(const Frame& frame);
  void record_rejected_frame(std::string_view frame_hex, ErrorCode reason, std::string_view detail);

  ChainValidator validator_;
  bool record_rejections_ = true;
  std::string directory_;
  std::string journal_path_;
  std::string rejected_path_;

  mutable std::shared_mutex feeds_mutex_;
  std::map<PublicKey, std::shared_ptr<Feed>> feeds_;

  std::mutex journal_mutex_;
  std::atomic<std::size_t> dropped_journal_lines_{0};
  std::atomic<std::size_t> rejected_appends_{0};
};

}  // namespace kutyus
