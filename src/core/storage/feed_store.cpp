#include "core/storage/feed_store.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include "core/codec/codec.hpp"
#include "core/crypto/hasher.hpp"
#include "core/observability/logging.hpp"
#include "core/util/text.hpp"

namespace kutyus {
namespace {

constexpr std::string_view kJournalFile = "frames.log";
constexpr std::string_view kRejectedFile = "rejected_frames.log";
constexpr std::string_view kJournalHeader = "# kutyus frame journal v1";

using observability::BoolField;
using observability::IntField;
using observability::KeyField;
using observability::StringField;

}  // namespace

FeedCursor::FeedCursor(const FeedStore& store, const PublicKey& author, std::uint64_t from_sequence)
    : store_(&store),
      author_(author),
      from_sequence_(from_sequence == 0 ? 1 : from_sequence),
      next_sequence_(from_sequence_) {}

std::optional<Frame> FeedCursor::next() {
  auto frame = store_->get(author_, next_sequence_);
  if (frame.has_value()) {
    ++next_sequence_;
  }
  return frame;
}

FeedStore::FeedStore(const crypto::Verifier& verifier, ValidationLimits limits)
    : validator_(verifier, limits) {}

Result FeedStore::open(std::string_view directory, bool record_rejections) {
  {
    std::unique_lock lock(feeds_mutex_);
    feeds_.clear();
  }
  dropped_journal_lines_ = 0;
  rejected_appends_ = 0;
  record_rejections_ = record_rejections;
  directory_ = std::string{directory};
  journal_path_.clear();
  rejected_path_.clear();

  if (directory_.empty()) {
    return Result::success("Feed store opened in memory.");
  }

  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    return Result::failure(ErrorCode::IoError, "Failed to create store directory: " + ec.message());
  }

  journal_path_ = (std::filesystem::path{directory_} / std::string{kJournalFile}).string();
  rejected_path_ = (std::filesystem::path{directory_} / std::string{kRejectedFile}).string();
  return load_journal();
}

std::shared_ptr<FeedStore::Feed> FeedStore::find_feed(const PublicKey& author) const {
  std::shared_lock lock(feeds_mutex_);
  const auto it = feeds_.find(author);
  if (it == feeds_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<FeedStore::Feed> FeedStore::find_or_create_feed(const PublicKey& author) {
  if (auto feed = find_feed(author)) {
    return feed;
  }
  std::unique_lock lock(feeds_mutex_);
  auto& slot = feeds_[author];
  if (!slot) {
    slot = std::make_shared<Feed>();
  }
  return slot;
}

std::shared_ptr<FeedStore::Feed> FeedStore::feed_for(const Frame& frame,
                                                    ValidationOutcome& outcome) {
  if (auto feed = find_feed(frame.message.author)) {
    return feed;
  }
  outcome = validator_.validate(frame, FeedState::empty());
  if (!outcome.accepted) {
    return nullptr;
  }
  return find_or_create_feed(frame.message.author);
}

Result FeedStore::reject(const Frame& frame, const ValidationOutcome& outcome) {
  ++rejected_appends_;
  KUTYUS_LOG_WARN("frame rejected", {KeyField("author", frame.message.author),
                                     IntField("sequence", static_cast<std::int64_t>(
                                                              frame.message.sequence)),
                                     StringField("reason", to_string(outcome.reason))});
  record_rejected_frame(util::to_hex(codec::encode_frame(frame)), outcome.reason, outcome.detail);
  return Result::failure(outcome.reason, outcome.detail);
}

FeedStore::ApplyStatus FeedStore::check_locked(const Feed& feed, const Frame& frame,
                                               ValidationOutcome& outcome) const {
  const std::uint64_t sequence = frame.message.sequence;
  if (sequence >= 1 && sequence <= feed.frames.size() && feed.frames[sequence - 1] == frame) {
    return ApplyStatus::AlreadyStored;
  }

  const FeedState state =
      feed.frames.empty() ? FeedState::empty() : FeedState::linked(feed.frames.back());
  outcome = validator_.validate(frame, state);
  return outcome.accepted ? ApplyStatus::Appended : ApplyStatus::Rejected;
}

Result FeedStore::append(const Frame& frame) {
  ValidationOutcome outcome;
  const auto feed = feed_for(frame, outcome);
  if (!feed) {
    return reject(frame, outcome);
  }
  std::lock_guard lock(feed->mutex);

  switch (check_locked(*feed, frame, outcome)) {
    case ApplyStatus::AlreadyStored:
      return Result::success("Frame already stored (idempotent append).",
                             util::to_hex(crypto::frame_digest(frame)));
    case ApplyStatus::Rejected:
      return reject(frame, outcome);
    case ApplyStatus::Appended:
      break;
  }

  const Result persisted = persist_frame(frame);
  if (!persisted.ok) {
    KUTYUS_LOG_ERROR("frame journal write failed", {StringField("path", journal_path_)});
    return persisted;
  }

  feed->frames.push_back(frame);
  KUTYUS_LOG_DEBUG("frame appended", {KeyField("author", frame.message.author),
                                      IntField("sequence", static_cast<std::int64_t>(
                                                               frame.message.sequence))});
  return Result::success("Frame appended.", util::to_hex(crypto::frame_digest(frame)));
}

Result FeedStore::append_bytes(std::string_view frame_bytes) {
  Frame frame;
  const Result decoded = codec::decode_frame(frame_bytes, frame, validator_.limits());
  if (!decoded.ok) {
    ++rejected_appends_;
    KUTYUS_LOG_WARN("frame bytes rejected", {StringField("reason", to_string(decoded.code))});
    record_rejected_frame(util::to_hex(frame_bytes), decoded.code, decoded.message);
    return decoded;
  }
  return append(frame);
}

std::optional<Frame> FeedStore::latest(const PublicKey& author) const {
  const auto feed = find_feed(author);
  if (!feed) {
    return std::nullopt;
  }
  std::lock_guard lock(feed->mutex);
  if (feed->frames.empty()) {
    return std::nullopt;
  }
  return feed->frames.back();
}

std::optional<Frame> FeedStore::get(const PublicKey& author, std::uint64_t sequence) const {
  const auto feed = find_feed(author);
  if (!feed || sequence == 0) {
    return std::nullopt;
  }
  std::lock_guard lock(feed->mutex);
  if (sequence > feed->frames.size()) {
    return std::nullopt;
  }
  return feed->frames[sequence - 1];
}

FeedCursor FeedStore::iterate(const PublicKey& author, std::uint64_t from_sequence) const {
  return FeedCursor(*this, author, from_sequence);
}

FeedState FeedStore::state(const PublicKey& author) const {
  return FeedState{latest(author)};
}

std::vector<PublicKey> FeedStore::authors() const {
  std::vector<PublicKey> out;
  std::shared_lock lock(feeds_mutex_);
  out.reserve(feeds_.size());
  for (const auto& [author, feed] : feeds_) {
    std::lock_guard feed_lock(feed->mutex);
    if (!feed->frames.empty()) {
      out.push_back(author);
    }
  }
  return out;
}

std::uint64_t FeedStore::feed_length(const PublicKey& author) const {
  const auto feed = find_feed(author);
  if (!feed) {
    return 0;
  }
  std::lock_guard lock(feed->mutex);
  return feed->frames.size();
}

StoreHealth FeedStore::health() const {
  StoreHealth report;
  {
    std::shared_lock lock(feeds_mutex_);
    report.tracked_feeds = feeds_.size();
    for (const auto& [author, feed] : feeds_) {
      std::lock_guard feed_lock(feed->mutex);
      if (!feed->frames.empty()) {
        ++report.feed_count;
        report.frame_count += feed->frames.size();
      }
    }
  }
  report.dropped_journal_lines = dropped_journal_lines_;
  report.rejected_appends = rejected_appends_;
  report.journal_path = journal_path_;
  return report;
}

Result FeedStore::load_journal() {
  std::ifstream in(journal_path_);
  if (!in) {
    return Result::success("Frame journal will be created on first append.");
  }

  std::size_t replayed = 0;
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = util::trim_copy(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }

    const auto bytes = util::from_hex(trimmed);
    if (!bytes.has_value()) {
      ++dropped_journal_lines_;
      record_rejected_frame(trimmed, ErrorCode::InvalidEncoding, "Journal line is not hex.");
      continue;
    }

    Frame frame;
    const Result decoded = codec::decode_frame(*bytes, frame, validator_.limits());
    if (!decoded.ok) {
      ++dropped_journal_lines_;
      record_rejected_frame(trimmed, decoded.code, decoded.message);
      continue;
    }

    ValidationOutcome outcome;
    const auto feed = feed_for(frame, outcome);
    if (!feed) {
      ++dropped_journal_lines_;
      record_rejected_frame(trimmed, outcome.reason, outcome.detail);
      continue;
    }
    std::lock_guard lock(feed->mutex);
    switch (check_locked(*feed, frame, outcome)) {
      case ApplyStatus::AlreadyStored:
        break;
      case ApplyStatus::Rejected:
        ++dropped_journal_lines_;
        record_rejected_frame(trimmed, outcome.reason, outcome.detail);
        break;
      case ApplyStatus::Appended:
        feed->frames.push_back(std::move(frame));
        ++replayed;
        break;
    }
  }

  if (dropped_journal_lines_ > 0) {
    KUTYUS_LOG_WARN("frame journal replayed with drops",
                    {StringField("path", journal_path_),
                     IntField("frames", static_cast<std::int64_t>(replayed)),
                     IntField("dropped", static_cast<std::int64_t>(dropped_journal_lines_.load()))});
  } else {
    KUTYUS_LOG_INFO("frame journal replayed",
                    {StringField("path", journal_path_),
                     IntField("frames", static_cast<std::int64_t>(replayed)),
                     BoolField("record_rejections", record_rejections_)});
  }
  return Result::success("Frame journal replayed.", std::to_string(replayed));
}

Result FeedStore::persist_frame(const Frame& frame) {
  if (journal_path_.empty()) {
    return Result::success();
  }

  std::lock_guard lock(journal_mutex_);
  const bool fresh = !std::filesystem::exists(journal_path_);
  std::ofstream out(journal_path_, std::ios::out | std::ios::app);
  if (!out) {
    return Result::failure(ErrorCode::IoError, "Failed to open frame journal.");
  }

  if (fresh) {
    out << kJournalHeader << "\n";
  }
  out << util::to_hex(codec::encode_frame(frame)) << "\n";
  out.flush();
  if (!out.good()) {
    return Result::failure(ErrorCode::IoError, "Failed to flush frame journal.");
  }
  return Result::success();
}

void FeedStore::record_rejected_frame(std::string_view frame_hex, ErrorCode reason,
                                      std::string_view detail) {
  if (!record_rejections_ || rejected_path_.empty()) {
    return;
  }

  std::lock_guard lock(journal_mutex_);
  std::ofstream out(rejected_path_, std::ios::out | std::ios::app);
  if (!out) {
    KUTYUS_LOG_WARN("rejected frame log unavailable", {StringField("path", rejected_path_)});
    return;
  }
  out << util::unix_timestamp_now() << "\t" << to_string(reason) << "\t" << detail << "\t"
      << frame_hex << "\n";
}

}  // namespace kutyus
