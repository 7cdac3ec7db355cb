#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "core/model/protocol_meta.hpp"

namespace kutyus {

enum class ErrorCode {
  None,
  // encoding
  TruncatedInput,
  InvalidEncoding,
  MalformedMessage,
  // frame building
  InvalidSequence,
  AuthorKeyMismatch,
  // chain validation
  IdMismatch,
  BadSignature,
  InvalidGenesis,
  SequenceGap,
  BrokenLink,
  TimeRegression,
  AuthorMismatch,
  // environment
  CryptoUnavailable,
  IoError,
  ConfigError,
};

struct Result {
  bool ok = false;
  std::string message;
  std::string data;
  ErrorCode code = ErrorCode::None;

  static Result success(std::string msg = {}, std::string payload = {}) {
    return {true, std::move(msg), std::move(payload), ErrorCode::None};
  }

  static Result failure(ErrorCode code, std::string msg) {
    return {false, std::move(msg), {}, code};
  }
};

using PublicKey = std::array<std::uint8_t, kPublicKeyBytes>;
using Seed = std::array<std::uint8_t, kSeedBytes>;
using Digest = std::array<std::uint8_t, kDigestBytes>;
using Signature = std::array<std::uint8_t, kSignatureBytes>;

// Opaque payload plus an application-defined type tag.
struct Content {
  std::string type;
  std::string data;

  static Content blob(std::string bytes) {
    return {std::string{kBlobContentType}, std::move(bytes)};
  }

  bool operator==(const Content&) const = default;
};

struct Message {
  PublicKey author{};
  std::uint64_t sequence = 0;
  Digest previous{};
  std::int64_t timestamp = 0;
  Content content;

  bool operator==(const Message&) const = default;
};

struct Frame {
  Digest id{};
  Message message;
  Signature signature{};

  bool operator==(const Frame&) const = default;
};

// Last accepted frame of one feed. Empty until the genesis frame is accepted.
struct FeedState {
  std::optional<Frame> last;

  static FeedState empty() { return {}; }
  static FeedState linked(Frame frame) { return {std::move(frame)}; }

  [[nodiscard]] bool is_empty() const { return !last.has_value(); }
};

struct ValidationOutcome {
  bool accepted = false;
  ErrorCode reason = ErrorCode::None;
  std::string detail;
  FeedState state;

  static ValidationOutcome accept(FeedState next) {
    return {true, ErrorCode::None, {}, std::move(next)};
  }

  static ValidationOutcome reject(ErrorCode reason, std::string detail, FeedState unchanged) {
    return {false, reason, std::move(detail), std::move(unchanged)};
  }
};

struct ValidationLimits {
  std::size_t max_content_type_bytes = 255;
  std::size_t max_content_bytes = 1U << 20U;  // 1 MiB

  [[nodiscard]] std::size_t max_message_bytes() const {
    return kMessageFixedBytes + max_content_type_bytes + max_content_bytes;
  }
};

struct StoreConfig {
  std::string directory;  // empty -> memory only
  bool record_rejections = true;
};

struct LoggingConfig {
  std::string level = "info";
  std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

struct CoreConfig {
  ValidationLimits limits{};
  StoreConfig store{};
  LoggingConfig logging{};
};

struct StoreHealth {
  std::size_t feed_count = 0;
  std::size_t tracked_feeds = 0;  // includes feeds with no frames yet
  std::size_t frame_count = 0;
  std::size_t dropped_journal_lines = 0;
  std::size_t rejected_appends = 0;
  std::string journal_path;
};

const char* to_string(ErrorCode code);

// SequenceGap means intermediate frames are missing; the other chain
// reasons indicate a faulty peer or corrupted storage.
[[nodiscard]] inline bool is_missing_history(ErrorCode code) {
  return code == ErrorCode::SequenceGap;
}

[[nodiscard]] inline bool is_encoding_error(ErrorCode code) {
  return code == ErrorCode::TruncatedInput || code == ErrorCode::InvalidEncoding ||
         code == ErrorCode::MalformedMessage;
}

}  // namespace kutyus
