#include "core/model/types.hpp"

namespace kutyus {

const char* to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "none";
    case ErrorCode::TruncatedInput:
      return "truncated-input";
    case ErrorCode::InvalidEncoding:
      return "invalid-encoding";
    case ErrorCode::MalformedMessage:
      return "malformed-message";
    case ErrorCode::InvalidSequence:
      return "invalid-sequence";
    case ErrorCode::AuthorKeyMismatch:
      return "author-key-mismatch";
    case ErrorCode::IdMismatch:
      return "id-mismatch";
    case ErrorCode::BadSignature:
      return "bad-signature";
    case ErrorCode::InvalidGenesis:
      return "invalid-genesis";
    case ErrorCode::SequenceGap:
      return "sequence-gap";
    case ErrorCode::BrokenLink:
      return "broken-link";
    case ErrorCode::TimeRegression:
      return "time-regression";
    case ErrorCode::AuthorMismatch:
      return "author-mismatch";
    case ErrorCode::CryptoUnavailable:
      return "crypto-unavailable";
    case ErrorCode::IoError:
      return "io-error";
    case ErrorCode::ConfigError:
      return "config-error";
  }
  return "unknown";
}

}  // namespace kutyus
