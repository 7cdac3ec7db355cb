#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#ifndef KUTYUS_LIBRARY_VERSION
#define KUTYUS_LIBRARY_VERSION "0.3.0"
#endif

namespace kutyus {

inline constexpr std::string_view kLibraryName = "kutyus-core";
inline constexpr std::string_view kLibraryVersion = KUTYUS_LIBRARY_VERSION;

// Bumping either tag changes every digest produced afterwards.
inline constexpr std::uint8_t kMessageFormatVersion = 0x01;
inline constexpr std::uint8_t kFrameFormatVersion = 0x01;

inline constexpr std::size_t kPublicKeyBytes = 32;
inline constexpr std::size_t kSeedBytes = 32;
inline constexpr std::size_t kDigestBytes = 64;
inline constexpr std::size_t kSignatureBytes = 64;

// version + author + sequence + previous + timestamp + two length prefixes
inline constexpr std::size_t kMessageFixedBytes = 1 + kPublicKeyBytes + 8 + kDigestBytes + 8 + 2 + 4;
// version + id + message length + signature
inline constexpr std::size_t kFrameFixedBytes = 1 + kDigestBytes + 4 + kSignatureBytes;

inline constexpr std::string_view kBlobContentType = "blob";

}  // namespace kutyus
