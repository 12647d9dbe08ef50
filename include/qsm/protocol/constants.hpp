#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace qsm::protocol {

inline constexpr std::string_view kProtocolVersion = "1.0.0";

inline constexpr size_t kAesKeyBytes = 32;
inline constexpr size_t kAesGcmNonceBytes = 12;
inline constexpr size_t kAesGcmTagBytes = 16;

inline constexpr size_t kHkdfHashBytes = 32;
inline constexpr size_t kHkdfMaxOutputBytes = 255 * kHkdfHashBytes;
inline constexpr size_t kSha256Bytes = 32;

inline constexpr size_t kMessageIdBytes = 16;
inline constexpr size_t kMaxIdentifierLength = 256;
inline constexpr size_t kMaxPlaintextBytes = 10 * 1024 * 1024;
inline constexpr size_t kMaxMessageBytes = 16 * 1024 * 1024;

// Fingerprint: truncated SHA-256, rendered as space-separated groups of
// four uppercase hex digits.
inline constexpr size_t kDefaultFingerprintBytes = 16;
inline constexpr size_t kFingerprintGroupHexChars = 4;

// Domain separation constants for the message key schedule.
inline constexpr std::string_view kMessageKeySalt = "QSM-Hybrid-Message-Salt-v1";
inline constexpr std::string_view kMessageKeyInfo = "QSM-Message-Key";

inline constexpr std::string_view kSignatureDomainLabel = "QSM-Message-Signature";
inline constexpr std::string_view kAssociatedDataLabel = "QSM-Message-Header";

inline constexpr std::chrono::minutes kDefaultMaxMessageAge{60 * 24 * 7};
inline constexpr std::chrono::minutes kDefaultAllowedClockSkew{5};
inline constexpr size_t kMaxReplayTrackedIds = 20000;

// ML-KEM / ML-DSA algorithm names as registered by liboqs.
inline constexpr std::string_view kMlKem512 = "ML-KEM-512";
inline constexpr std::string_view kMlKem768 = "ML-KEM-768";
inline constexpr std::string_view kMlKem1024 = "ML-KEM-1024";
inline constexpr std::string_view kMlDsa44 = "ML-DSA-44";
inline constexpr std::string_view kMlDsa65 = "ML-DSA-65";
inline constexpr std::string_view kMlDsa87 = "ML-DSA-87";

}  // namespace qsm::protocol
