#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/protocol/constants.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qsm::protocol::configuration {

/// NIST post-quantum security category of the injected parameter set
///
/// - Level1: ML-KEM-512 + ML-DSA-44
/// - Level3: ML-KEM-768 + ML-DSA-65 (reference parameter set)
/// - Level5: ML-KEM-1024 + ML-DSA-87
enum class SecurityLevel : uint8_t {
    Level1 = 1,
    Level3 = 3,
    Level5 = 5
};

/// "major.minor.patch" protocol version.
struct ProtocolVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;

    /// Strict parse: three dot-separated decimal components, nothing else.
    [[nodiscard]] static std::optional<ProtocolVersion> Parse(std::string_view text);

    [[nodiscard]] std::string ToString() const;

    bool operator==(const ProtocolVersion&) const = default;
};

struct ReplaySettings {
    std::chrono::minutes max_message_age = kDefaultMaxMessageAge;
    std::chrono::minutes allowed_clock_skew = kDefaultAllowedClockSkew;
    size_t max_tracked_ids = kMaxReplayTrackedIds;
};

/// Everything ProtocolConfig::Custom accepts.
struct ProtocolParameters {
    std::string kem_algorithm;
    std::string signature_algorithm;
    std::string current_version = std::string(kProtocolVersion);
    std::vector<std::string> accepted_versions = {std::string(kProtocolVersion)};
    std::string key_salt = std::string(kMessageKeySalt);
    std::string key_info = std::string(kMessageKeyInfo);
    size_t fingerprint_bytes = kDefaultFingerprintBytes;
    ReplaySettings replay{};
};

/// Parameter set injected into the protocol engine and key store
///
/// Carries the KEM and signature algorithm names handed to the primitive
/// provider, the version stamped on outgoing messages, the versions
/// accepted on incoming ones, the key schedule constants and the
/// fingerprint length. Nothing in the engine hardcodes an algorithm.
///
/// @example
/// ```cpp
/// auto config = ProtocolConfig::Default();                  // ML-KEM-768 / ML-DSA-65
/// auto strong = ProtocolConfig::ForSecurityLevel(SecurityLevel::Level5);
/// if (auto valid = strong.Validate(); valid.IsErr()) { ... }
/// ```
class ProtocolConfig {
public:
    [[nodiscard]] static ProtocolConfig Default();

    [[nodiscard]] static ProtocolConfig ForSecurityLevel(SecurityLevel level);

    /// Unvalidated; call Validate() before use.
    [[nodiscard]] static ProtocolConfig Custom(ProtocolParameters parameters);

    /// Rejects empty algorithm names, malformed versions, a current version
    /// missing from the accepted set, empty salt/info and a fingerprint
    /// length outside 1..32 bytes. Fails with InvalidInput.
    [[nodiscard]] Result<Unit, QuantumFailure> Validate() const;

    /// InvalidInput unless a provider's algorithm names are the configured ones.
    [[nodiscard]] Result<Unit, QuantumFailure> CheckAlgorithms(
        std::string_view kem_algorithm,
        std::string_view signature_algorithm) const;

    /// Exact membership in the accepted version set.
    [[nodiscard]] bool IsVersionAccepted(std::string_view version) const;

    [[nodiscard]] const std::string& GetKemAlgorithm() const noexcept { return parameters_.kem_algorithm; }
    [[nodiscard]] const std::string& GetSignatureAlgorithm() const noexcept { return parameters_.signature_algorithm; }
    [[nodiscard]] const std::string& GetCurrentVersion() const noexcept { return parameters_.current_version; }
    [[nodiscard]] const std::vector<std::string>& GetAcceptedVersions() const noexcept {
        return parameters_.accepted_versions;
    }
    [[nodiscard]] const std::string& GetKeySalt() const noexcept { return parameters_.key_salt; }
    [[nodiscard]] const std::string& GetKeyInfo() const noexcept { return parameters_.key_info; }
    [[nodiscard]] size_t GetFingerprintBytes() const noexcept { return parameters_.fingerprint_bytes; }
    [[nodiscard]] const ReplaySettings& GetReplaySettings() const noexcept { return parameters_.replay; }

private:
    explicit ProtocolConfig(ProtocolParameters parameters)
        : parameters_(std::move(parameters)) {}

    ProtocolParameters parameters_;
};

} // namespace qsm::protocol::configuration
