#include "qsm/configuration/protocol_config.hpp"

#include <algorithm>
#include <charconv>

namespace qsm::protocol::configuration {

namespace {

constexpr size_t kMaxFingerprintBytes = kSha256Bytes;

bool ParseComponent(std::string_view text, uint32_t& out) {
    if (text.empty() || text.size() > 9) {
        return false;
    }
    if (!std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

std::optional<ProtocolVersion> ProtocolVersion::Parse(std::string_view text) {
    const size_t first_dot = text.find('.');
    if (first_dot == std::string_view::npos) {
        return std::nullopt;
    }
    const size_t second_dot = text.find('.', first_dot + 1);
    if (second_dot == std::string_view::npos) {
        return std::nullopt;
    }

    ProtocolVersion version;
    if (!ParseComponent(text.substr(0, first_dot), version.major) ||
        !ParseComponent(text.substr(first_dot + 1, second_dot - first_dot - 1), version.minor) ||
        !ParseComponent(text.substr(second_dot + 1), version.patch)) {
        return std::nullopt;
    }
    return version;
}

std::string ProtocolVersion::ToString() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

ProtocolConfig ProtocolConfig::Default() {
    return ForSecurityLevel(SecurityLevel::Level3);
}

ProtocolConfig ProtocolConfig::ForSecurityLevel(const SecurityLevel level) {
    ProtocolParameters parameters;
    switch (level) {
        case SecurityLevel::Level1:
            parameters.kem_algorithm = std::string(kMlKem512);
            parameters.signature_algorithm = std::string(kMlDsa44);
            break;
        case SecurityLevel::Level5:
            parameters.kem_algorithm = std::string(kMlKem1024);
            parameters.signature_algorithm = std::string(kMlDsa87);
            break;
        case SecurityLevel::Level3:
        default:
            parameters.kem_algorithm = std::string(kMlKem768);
            parameters.signature_algorithm = std::string(kMlDsa65);
            break;
    }
    return ProtocolConfig(std::move(parameters));
}

ProtocolConfig ProtocolConfig::Custom(ProtocolParameters parameters) {
    return ProtocolConfig(std::move(parameters));
}

Result<Unit, QuantumFailure> ProtocolConfig::Validate() const {
    if (parameters_.kem_algorithm.empty()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("KEM algorithm name must not be empty"));
    }
    if (parameters_.signature_algorithm.empty()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Signature algorithm name must not be empty"));
    }
    if (!ProtocolVersion::Parse(parameters_.current_version).has_value()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Current protocol version is not major.minor.patch"));
    }
    for (const auto& version : parameters_.accepted_versions) {
        if (!ProtocolVersion::Parse(version).has_value()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InvalidInput("Accepted protocol version is not major.minor.patch: " + version));
        }
    }
    if (!IsVersionAccepted(parameters_.current_version)) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Current protocol version is not in the accepted set"));
    }
    if (parameters_.key_salt.empty() || parameters_.key_info.empty()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Key schedule salt and info must not be empty"));
    }
    if (parameters_.fingerprint_bytes == 0 || parameters_.fingerprint_bytes > kMaxFingerprintBytes) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Fingerprint length must be between 1 and 32 bytes"));
    }
    if (parameters_.replay.max_tracked_ids == 0) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Replay window must track at least one id"));
    }
    return Result<Unit, QuantumFailure>::Ok(unit);
}

Result<Unit, QuantumFailure> ProtocolConfig::CheckAlgorithms(
    std::string_view kem_algorithm,
    std::string_view signature_algorithm) const {
    if (kem_algorithm != parameters_.kem_algorithm) {
        return Result<Unit, QuantumFailure>::Err(QuantumFailure::InvalidInput(
            "Provider KEM " + std::string(kem_algorithm) + " does not match configured " +
            parameters_.kem_algorithm));
    }
    if (signature_algorithm != parameters_.signature_algorithm) {
        return Result<Unit, QuantumFailure>::Err(QuantumFailure::InvalidInput(
            "Provider signature scheme " + std::string(signature_algorithm) + " does not match configured " +
            parameters_.signature_algorithm));
    }
    return Result<Unit, QuantumFailure>::Ok(unit);
}

bool ProtocolConfig::IsVersionAccepted(std::string_view version) const {
    return std::any_of(parameters_.accepted_versions.begin(), parameters_.accepted_versions.end(),
                       [version](const std::string& accepted) { return accepted == version; });
}

} // namespace qsm::protocol::configuration
