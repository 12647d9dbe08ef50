#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/models/contact.hpp"
#include "qsm/models/public_key_bundle.hpp"
#include "qsm/protocol/constants.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace qsm::protocol::crypto {

/**
 * @brief Human-comparable identity fingerprints
 *
 * Fingerprint = SHA-256(kem_public_key || signature_public_key) truncated
 * to `length` bytes, rendered as uppercase hex in space-separated groups
 * of four digits ("3F2A 91C0 ..."). Deterministic; any single-byte change
 * in either key changes the result.
 *
 * This class only answers comparison queries. Promoting a contact to
 * verified is Contact::MarkVerified, invoked by the caller.
 */
class Fingerprint {
public:
    /// Fails with InvalidInput for empty keys or a length outside 1..32.
    [[nodiscard]] static Result<std::string, QuantumFailure> Compute(
        std::span<const uint8_t> kem_public_key,
        std::span<const uint8_t> signature_public_key,
        size_t length = kDefaultFingerprintBytes);

    [[nodiscard]] static Result<std::string, QuantumFailure> Compute(
        const models::PublicKeyBundle& bundle,
        size_t length = kDefaultFingerprintBytes);

    /// Exact string comparison against the fingerprint of the contact's keys.
    [[nodiscard]] static Result<bool, QuantumFailure> VerifyContact(
        const models::Contact& contact,
        std::string_view expected,
        size_t length = kDefaultFingerprintBytes);

    /// Renders raw digest bytes in the grouped display form.
    [[nodiscard]] static std::string Render(std::span<const uint8_t> digest);

private:
    Fingerprint() = delete;
};

} // namespace qsm::protocol::crypto
