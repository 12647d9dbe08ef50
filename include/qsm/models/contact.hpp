#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/models/public_key_bundle.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace qsm::protocol::models {

/**
 * @brief A peer's identity as the caller knows it
 *
 * Validated at construction: non-empty id within kMaxIdentifierLength
 * and non-empty public keys. A new contact is always unverified;
 * MarkVerified is the only path to the verified state and it requires the
 * fingerprint computed over this contact's own keys to match the value
 * the user compared out of band.
 *
 * The protocol engine reads contacts but never changes them.
 */
class Contact {
public:
    /// Fails with InvalidInput.
    [[nodiscard]] static Result<Contact, QuantumFailure> Create(
        std::string id,
        std::string display_name,
        std::vector<uint8_t> kem_public_key,
        std::vector<uint8_t> signature_public_key);

    Contact(const Contact&) = default;
    Contact(Contact&&) noexcept = default;
    Contact& operator=(const Contact&) = default;
    Contact& operator=(Contact&&) noexcept = default;
    ~Contact() = default;

    /**
     * @brief Promote to verified after an out-of-band fingerprint comparison
     *
     * Ok(true) and verified when `expected_fingerprint` equals the
     * fingerprint of this contact's keys at `fingerprint_bytes` length.
     * Ok(false) and state untouched otherwise.
     */
    [[nodiscard]] Result<bool, QuantumFailure> MarkVerified(
        std::string_view expected_fingerprint,
        size_t fingerprint_bytes);

    /// Drop back to unverified, e.g. after the peer announced new keys.
    void ClearVerification() noexcept;

    [[nodiscard]] const std::string& GetId() const noexcept { return id_; }
    [[nodiscard]] const std::string& GetDisplayName() const noexcept { return display_name_; }
    [[nodiscard]] const std::vector<uint8_t>& GetKemPublicKey() const noexcept { return kem_public_key_; }
    [[nodiscard]] const std::vector<uint8_t>& GetSignaturePublicKey() const noexcept {
        return signature_public_key_;
    }
    [[nodiscard]] bool IsVerified() const noexcept { return verified_fingerprint_.has_value(); }

    /// The fingerprint that verified this contact, if any.
    [[nodiscard]] const std::optional<std::string>& GetVerifiedFingerprint() const noexcept {
        return verified_fingerprint_;
    }

    [[nodiscard]] PublicKeyBundle GetPublicKeyBundle() const;

private:
    Contact(
        std::string id,
        std::string display_name,
        std::vector<uint8_t> kem_public_key,
        std::vector<uint8_t> signature_public_key);

    std::string id_;
    std::string display_name_;
    std::vector<uint8_t> kem_public_key_;
    std::vector<uint8_t> signature_public_key_;
    std::optional<std::string> verified_fingerprint_;
};

}
