#include "qsm/models/contact.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "qsm/protocol/constants.hpp"

namespace qsm::protocol::models {

Contact::Contact(
    std::string id,
    std::string display_name,
    std::vector<uint8_t> kem_public_key,
    std::vector<uint8_t> signature_public_key)
    : id_(std::move(id))
    , display_name_(std::move(display_name))
    , kem_public_key_(std::move(kem_public_key))
    , signature_public_key_(std::move(signature_public_key)) {
}

Result<Contact, QuantumFailure> Contact::Create(
    std::string id,
    std::string display_name,
    std::vector<uint8_t> kem_public_key,
    std::vector<uint8_t> signature_public_key) {
    if (id.empty() || id.size() > kMaxIdentifierLength) {
        return Result<Contact, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Contact id must be 1-256 characters"));
    }
    if (display_name.size() > kMaxIdentifierLength) {
        return Result<Contact, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Contact display name exceeds 256 characters"));
    }
    if (kem_public_key.empty()) {
        return Result<Contact, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Contact KEM public key is empty"));
    }
    if (signature_public_key.empty()) {
        return Result<Contact, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Contact signature public key is empty"));
    }
    return Result<Contact, QuantumFailure>::Ok(Contact(
        std::move(id),
        std::move(display_name),
        std::move(kem_public_key),
        std::move(signature_public_key)));
}

Result<bool, QuantumFailure> Contact::MarkVerified(
    std::string_view expected_fingerprint,
    const size_t fingerprint_bytes) {
    auto match = crypto::Fingerprint::VerifyContact(*this, expected_fingerprint, fingerprint_bytes);
    if (match.IsErr()) {
        return match;
    }
    if (match.Unwrap()) {
        verified_fingerprint_ = std::string(expected_fingerprint);
    }
    return match;
}

void Contact::ClearVerification() noexcept {
    verified_fingerprint_.reset();
}

PublicKeyBundle Contact::GetPublicKeyBundle() const {
    return PublicKeyBundle(id_, kem_public_key_, signature_public_key_, 0);
}

} // namespace qsm::protocol::models
