#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/interfaces/i_secure_storage.hpp"
#include "qsm/models/contact.hpp"

#include <memory>
#include <string_view>

namespace qsm::protocol::keystore {

/**
 * @brief Contacts namespace of the secure storage
 *
 * A stored contact keeps the fingerprint it was verified against, never a
 * bare flag. Load re-runs the comparison against the stored keys, so a
 * record whose keys were altered comes back unverified.
 */
class ContactStore {
public:
    /// `fingerprint_bytes` is the length verification fingerprints use.
    ContactStore(std::shared_ptr<interfaces::ISecureStorage> storage, size_t fingerprint_bytes);

    [[nodiscard]] Result<Unit, QuantumFailure> Save(const models::Contact& contact);

    /// Fails with KeyNotFound when absent, MalformedMessage when the stored
    /// record is missing a required field.
    [[nodiscard]] Result<models::Contact, QuantumFailure> Load(std::string_view contact_id) const;

    [[nodiscard]] Result<bool, QuantumFailure> Remove(std::string_view contact_id);

    /// Loads, runs Contact::MarkVerified and saves on a match.
    [[nodiscard]] Result<bool, QuantumFailure> MarkVerified(
        std::string_view contact_id,
        std::string_view expected_fingerprint);

    [[nodiscard]] bool Contains(std::string_view contact_id) const;

private:
    std::shared_ptr<interfaces::ISecureStorage> storage_;
    size_t fingerprint_bytes_;
};

} // namespace qsm::protocol::keystore
