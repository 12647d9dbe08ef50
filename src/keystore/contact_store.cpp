#include "qsm/keystore/contact_store.hpp"
#include "qsm/core/constants.hpp"
#include "qsm/debug/protocol_logger.hpp"
#include "storage/key_material.pb.h"

#include <vector>

namespace qsm::protocol::keystore {
    using interfaces::StorageNamespace;
    using models::Contact;

    ContactStore::ContactStore(
        std::shared_ptr<interfaces::ISecureStorage> storage,
        const size_t fingerprint_bytes)
        : storage_(std::move(storage))
          , fingerprint_bytes_(fingerprint_bytes) {
    }

    Result<Unit, QuantumFailure> ContactStore::Save(const Contact &contact) {
        proto::storage::StoredContact record;
        record.set_id(contact.GetId());
        record.set_display_name(contact.GetDisplayName());
        const auto &kem_pk = contact.GetKemPublicKey();
        const auto &sig_pk = contact.GetSignaturePublicKey();
        record.set_kem_public_key(kem_pk.data(), kem_pk.size());
        record.set_signature_public_key(sig_pk.data(), sig_pk.size());
        if (contact.GetVerifiedFingerprint().has_value()) {
            record.set_verified_fingerprint(*contact.GetVerifiedFingerprint());
        }

        std::vector<uint8_t> serialized(record.ByteSizeLong());
        if (!record.SerializeToArray(serialized.data(), static_cast<int>(serialized.size()))) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::StorageFailure("Failed to serialize contact record"));
        }
        return storage_->Put(StorageNamespace::Contacts, contact.GetId(), serialized);
    }

    Result<Contact, QuantumFailure> ContactStore::Load(std::string_view contact_id) const {
        auto handle_result = storage_->Get(StorageNamespace::Contacts, contact_id);
        if (handle_result.IsErr()) {
            if (handle_result.UnwrapErr().type == QuantumFailureType::KeyNotFound) {
                return Result<Contact, QuantumFailure>::Err(
                    QuantumFailure::KeyNotFound(std::string(ErrorMessages::CONTACT_NOT_FOUND)));
            }
            return Result<Contact, QuantumFailure>::Err(std::move(handle_result).UnwrapErr());
        }

        proto::storage::StoredContact record;
        auto parse_result = handle_result.Unwrap().WithReadAccess([&record](std::span<const uint8_t> bytes) {
            return record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()));
        });
        if (parse_result.IsErr() || !parse_result.Unwrap()) {
            return Result<Contact, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Stored contact record is not a contact"));
        }
        if (record.id().empty() || record.id() != contact_id) {
            return Result<Contact, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Stored contact record has a missing or mismatched id"));
        }
        if (record.kem_public_key().empty() || record.signature_public_key().empty()) {
            return Result<Contact, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Stored contact record is missing a public key"));
        }

        auto contact_result = Contact::Create(
            record.id(),
            record.display_name(),
            std::vector<uint8_t>(record.kem_public_key().begin(), record.kem_public_key().end()),
            std::vector<uint8_t>(record.signature_public_key().begin(), record.signature_public_key().end()));
        if (contact_result.IsErr()) {
            return Result<Contact, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage(contact_result.UnwrapErr().message));
        }
        auto contact = std::move(contact_result).Unwrap();

        if (!record.verified_fingerprint().empty()) {
            auto verified = contact.MarkVerified(record.verified_fingerprint(), fingerprint_bytes_);
            if (verified.IsErr()) {
                return Result<Contact, QuantumFailure>::Err(std::move(verified).UnwrapErr());
            }
            if (!verified.Unwrap()) {
                QSM_LOG_MSG(debug::Component::Contacts, "LOAD",
                            std::string("stored verification no longer matches keys for ") + record.id());
            }
        }
        return Result<Contact, QuantumFailure>::Ok(std::move(contact));
    }

    Result<bool, QuantumFailure> ContactStore::Remove(std::string_view contact_id) {
        return storage_->Remove(StorageNamespace::Contacts, contact_id);
    }

    Result<bool, QuantumFailure> ContactStore::MarkVerified(
        std::string_view contact_id,
        std::string_view expected_fingerprint) {
        auto contact_result = Load(contact_id);
        if (contact_result.IsErr()) {
            return Result<bool, QuantumFailure>::Err(std::move(contact_result).UnwrapErr());
        }
        auto contact = std::move(contact_result).Unwrap();

        auto verified = contact.MarkVerified(expected_fingerprint, fingerprint_bytes_);
        if (verified.IsErr() || !verified.Unwrap()) {
            return verified;
        }
        QSM_RETURN_IF_ERR(Save(contact), Result<bool, QuantumFailure>);
        return verified;
    }

    bool ContactStore::Contains(std::string_view contact_id) const {
        return storage_->Contains(StorageNamespace::Contacts, contact_id);
    }
} // namespace qsm::protocol::keystore
