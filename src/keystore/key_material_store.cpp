#include "qsm/keystore/key_material_store.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/core/constants.hpp"
#include "qsm/core/format.hpp"
#include "qsm/debug/protocol_logger.hpp"
#include "qsm/protocol/constants.hpp"
#include "storage/key_material.pb.h"

#include <chrono>
#include <optional>
#include <vector>

namespace qsm::protocol::keystore {
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using interfaces::StorageNamespace;
    using models::IdentityKeyMaterial;
    using models::PublicKeyBundle;
    using models::PublicKeyExport;

    namespace {
        int64_t NowMillis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        Result<Unit, QuantumFailure> ValidateUserId(std::string_view user_id) {
            if (user_id.empty() || user_id.size() > kMaxIdentifierLength) {
                return Result<Unit, QuantumFailure>::Err(
                    QuantumFailure::InvalidInput("User id must be 1-256 characters"));
            }
            return Result<Unit, QuantumFailure>::Ok(unit);
        }

        std::string ToBinaryString(std::span<const uint8_t> bytes) {
            return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        }

        std::vector<uint8_t> ToByteVector(const std::string &bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }

        template<typename Record>
        Result<Record, QuantumFailure> ParseRecord(const SecureMemoryHandle &handle, std::string_view what) {
            Record record;
            auto parse_result = handle.WithReadAccess([&record](std::span<const uint8_t> bytes) {
                return record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()));
            });
            if (parse_result.IsErr() || !parse_result.Unwrap()) {
                return Result<Record, QuantumFailure>::Err(
                    QuantumFailure::StorageFailure(
                        compat::format("Stored {} record is corrupt", what)));
            }
            return Result<Record, QuantumFailure>::Ok(std::move(record));
        }

        /// Serializes into secure memory; the intermediate buffer is wiped.
        template<typename Record>
        Result<Unit, QuantumFailure> PutRecord(
            interfaces::ISecureStorage &storage,
            StorageNamespace ns,
            std::string_view key,
            const Record &record) {
            std::vector<uint8_t> serialized(record.ByteSizeLong());
            crypto::ScopedWipe wipe_serialized(serialized);
            if (!record.SerializeToArray(serialized.data(), static_cast<int>(serialized.size()))) {
                return Result<Unit, QuantumFailure>::Err(
                    QuantumFailure::StorageFailure(
                        compat::format("Failed to serialize {} record", ToString(ns))));
            }
            return storage.Put(ns, key, serialized);
        }

        Result<Unit, QuantumFailure> ValidateLength(size_t actual, size_t expected, std::string_view what) {
            if (actual != expected) {
                return Result<Unit, QuantumFailure>::Err(
                    QuantumFailure::StorageFailure(
                        compat::format("Stored {} has length {}, provider expects {}", what, actual, expected)));
            }
            return Result<Unit, QuantumFailure>::Ok(unit);
        }
    }

    KeyMaterialStore::KeyMaterialStore(
        std::shared_ptr<const interfaces::IPrimitiveProvider> provider,
        std::shared_ptr<interfaces::ISecureStorage> storage,
        configuration::ProtocolConfig config)
        : provider_(std::move(provider))
          , storage_(std::move(storage))
          , config_(std::move(config)) {
    }

    Result<std::unique_ptr<KeyMaterialStore>, QuantumFailure> KeyMaterialStore::Create(
        std::shared_ptr<const interfaces::IPrimitiveProvider> provider,
        std::shared_ptr<interfaces::ISecureStorage> storage,
        configuration::ProtocolConfig config) {
        using CreateResult = Result<std::unique_ptr<KeyMaterialStore>, QuantumFailure>;
        if (!provider || !storage) {
            return CreateResult::Err(
                QuantumFailure::InvalidInput("Key store requires a primitive provider and secure storage"));
        }
        QSM_RETURN_IF_ERR(config.Validate(), CreateResult);
        QSM_RETURN_IF_ERR(config.CheckAlgorithms(provider->GetKemParameters().algorithm,
                                                 provider->GetSignatureParameters().algorithm), CreateResult);
        return CreateResult::Ok(std::unique_ptr<KeyMaterialStore>(
            new KeyMaterialStore(std::move(provider), std::move(storage), std::move(config))));
    }

    std::shared_ptr<std::shared_mutex> KeyMaterialStore::LockFor(std::string_view user_id) const {
        std::lock_guard guard(locks_guard_);
        auto [it, inserted] = user_locks_.try_emplace(std::string(user_id));
        if (inserted) {
            it->second = std::make_shared<std::shared_mutex>();
        }
        return it->second;
    }

    void KeyMaterialStore::ReleaseIdleLock(std::string_view user_id, std::shared_ptr<std::shared_mutex> lock) const {
        std::lock_guard guard(locks_guard_);
        const auto it = user_locks_.find(std::string(user_id));
        if (it != user_locks_.end() && it->second == lock && it->second.use_count() == 2) {
            user_locks_.erase(it);
        }
    }

    size_t KeyMaterialStore::TrackedLockCount() const {
        std::lock_guard guard(locks_guard_);
        return user_locks_.size();
    }

    // =============================================================================
    // Generation / rotation
    // =============================================================================

    Result<PublicKeyBundle, QuantumFailure> KeyMaterialStore::GenerateAndStoreKeys(
        std::string_view user_id,
        const KeyGenerationPolicy policy) {
        QSM_RETURN_IF_ERR(ValidateUserId(user_id), Result<PublicKeyBundle, QuantumFailure>);

        const auto user_lock = LockFor(user_id);
        std::unique_lock guard(*user_lock);

        if (policy == KeyGenerationPolicy::ReuseExisting &&
            storage_->Contains(StorageNamespace::PrivateKeys, user_id) &&
            storage_->Contains(StorageNamespace::PublicKeys, user_id)) {
            return LoadPublicLocked(user_id);
        }
        return GenerateLocked(user_id);
    }

    Result<PublicKeyBundle, QuantumFailure> KeyMaterialStore::RotateKeys(std::string_view user_id) {
        return GenerateAndStoreKeys(user_id, KeyGenerationPolicy::Rotate);
    }

    Result<PublicKeyBundle, QuantumFailure> KeyMaterialStore::GenerateLocked(std::string_view user_id) {
        const auto &kem_params = provider_->GetKemParameters();
        const auto &sig_params = provider_->GetSignatureParameters();

        auto kem_result = provider_->KemKeygen();
        if (kem_result.IsErr()) {
            QSM_LOG_FAILURE(debug::Component::KeyStore, "GENERATE", kem_result.UnwrapErr());
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration(kem_result.UnwrapErr().message));
        }
        auto sig_result = provider_->SigKeygen();
        if (sig_result.IsErr()) {
            QSM_LOG_FAILURE(debug::Component::KeyStore, "GENERATE", sig_result.UnwrapErr());
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration(sig_result.UnwrapErr().message));
        }
        auto kem_pair = std::move(kem_result).Unwrap();
        auto sig_pair = std::move(sig_result).Unwrap();

        if (kem_pair.public_key.size() != kem_params.public_key_bytes ||
            kem_pair.private_key.Size() != kem_params.secret_key_bytes ||
            sig_pair.public_key.size() != sig_params.public_key_bytes ||
            sig_pair.private_key.Size() != sig_params.secret_key_bytes) {
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration("Provider returned keys of unexpected length"));
        }

        const int64_t created_at = NowMillis();

        proto::storage::StoredPrivateKeys private_record;
        private_record.set_user_id(std::string(user_id));
        private_record.set_created_at(created_at);
        private_record.set_kem_algorithm(kem_params.algorithm);
        private_record.set_signature_algorithm(sig_params.algorithm);
        auto copy_result = kem_pair.private_key.WithReadAccess([&](std::span<const uint8_t> sk) {
            private_record.set_kem_private_key(ToBinaryString(sk));
            return sig_pair.private_key.WithReadAccess([&](std::span<const uint8_t> sig_sk) {
                private_record.set_signature_private_key(ToBinaryString(sig_sk));
                return unit;
            });
        });
        if (copy_result.IsErr() || copy_result.Unwrap().IsErr()) {
            SodiumInterop::WipeString(*private_record.mutable_kem_private_key());
            SodiumInterop::WipeString(*private_record.mutable_signature_private_key());
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration("Failed to read generated private keys"));
        }

        proto::storage::StoredPublicKeys public_record;
        public_record.set_user_id(std::string(user_id));
        public_record.set_created_at(created_at);
        public_record.set_kem_algorithm(kem_params.algorithm);
        public_record.set_signature_algorithm(sig_params.algorithm);
        public_record.set_kem_public_key(ToBinaryString(kem_pair.public_key));
        public_record.set_signature_public_key(ToBinaryString(sig_pair.public_key));

        std::optional<SecureMemoryHandle> previous_private;
        if (auto previous = storage_->Get(StorageNamespace::PrivateKeys, user_id); previous.IsOk()) {
            previous_private = std::move(previous).Unwrap();
        }

        auto put_private = PutRecord(*storage_, StorageNamespace::PrivateKeys, user_id, private_record);
        SodiumInterop::WipeString(*private_record.mutable_kem_private_key());
        SodiumInterop::WipeString(*private_record.mutable_signature_private_key());
        if (put_private.IsErr()) {
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::StorageFailure(put_private.UnwrapErr().message));
        }

        if (auto put_public = PutRecord(*storage_, StorageNamespace::PublicKeys, user_id, public_record);
            put_public.IsErr()) {
            // Put the private record back so the pair stays consistent.
            if (previous_private.has_value()) {
                auto restore = previous_private->WithReadAccess([&](std::span<const uint8_t> bytes) {
                    return storage_->Put(StorageNamespace::PrivateKeys, user_id, bytes);
                });
                if (restore.IsErr() || restore.Unwrap().IsErr()) {
                    return Result<PublicKeyBundle, QuantumFailure>::Err(
                        QuantumFailure::StorageFailure("Key rotation failed and previous keys could not be restored"));
                }
            } else {
                auto removed = storage_->Remove(StorageNamespace::PrivateKeys, user_id);
                if (removed.IsErr()) {
                    return Result<PublicKeyBundle, QuantumFailure>::Err(std::move(removed).UnwrapErr());
                }
            }
            return Result<PublicKeyBundle, QuantumFailure>::Err(
                QuantumFailure::StorageFailure(put_public.UnwrapErr().message));
        }

        debug::LogKeysGenerated(user_id, kem_params.algorithm, sig_params.algorithm, previous_private.has_value());

        return Result<PublicKeyBundle, QuantumFailure>::Ok(PublicKeyBundle(
            std::string(user_id),
            std::move(kem_pair.public_key),
            std::move(sig_pair.public_key),
            created_at));
    }

    // =============================================================================
    // Reads
    // =============================================================================

    Result<PublicKeyBundle, QuantumFailure> KeyMaterialStore::LoadPublicLocked(std::string_view user_id) const {
        auto handle_result = storage_->Get(StorageNamespace::PublicKeys, user_id);
        if (handle_result.IsErr()) {
            if (handle_result.UnwrapErr().type == QuantumFailureType::KeyNotFound) {
                return Result<PublicKeyBundle, QuantumFailure>::Err(
                    QuantumFailure::KeyNotFound(std::string(ErrorMessages::KEYS_NOT_INITIALIZED)));
            }
            return Result<PublicKeyBundle, QuantumFailure>::Err(std::move(handle_result).UnwrapErr());
        }

        auto record_result = ParseRecord<proto::storage::StoredPublicKeys>(handle_result.Unwrap(), "public key");
        if (record_result.IsErr()) {
            return Result<PublicKeyBundle, QuantumFailure>::Err(std::move(record_result).UnwrapErr());
        }
        const auto &record = record_result.Unwrap();

        using BundleResult = Result<PublicKeyBundle, QuantumFailure>;
        QSM_RETURN_IF_ERR(ValidateLength(record.kem_public_key().size(),
                                         provider_->GetKemParameters().public_key_bytes,
                                         "KEM public key"), BundleResult);
        QSM_RETURN_IF_ERR(ValidateLength(record.signature_public_key().size(),
                                         provider_->GetSignatureParameters().public_key_bytes,
                                         "signature public key"), BundleResult);

        return BundleResult::Ok(PublicKeyBundle(
            record.user_id(),
            ToByteVector(record.kem_public_key()),
            ToByteVector(record.signature_public_key()),
            record.created_at()));
    }

    Result<IdentityKeyMaterial, QuantumFailure> KeyMaterialStore::LoadPrivateLocked(std::string_view user_id) const {
        using MaterialResult = Result<IdentityKeyMaterial, QuantumFailure>;

        auto public_result = LoadPublicLocked(user_id);
        if (public_result.IsErr()) {
            return MaterialResult::Err(std::move(public_result).UnwrapErr());
        }
        auto public_bundle = std::move(public_result).Unwrap();

        auto handle_result = storage_->Get(StorageNamespace::PrivateKeys, user_id);
        if (handle_result.IsErr()) {
            if (handle_result.UnwrapErr().type == QuantumFailureType::KeyNotFound) {
                return MaterialResult::Err(
                    QuantumFailure::KeyNotFound(std::string(ErrorMessages::KEYS_NOT_INITIALIZED)));
            }
            return MaterialResult::Err(std::move(handle_result).UnwrapErr());
        }

        auto record_result = ParseRecord<proto::storage::StoredPrivateKeys>(handle_result.Unwrap(), "private key");
        if (record_result.IsErr()) {
            return MaterialResult::Err(std::move(record_result).UnwrapErr());
        }
        auto record = std::move(record_result).Unwrap();
        struct RecordWipe {
            proto::storage::StoredPrivateKeys &record;
            ~RecordWipe() {
                SodiumInterop::WipeString(*record.mutable_kem_private_key());
                SodiumInterop::WipeString(*record.mutable_signature_private_key());
            }
        } record_wipe{record};

        if (record.kem_algorithm() != provider_->GetKemParameters().algorithm ||
            record.signature_algorithm() != provider_->GetSignatureParameters().algorithm) {
            return MaterialResult::Err(
                QuantumFailure::StorageFailure("Stored keys belong to a different parameter set"));
        }
        QSM_RETURN_IF_ERR(ValidateLength(record.kem_private_key().size(),
                                         provider_->GetKemParameters().secret_key_bytes,
                                         "KEM private key"), MaterialResult);
        QSM_RETURN_IF_ERR(ValidateLength(record.signature_private_key().size(),
                                         provider_->GetSignatureParameters().secret_key_bytes,
                                         "signature private key"), MaterialResult);

        const auto &kem_sk = record.kem_private_key();
        const auto &sig_sk = record.signature_private_key();
        auto kem_handle = SecureMemoryHandle::FromBytes(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t *>(kem_sk.data()), kem_sk.size()));
        auto sig_handle = SecureMemoryHandle::FromBytes(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t *>(sig_sk.data()), sig_sk.size()));
        if (kem_handle.IsErr() || sig_handle.IsErr()) {
            return MaterialResult::Err(
                QuantumFailure::StorageFailure("Failed to allocate secure memory for private keys"));
        }

        return MaterialResult::Ok(IdentityKeyMaterial(
            public_bundle.GetUserId(),
            public_bundle.GetKemPublicKey(),
            std::move(kem_handle).Unwrap(),
            public_bundle.GetSignaturePublicKey(),
            std::move(sig_handle).Unwrap(),
            record.created_at()));
    }

    Result<IdentityKeyMaterial, QuantumFailure> KeyMaterialStore::GetPrivateKeys(std::string_view user_id) const {
        QSM_RETURN_IF_ERR(ValidateUserId(user_id), Result<IdentityKeyMaterial, QuantumFailure>);
        auto user_lock = LockFor(user_id);
        auto keys = [&] {
            std::shared_lock guard(*user_lock);
            return LoadPrivateLocked(user_id);
        }();
        if (keys.IsErr() && keys.UnwrapErr().type == QuantumFailureType::KeyNotFound) {
            ReleaseIdleLock(user_id, std::move(user_lock));
        }
        return keys;
    }

    Result<PublicKeyBundle, QuantumFailure> KeyMaterialStore::GetPublicKeys(std::string_view user_id) const {
        QSM_RETURN_IF_ERR(ValidateUserId(user_id), Result<PublicKeyBundle, QuantumFailure>);
        auto user_lock = LockFor(user_id);
        auto bundle = [&] {
            std::shared_lock guard(*user_lock);
            return LoadPublicLocked(user_id);
        }();
        if (bundle.IsErr() && bundle.UnwrapErr().type == QuantumFailureType::KeyNotFound) {
            ReleaseIdleLock(user_id, std::move(user_lock));
        }
        return bundle;
    }

    Result<PublicKeyExport, QuantumFailure> KeyMaterialStore::ExportPublicKeys(std::string_view user_id) const {
        auto bundle_result = GetPublicKeys(user_id);
        if (bundle_result.IsErr()) {
            return Result<PublicKeyExport, QuantumFailure>::Err(std::move(bundle_result).UnwrapErr());
        }
        auto bundle = std::move(bundle_result).Unwrap();
        auto fingerprint = crypto::Fingerprint::Compute(bundle, config_.GetFingerprintBytes());
        if (fingerprint.IsErr()) {
            return Result<PublicKeyExport, QuantumFailure>::Err(std::move(fingerprint).UnwrapErr());
        }
        return Result<PublicKeyExport, QuantumFailure>::Ok(PublicKeyExport{
            .kem_public_key = bundle.GetKemPublicKey(),
            .signature_public_key = bundle.GetSignaturePublicKey(),
            .fingerprint = std::move(fingerprint).Unwrap()
        });
    }

    // =============================================================================
    // Wipe
    // =============================================================================

    Result<bool, QuantumFailure> KeyMaterialStore::WipeKeys(std::string_view user_id) {
        QSM_RETURN_IF_ERR(ValidateUserId(user_id), Result<bool, QuantumFailure>);
        auto user_lock = LockFor(user_id);
        auto wiped = [&]() -> Result<bool, QuantumFailure> {
            std::unique_lock guard(*user_lock);
            auto removed_private = storage_->Remove(StorageNamespace::PrivateKeys, user_id);
            if (removed_private.IsErr()) {
                return removed_private;
            }
            auto removed_public = storage_->Remove(StorageNamespace::PublicKeys, user_id);
            if (removed_public.IsErr()) {
                return removed_public;
            }
            return Result<bool, QuantumFailure>::Ok(removed_private.Unwrap() || removed_public.Unwrap());
        }();
        if (wiped.IsOk()) {
            QSM_LOG_MSG(debug::Component::KeyStore, "WIPE", user_id);
            ReleaseIdleLock(user_id, std::move(user_lock));
        }
        return wiped;
    }

    bool KeyMaterialStore::HasKeys(std::string_view user_id) const {
        if (ValidateUserId(user_id).IsErr()) {
            return false;
        }
        auto user_lock = LockFor(user_id);
        const bool present = [&] {
            std::shared_lock guard(*user_lock);
            return storage_->Contains(StorageNamespace::PrivateKeys, user_id) &&
                   storage_->Contains(StorageNamespace::PublicKeys, user_id);
        }();
        if (!present) {
            ReleaseIdleLock(user_id, std::move(user_lock));
        }
        return present;
    }
} // namespace qsm::protocol::keystore
