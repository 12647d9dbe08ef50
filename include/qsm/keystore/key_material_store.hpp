#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/configuration/protocol_config.hpp"
#include "qsm/interfaces/i_primitive_provider.hpp"
#include "qsm/interfaces/i_secure_storage.hpp"
#include "qsm/models/identity_key_material.hpp"
#include "qsm/models/public_key_bundle.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace qsm::protocol::keystore {

enum class KeyGenerationPolicy : uint8_t {
    /// Return the stored keys when present; generate only on first use.
    ReuseExisting,
    /// Always generate and replace the stored keys.
    Rotate
};

/**
 * @brief Owner of this device's identity keypairs
 *
 * The only component that reads or writes private key records. Keys are
 * generated through the injected primitive provider and persisted in the
 * PrivateKeys and PublicKeys namespaces of the secure storage, keyed by
 * user id.
 *
 * Concurrency: each user id has its own reader/writer lock. Generation,
 * rotation and wipe hold it exclusively, so concurrent first-time
 * generation for one user produces exactly one keypair set. Reads share
 * it. Private keys are handed out as owned secure copies, which stay
 * valid across a later rotation.
 *
 * @example
 * ```cpp
 * auto store = KeyMaterialStore::Create(provider, storage, ProtocolConfig::Default()).Unwrap();
 * auto bundle = store->GenerateAndStoreKeys("alice_123");
 * auto exported = store->ExportPublicKeys("alice_123");   // keys + fingerprint
 * auto keys = store->GetPrivateKeys("alice_123");         // IdentityKeyMaterial
 * ```
 */
class KeyMaterialStore {
public:
    /// Fails with InvalidInput for a null collaborator or an invalid config.
    [[nodiscard]] static Result<std::unique_ptr<KeyMaterialStore>, QuantumFailure> Create(
        std::shared_ptr<const interfaces::IPrimitiveProvider> provider,
        std::shared_ptr<interfaces::ISecureStorage> storage,
        configuration::ProtocolConfig config);

    KeyMaterialStore(const KeyMaterialStore&) = delete;
    KeyMaterialStore& operator=(const KeyMaterialStore&) = delete;

    /// Idempotent under ReuseExisting. Fails with InvalidInput for a bad
    /// user id, KeyGeneration for provider failures, StorageFailure when
    /// persistence fails (previous keys are then left in place).
    [[nodiscard]] Result<models::PublicKeyBundle, QuantumFailure> GenerateAndStoreKeys(
        std::string_view user_id,
        KeyGenerationPolicy policy = KeyGenerationPolicy::ReuseExisting);

    [[nodiscard]] Result<models::PublicKeyBundle, QuantumFailure> RotateKeys(std::string_view user_id);

    /// Fails with KeyNotFound when the user has no keys.
    [[nodiscard]] Result<models::IdentityKeyMaterial, QuantumFailure> GetPrivateKeys(
        std::string_view user_id) const;

    /// Fails with KeyNotFound when the user has no keys.
    [[nodiscard]] Result<models::PublicKeyBundle, QuantumFailure> GetPublicKeys(
        std::string_view user_id) const;

    /// Public keys plus their fingerprint at the configured length.
    [[nodiscard]] Result<models::PublicKeyExport, QuantumFailure> ExportPublicKeys(
        std::string_view user_id) const;

    /// Account wipe. Ok(false) when there was nothing to remove.
    [[nodiscard]] Result<bool, QuantumFailure> WipeKeys(std::string_view user_id);

    [[nodiscard]] bool HasKeys(std::string_view user_id) const;

    /// Number of per-user locks currently held in the lock table.
    [[nodiscard]] size_t TrackedLockCount() const;

    [[nodiscard]] const configuration::ProtocolConfig& GetConfig() const noexcept { return config_; }

private:
    KeyMaterialStore(
        std::shared_ptr<const interfaces::IPrimitiveProvider> provider,
        std::shared_ptr<interfaces::ISecureStorage> storage,
        configuration::ProtocolConfig config);

    [[nodiscard]] std::shared_ptr<std::shared_mutex> LockFor(std::string_view user_id) const;
    /// Drops the table entry for `user_id` when `lock` is its only other holder.
    void ReleaseIdleLock(std::string_view user_id, std::shared_ptr<std::shared_mutex> lock) const;

    [[nodiscard]] Result<models::PublicKeyBundle, QuantumFailure> GenerateLocked(std::string_view user_id);
    [[nodiscard]] Result<models::PublicKeyBundle, QuantumFailure> LoadPublicLocked(std::string_view user_id) const;
    [[nodiscard]] Result<models::IdentityKeyMaterial, QuantumFailure> LoadPrivateLocked(std::string_view user_id) const;

    std::shared_ptr<const interfaces::IPrimitiveProvider> provider_;
    std::shared_ptr<interfaces::ISecureStorage> storage_;
    configuration::ProtocolConfig config_;

    mutable std::mutex locks_guard_;
    mutable std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> user_locks_;
};

} // namespace qsm::protocol::keystore
