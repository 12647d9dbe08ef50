#pragma once
#include "qsm/crypto/secure_memory_handle.hpp"
#include "qsm/models/public_key_bundle.hpp"
#include <cstdint>
#include <string>
#include <vector>
namespace qsm::protocol::models {

/// A user's complete KEM and signature keypairs as loaded from the key store.
///
/// Private keys are owned secure copies: the instance stays usable after
/// the store rotates or wipes the user's keys. Move-only.
struct IdentityKeyMaterial {
    std::string user_id;
    std::vector<uint8_t> kem_public_key;
    crypto::SecureMemoryHandle kem_private_key;
    std::vector<uint8_t> signature_public_key;
    crypto::SecureMemoryHandle signature_private_key;
    int64_t created_at_ms = 0;

    IdentityKeyMaterial(
        std::string user,
        std::vector<uint8_t> kem_public,
        crypto::SecureMemoryHandle kem_private,
        std::vector<uint8_t> signature_public,
        crypto::SecureMemoryHandle signature_private,
        int64_t created_at)
        : user_id(std::move(user))
        , kem_public_key(std::move(kem_public))
        , kem_private_key(std::move(kem_private))
        , signature_public_key(std::move(signature_public))
        , signature_private_key(std::move(signature_private))
        , created_at_ms(created_at) {
    }
    IdentityKeyMaterial(IdentityKeyMaterial&&) noexcept = default;
    IdentityKeyMaterial& operator=(IdentityKeyMaterial&&) noexcept = default;
    IdentityKeyMaterial(const IdentityKeyMaterial&) = delete;
    IdentityKeyMaterial& operator=(const IdentityKeyMaterial&) = delete;

    [[nodiscard]] PublicKeyBundle GetPublicKeyBundle() const {
        return PublicKeyBundle(user_id, kem_public_key, signature_public_key, created_at_ms);
    }
};
}
