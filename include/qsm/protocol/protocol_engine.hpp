#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/configuration/protocol_config.hpp"
#include "qsm/interfaces/i_primitive_provider.hpp"
#include "qsm/models/contact.hpp"
#include "qsm/models/identity_key_material.hpp"
#include "qsm/models/quantum_message.hpp"
#include "qsm/security/replay_protection.hpp"
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qsm::protocol {
    using configuration::ProtocolConfig;
    using interfaces::IPrimitiveProvider;
    using models::Contact;
    using models::IdentityKeyMaterial;
    using models::QuantumMessage;

    /**
     * @brief Hybrid post-quantum message encryption
     *
     * Encrypt: KEM-encapsulate against the recipient's public key, derive
     * an AES-256-GCM key from the shared secret with HKDF-SHA256 (fixed
     * salt/info from the config), seal under a fresh random nonce with
     * the routing header as associated data, then sign the canonical
     * encoding of every field with the sender's signature key.
     *
     * Decrypt, in this order, stopping at the first failure:
     *   1. protocol version accepted          UnsupportedProtocolVersion
     *   2. field shapes                       MalformedMessage
     *   3. signature over all fields          SignatureVerificationFailed
     *   4. KEM decapsulation                  KeyDecapsulationError
     *   5. key derivation                     DerivationError
     *   6. AEAD open                          DecryptionFailed
     *   7. replay window (when attached)      ReplayDetected
     * Steps 1 and 2 make no primitive call. Nothing past step 3 runs for a
     * message whose signature does not verify.
     *
     * The engine holds no per-message state; Encrypt and Decrypt may run
     * concurrently. Contacts and key material are read-only inputs.
     *
     * @example
     * ```cpp
     * auto engine = ProtocolEngine::Create(provider, ProtocolConfig::Default()).Unwrap();
     * auto message = engine->EncryptText("Hello Bob!", bob_contact, alice_keys);
     * auto text = engine->DecryptText(message.Unwrap(), alice_contact, bob_keys);
     * ```
     */
    class ProtocolEngine {
    public:
        /// Fails with InvalidInput for a null provider or an invalid config.
        [[nodiscard]] static Result<std::unique_ptr<ProtocolEngine>, QuantumFailure>
        Create(std::shared_ptr<const IPrimitiveProvider> provider, ProtocolConfig config);

        [[nodiscard]] Result<QuantumMessage, QuantumFailure> Encrypt(
            std::span<const uint8_t> plaintext,
            const Contact& recipient,
            const IdentityKeyMaterial& sender) const;

        [[nodiscard]] Result<QuantumMessage, QuantumFailure> EncryptText(
            std::string_view plaintext,
            const Contact& recipient,
            const IdentityKeyMaterial& sender) const;

        [[nodiscard]] Result<std::vector<uint8_t>, QuantumFailure> Decrypt(
            const QuantumMessage& message,
            const Contact& sender,
            const IdentityKeyMaterial& recipient) const;

        [[nodiscard]] Result<std::string, QuantumFailure> DecryptText(
            const QuantumMessage& message,
            const Contact& sender,
            const IdentityKeyMaterial& recipient) const;

        /// Not synchronized with in-flight calls; attach before use.
        void AttachReplayProtection(std::shared_ptr<security::ReplayProtection> replay_protection);

        [[nodiscard]] const ProtocolConfig& GetConfig() const noexcept { return config_; }

        ProtocolEngine(const ProtocolEngine&) = delete;
        ProtocolEngine& operator=(const ProtocolEngine&) = delete;
        ~ProtocolEngine() = default;

    private:
        ProtocolEngine(std::shared_ptr<const IPrimitiveProvider> provider, ProtocolConfig config);

        [[nodiscard]] Result<crypto::SecureMemoryHandle, QuantumFailure> DeriveMessageKey(
            const crypto::SecureMemoryHandle& shared_secret) const;

        std::shared_ptr<const IPrimitiveProvider> provider_;
        ProtocolConfig config_;
        std::shared_ptr<security::ReplayProtection> replay_protection_;
    };
}
