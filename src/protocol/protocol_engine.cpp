#include "qsm/protocol/protocol_engine.hpp"
#include "qsm/codec/message_codec.hpp"
#include "qsm/crypto/aes_gcm.hpp"
#include "qsm/crypto/hkdf.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/debug/protocol_logger.hpp"
#include "qsm/protocol/constants.hpp"

#include <chrono>

namespace qsm::protocol {
    using codec::MessageCodec;
    using crypto::AesGcm;
    using crypto::Hkdf;
    using crypto::SecureMemoryHandle;
    using crypto::SodiumInterop;
    using models::QuantumMessageFields;

    namespace {
        int64_t NowMillis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }

        std::span<const uint8_t> AsBytes(std::string_view text) {
            return {reinterpret_cast<const uint8_t *>(text.data()), text.size()};
        }

        template<typename T>
        Result<T, QuantumFailure> Reject(const char *operation, QuantumFailure failure) {
            QSM_LOG_FAILURE(debug::Component::Engine, operation, failure);
            return Result<T, QuantumFailure>::Err(std::move(failure));
        }
    }

    ProtocolEngine::ProtocolEngine(std::shared_ptr<const IPrimitiveProvider> provider, ProtocolConfig config)
        : provider_(std::move(provider))
          , config_(std::move(config)) {
    }

    Result<std::unique_ptr<ProtocolEngine>, QuantumFailure>
    ProtocolEngine::Create(std::shared_ptr<const IPrimitiveProvider> provider, ProtocolConfig config) {
        using CreateResult = Result<std::unique_ptr<ProtocolEngine>, QuantumFailure>;
        if (!provider) {
            return CreateResult::Err(QuantumFailure::InvalidInput("Protocol engine requires a primitive provider"));
        }
        QSM_RETURN_IF_ERR(config.Validate(), CreateResult);
        QSM_RETURN_IF_ERR(config.CheckAlgorithms(provider->GetKemParameters().algorithm,
                                                 provider->GetSignatureParameters().algorithm), CreateResult);
        if (auto sodium = SodiumInterop::Initialize(); sodium.IsErr()) {
            return CreateResult::Err(QuantumFailure::FromSodiumFailure(sodium.UnwrapErr()));
        }
        return CreateResult::Ok(std::unique_ptr<ProtocolEngine>(
            new ProtocolEngine(std::move(provider), std::move(config))));
    }

    void ProtocolEngine::AttachReplayProtection(std::shared_ptr<security::ReplayProtection> replay_protection) {
        replay_protection_ = std::move(replay_protection);
    }

    Result<SecureMemoryHandle, QuantumFailure> ProtocolEngine::DeriveMessageKey(
        const SecureMemoryHandle &shared_secret) const {
        auto derived = shared_secret.WithReadAccess([this](std::span<const uint8_t> secret) {
            return Hkdf::DeriveSecureKey(
                secret,
                AsBytes(config_.GetKeySalt()),
                AsBytes(config_.GetKeyInfo()),
                kAesKeyBytes);
        });
        if (derived.IsErr()) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::DerivationError(derived.UnwrapErr().message));
        }
        return std::move(derived).Unwrap();
    }

    // =============================================================================
    // Encrypt
    // =============================================================================

    Result<QuantumMessage, QuantumFailure> ProtocolEngine::Encrypt(
        std::span<const uint8_t> plaintext,
        const Contact &recipient,
        const IdentityKeyMaterial &sender) const {
        using EncryptResult = Result<QuantumMessage, QuantumFailure>;

        if (plaintext.size() > kMaxPlaintextBytes) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::InvalidInput("Plaintext exceeds the maximum message size"));
        }
        if (sender.user_id.empty() || sender.user_id.size() > kMaxIdentifierLength) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::InvalidInput("Sender user id must be 1-256 characters"));
        }
        if (sender.signature_private_key.IsInvalid()) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::KeyNotFound("Sender signature key is not available"));
        }

        auto encapsulation_result = provider_->KemEncapsulate(recipient.GetKemPublicKey());
        if (encapsulation_result.IsErr()) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::KeyEncapsulationError(encapsulation_result.UnwrapErr().message));
        }
        auto encapsulation = std::move(encapsulation_result).Unwrap();

        auto key_result = DeriveMessageKey(encapsulation.shared_secret);
        if (key_result.IsErr()) {
            return Reject<QuantumMessage>("ENCRYPT", std::move(key_result).UnwrapErr());
        }
        const auto message_key = std::move(key_result).Unwrap();

        QuantumMessageFields fields{
            .id = SodiumInterop::ToHex(SodiumInterop::GetRandomBytes(kMessageIdBytes)),
            .sender_id = sender.user_id,
            .recipient_id = recipient.GetId(),
            .kem_ciphertext = std::move(encapsulation.ciphertext),
            .encrypted_payload = {},
            .nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes),
            .signature = {},
            .timestamp_ms = NowMillis(),
            .version = config_.GetCurrentVersion()
        };

        const auto associated_data = MessageCodec::AssociatedData(
            fields.id, fields.sender_id, fields.recipient_id, fields.version);
        auto sealed = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Seal(key, fields.nonce, plaintext, associated_data);
        });
        if (sealed.IsErr()) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::EncryptionFailed(sealed.UnwrapErr().message));
        }
        auto payload_result = std::move(sealed).Unwrap();
        if (payload_result.IsErr()) {
            return Reject<QuantumMessage>("ENCRYPT", std::move(payload_result).UnwrapErr());
        }
        fields.encrypted_payload = std::move(payload_result).Unwrap();

        const auto signing_input = MessageCodec::CanonicalSigningInput(fields);
        auto signature_result = provider_->Sign(sender.signature_private_key, signing_input);
        if (signature_result.IsErr()) {
            return Reject<QuantumMessage>("ENCRYPT",
                QuantumFailure::SignatureError(signature_result.UnwrapErr().message));
        }
        fields.signature = std::move(signature_result).Unwrap();

        debug::LogMessageSealed(fields.id, plaintext.size(), fields.kem_ciphertext.size(),
                                fields.encrypted_payload.size());
        return EncryptResult::Ok(QuantumMessage(std::move(fields)));
    }

    Result<QuantumMessage, QuantumFailure> ProtocolEngine::EncryptText(
        std::string_view plaintext,
        const Contact &recipient,
        const IdentityKeyMaterial &sender) const {
        return Encrypt(AsBytes(plaintext), recipient, sender);
    }

    // =============================================================================
    // Decrypt
    // =============================================================================

    Result<std::vector<uint8_t>, QuantumFailure> ProtocolEngine::Decrypt(
        const QuantumMessage &message,
        const Contact &sender,
        const IdentityKeyMaterial &recipient) const {
        using Bytes = std::vector<uint8_t>;

        if (!config_.IsVersionAccepted(message.GetVersion())) {
            return Reject<Bytes>("DECRYPT", QuantumFailure::UnsupportedProtocolVersion(
                "Unsupported protocol version: " + message.GetVersion()));
        }
        if (auto shape = MessageCodec::ValidateStructure(message.GetFields()); shape.IsErr()) {
            return Reject<Bytes>("DECRYPT", std::move(shape).UnwrapErr());
        }
        if (auto sizes = MessageCodec::ValidateFieldSizes(message.GetFields()); sizes.IsErr()) {
            return Reject<Bytes>("DECRYPT", std::move(sizes).UnwrapErr());
        }

        const auto signing_input = MessageCodec::CanonicalSigningInput(message.GetFields());
        auto verified = provider_->Verify(sender.GetSignaturePublicKey(), signing_input, message.GetSignature());
        if (verified.IsErr() || !verified.Unwrap()) {
            return Reject<Bytes>("DECRYPT", QuantumFailure::SignatureVerificationFailed());
        }

        // A valid signature from a different party, or a message addressed
        // to someone else, is rejected like any other undecryptable message.
        if (message.GetSenderId() != sender.GetId() || message.GetRecipientId() != recipient.user_id) {
            return Reject<Bytes>("DECRYPT", QuantumFailure::DecryptionFailed());
        }

        auto shared_secret = provider_->KemDecapsulate(recipient.kem_private_key, message.GetKemCiphertext());
        if (shared_secret.IsErr()) {
            return Reject<Bytes>("DECRYPT", QuantumFailure::KeyDecapsulationError());
        }

        auto key_result = DeriveMessageKey(shared_secret.Unwrap());
        if (key_result.IsErr()) {
            return Reject<Bytes>("DECRYPT", std::move(key_result).UnwrapErr());
        }
        const auto message_key = std::move(key_result).Unwrap();

        const auto associated_data = MessageCodec::AssociatedData(
            message.GetId(), message.GetSenderId(), message.GetRecipientId(), message.GetVersion());
        auto opened = message_key.WithReadAccess([&](std::span<const uint8_t> key) {
            return AesGcm::Open(key, message.GetNonce(), message.GetEncryptedPayload(), associated_data);
        });
        if (opened.IsErr() || opened.Unwrap().IsErr()) {
            return Reject<Bytes>("DECRYPT", QuantumFailure::DecryptionFailed());
        }
        auto plaintext = std::move(std::move(opened).Unwrap()).Unwrap();

        if (replay_protection_) {
            if (auto replay = replay_protection_->CheckAndRecordMessage(
                    message.GetSenderId(), message.GetId(), message.GetTimestampMs());
                replay.IsErr()) {
                if (auto wipe = SodiumInterop::SecureWipe(plaintext); wipe.IsErr()) {
                    return Reject<Bytes>("DECRYPT", QuantumFailure::FromSodiumFailure(wipe.UnwrapErr()));
                }
                return Reject<Bytes>("DECRYPT", std::move(replay).UnwrapErr());
            }
        }

        debug::LogMessageOpened(message.GetId(), plaintext.size());
        return Result<Bytes, QuantumFailure>::Ok(std::move(plaintext));
    }

    Result<std::string, QuantumFailure> ProtocolEngine::DecryptText(
        const QuantumMessage &message,
        const Contact &sender,
        const IdentityKeyMaterial &recipient) const {
        auto plaintext = Decrypt(message, sender, recipient);
        if (plaintext.IsErr()) {
            return Result<std::string, QuantumFailure>::Err(std::move(plaintext).UnwrapErr());
        }
        const auto &bytes = plaintext.Unwrap();
        return Result<std::string, QuantumFailure>::Ok(std::string(bytes.begin(), bytes.end()));
    }
}
