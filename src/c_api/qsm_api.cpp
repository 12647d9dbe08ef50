#include "qsm_internal.hpp"
#include "qsm/codec/message_codec.hpp"
#include "qsm/configuration/protocol_config.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/debug/protocol_logger.hpp"

#include <sodium.h>

#include <cstdlib>
#include <new>
#include <vector>

using namespace qsm::internal;
using qsm::protocol::ProtocolEngine;
using qsm::protocol::QuantumFailure;
using qsm::protocol::codec::MessageCodec;
using qsm::protocol::configuration::ProtocolConfig;
using qsm::protocol::configuration::SecurityLevel;
using qsm::protocol::crypto::Fingerprint;
using qsm::protocol::crypto::OqsPrimitiveProvider;
using qsm::protocol::crypto::SodiumInterop;
using qsm::protocol::keystore::KeyGenerationPolicy;
using qsm::protocol::keystore::KeyMaterialStore;
using qsm::protocol::models::Contact;
using qsm::protocol::security::ReplayProtection;
using qsm::protocol::storage::InMemorySecureStorage;

namespace {
    bool validate_context(const QsmContextHandle* handle, QsmError* out_error) {
        if (!handle || !handle->key_store || !handle->engine) {
            fill_error(out_error, QSM_ERROR_NULL_POINTER, "Context handle is null");
            return false;
        }
        return true;
    }

    std::vector<uint8_t> to_vector(const uint8_t* data, const size_t length) {
        if (!data || length == 0) {
            return {};
        }
        return std::vector<uint8_t>(data, data + length);
    }

    bool parse_security_level(const QsmSecurityLevel level, SecurityLevel& out) {
        switch (level) {
            case QSM_SECURITY_LEVEL_1:
                out = SecurityLevel::Level1;
                return true;
            case QSM_SECURITY_LEVEL_3:
                out = SecurityLevel::Level3;
                return true;
            case QSM_SECURITY_LEVEL_5:
                out = SecurityLevel::Level5;
                return true;
        }
        return false;
    }
}

extern "C" {

const char* qsm_version(void) {
    return "1.0.0";
}

QsmErrorCode qsm_init(void) {
    return EnsureInitialized();
}

QsmErrorCode qsm_context_create(
    const QsmSecurityLevel security_level,
    QsmContextHandle** out_handle,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (const auto err = EnsureInitialized(); err != QSM_SUCCESS) {
            fill_error(out_error, err, "Failed to initialize libsodium/liboqs");
            return err;
        }
        if (!validate_output_handle(out_handle, out_error)) {
            return QSM_ERROR_NULL_POINTER;
        }
        SecurityLevel level{};
        if (!parse_security_level(security_level, level)) {
            fill_error(out_error, QSM_ERROR_INVALID_INPUT, "Security level must be 1, 3 or 5");
            return QSM_ERROR_INVALID_INPUT;
        }

        const auto config = ProtocolConfig::ForSecurityLevel(level);
        auto provider_result = OqsPrimitiveProvider::Create(config.GetKemAlgorithm(), config.GetSignatureAlgorithm());
        if (provider_result.IsErr()) {
            return fill_error_from_failure(out_error, provider_result.UnwrapErr());
        }

        auto handle = std::make_unique<QsmContextHandle>();
        handle->provider = std::move(provider_result).Unwrap();
        handle->storage = std::make_shared<InMemorySecureStorage>();

        auto store_result = KeyMaterialStore::Create(handle->provider, handle->storage, config);
        if (store_result.IsErr()) {
            return fill_error_from_failure(out_error, store_result.UnwrapErr());
        }
        handle->key_store = std::move(store_result).Unwrap();

        auto engine_result = ProtocolEngine::Create(handle->provider, config);
        if (engine_result.IsErr()) {
            return fill_error_from_failure(out_error, engine_result.UnwrapErr());
        }
        handle->engine = std::move(engine_result).Unwrap();
        handle->replay_protection = std::make_shared<ReplayProtection>(config.GetReplaySettings());
        handle->engine->AttachReplayProtection(handle->replay_protection);

        *out_handle = handle.release();
        return QSM_SUCCESS;
    });
}

void qsm_context_destroy(QsmContextHandle* handle) {
    delete handle;
}

QsmErrorCode qsm_generate_keys(
    QsmContextHandle* handle,
    const char* user_id,
    const bool rotate,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (!validate_context(handle, out_error) || !validate_c_string(user_id, "User id", out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }
        auto result = handle->key_store->GenerateAndStoreKeys(
            user_id, rotate ? KeyGenerationPolicy::Rotate : KeyGenerationPolicy::ReuseExisting);
        if (result.IsErr()) {
            return fill_error_from_failure(out_error, result.UnwrapErr());
        }
        return QSM_SUCCESS;
    });
}

QsmErrorCode qsm_export_public_keys(
    const QsmContextHandle* handle,
    const char* user_id,
    QsmBuffer* out_kem_public_key,
    QsmBuffer* out_signature_public_key,
    QsmBuffer* out_fingerprint,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (!validate_context(handle, out_error) || !validate_c_string(user_id, "User id", out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }
        if (!out_kem_public_key || !out_signature_public_key || !out_fingerprint) {
            fill_error(out_error, QSM_ERROR_NULL_POINTER, "Output buffer is null");
            return QSM_ERROR_NULL_POINTER;
        }
        auto result = handle->key_store->ExportPublicKeys(user_id);
        if (result.IsErr()) {
            return fill_error_from_failure(out_error, result.UnwrapErr());
        }
        const auto& exported = result.Unwrap();
        if (!copy_to_buffer(exported.kem_public_key, out_kem_public_key, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        if (!copy_to_buffer(exported.signature_public_key, out_signature_public_key, out_error)) {
            qsm_buffer_free(out_kem_public_key);
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        if (!copy_text_to_buffer(exported.fingerprint, out_fingerprint, out_error)) {
            qsm_buffer_free(out_kem_public_key);
            qsm_buffer_free(out_signature_public_key);
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        return QSM_SUCCESS;
    });
}

QsmErrorCode qsm_encrypt(
    const QsmContextHandle* handle,
    const char* sender_user_id,
    const char* recipient_id,
    const uint8_t* recipient_kem_public_key,
    const size_t recipient_kem_public_key_length,
    const uint8_t* recipient_signature_public_key,
    const size_t recipient_signature_public_key_length,
    const uint8_t* plaintext,
    const size_t plaintext_length,
    QsmBuffer* out_message_json,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (!validate_context(handle, out_error) ||
            !validate_c_string(sender_user_id, "Sender user id", out_error) ||
            !validate_c_string(recipient_id, "Recipient id", out_error) ||
            !validate_buffer_param(recipient_kem_public_key, recipient_kem_public_key_length, out_error) ||
            !validate_buffer_param(recipient_signature_public_key, recipient_signature_public_key_length, out_error) ||
            !validate_buffer_param(plaintext, plaintext_length, out_error) ||
            !validate_output_handle(out_message_json, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }

        auto recipient = Contact::Create(
            recipient_id, "",
            to_vector(recipient_kem_public_key, recipient_kem_public_key_length),
            to_vector(recipient_signature_public_key, recipient_signature_public_key_length));
        if (recipient.IsErr()) {
            return fill_error_from_failure(out_error, recipient.UnwrapErr());
        }
        auto sender_keys = handle->key_store->GetPrivateKeys(sender_user_id);
        if (sender_keys.IsErr()) {
            return fill_error_from_failure(out_error, sender_keys.UnwrapErr());
        }

        auto message = handle->engine->Encrypt(
            std::span<const uint8_t>(plaintext, plaintext_length), recipient.Unwrap(), sender_keys.Unwrap());
        if (message.IsErr()) {
            return fill_error_from_failure(out_error, message.UnwrapErr());
        }
        auto json = MessageCodec::ToJson(message.Unwrap());
        if (json.IsErr()) {
            return fill_error_from_failure(out_error, json.UnwrapErr());
        }
        if (!copy_text_to_buffer(json.Unwrap(), out_message_json, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        return QSM_SUCCESS;
    });
}

QsmErrorCode qsm_decrypt(
    const QsmContextHandle* handle,
    const char* recipient_user_id,
    const char* sender_id,
    const uint8_t* sender_kem_public_key,
    const size_t sender_kem_public_key_length,
    const uint8_t* sender_signature_public_key,
    const size_t sender_signature_public_key_length,
    const uint8_t* message_json,
    const size_t message_json_length,
    QsmBuffer* out_plaintext,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (!validate_context(handle, out_error) ||
            !validate_c_string(recipient_user_id, "Recipient user id", out_error) ||
            !validate_c_string(sender_id, "Sender id", out_error) ||
            !validate_buffer_param(sender_kem_public_key, sender_kem_public_key_length, out_error) ||
            !validate_buffer_param(sender_signature_public_key, sender_signature_public_key_length, out_error) ||
            !validate_buffer_param(message_json, message_json_length, out_error) ||
            !validate_output_handle(out_plaintext, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }

        auto message = MessageCodec::FromJson(std::string_view(
            reinterpret_cast<const char*>(message_json), message_json_length));
        if (message.IsErr()) {
            return fill_error_from_failure(out_error, message.UnwrapErr());
        }
        auto sender = Contact::Create(
            sender_id, "",
            to_vector(sender_kem_public_key, sender_kem_public_key_length),
            to_vector(sender_signature_public_key, sender_signature_public_key_length));
        if (sender.IsErr()) {
            return fill_error_from_failure(out_error, sender.UnwrapErr());
        }
        auto recipient_keys = handle->key_store->GetPrivateKeys(recipient_user_id);
        if (recipient_keys.IsErr()) {
            return fill_error_from_failure(out_error, recipient_keys.UnwrapErr());
        }

        auto plaintext = handle->engine->Decrypt(message.Unwrap(), sender.Unwrap(), recipient_keys.Unwrap());
        if (plaintext.IsErr()) {
            return fill_error_from_failure(out_error, plaintext.UnwrapErr());
        }
        auto& bytes = plaintext.Unwrap();
        const bool copied = copy_to_buffer(bytes, out_plaintext, out_error);
        if (auto wipe = SodiumInterop::SecureWipe(bytes); wipe.IsErr()) {
            if (copied) {
                qsm_buffer_free(out_plaintext);
            }
            return fill_error_from_failure(out_error, QuantumFailure::FromSodiumFailure(wipe.UnwrapErr()));
        }
        if (!copied) {
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        return QSM_SUCCESS;
    });
}

QsmErrorCode qsm_fingerprint(
    const uint8_t* kem_public_key,
    const size_t kem_public_key_length,
    const uint8_t* signature_public_key,
    const size_t signature_public_key_length,
    const size_t fingerprint_bytes,
    QsmBuffer* out_fingerprint,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (const auto err = EnsureInitialized(); err != QSM_SUCCESS) {
            fill_error(out_error, err, "Failed to initialize libsodium/liboqs");
            return err;
        }
        if (!validate_buffer_param(kem_public_key, kem_public_key_length, out_error) ||
            !validate_buffer_param(signature_public_key, signature_public_key_length, out_error) ||
            !validate_output_handle(out_fingerprint, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }
        auto fingerprint = Fingerprint::Compute(
            std::span<const uint8_t>(kem_public_key, kem_public_key_length),
            std::span<const uint8_t>(signature_public_key, signature_public_key_length),
            fingerprint_bytes);
        if (fingerprint.IsErr()) {
            return fill_error_from_failure(out_error, fingerprint.UnwrapErr());
        }
        if (!copy_text_to_buffer(fingerprint.Unwrap(), out_fingerprint, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_OUT_OF_MEMORY;
        }
        return QSM_SUCCESS;
    });
}

QsmErrorCode qsm_verify_fingerprint(
    const uint8_t* kem_public_key,
    const size_t kem_public_key_length,
    const uint8_t* signature_public_key,
    const size_t signature_public_key_length,
    const char* expected_fingerprint,
    const size_t fingerprint_bytes,
    bool* out_matches,
    QsmError* out_error) {
    return guarded(out_error, [&]() -> QsmErrorCode {
        if (const auto err = EnsureInitialized(); err != QSM_SUCCESS) {
            fill_error(out_error, err, "Failed to initialize libsodium/liboqs");
            return err;
        }
        if (!validate_buffer_param(kem_public_key, kem_public_key_length, out_error) ||
            !validate_buffer_param(signature_public_key, signature_public_key_length, out_error) ||
            !validate_output_handle(out_matches, out_error)) {
            return out_error ? out_error->code : QSM_ERROR_NULL_POINTER;
        }
        if (!expected_fingerprint) {
            fill_error(out_error, QSM_ERROR_NULL_POINTER, "Expected fingerprint is null");
            return QSM_ERROR_NULL_POINTER;
        }
        auto contact = Contact::Create(
            "fingerprint-check", "",
            to_vector(kem_public_key, kem_public_key_length),
            to_vector(signature_public_key, signature_public_key_length));
        if (contact.IsErr()) {
            return fill_error_from_failure(out_error, contact.UnwrapErr());
        }
        auto matches = Fingerprint::VerifyContact(contact.Unwrap(), expected_fingerprint, fingerprint_bytes);
        if (matches.IsErr()) {
            return fill_error_from_failure(out_error, matches.UnwrapErr());
        }
        *out_matches = matches.Unwrap();
        return QSM_SUCCESS;
    });
}

void qsm_buffer_free(QsmBuffer* buffer) {
    if (buffer && buffer->data) {
        if (buffer->length > 0) {
            sodium_memzero(buffer->data, buffer->length);
        }
        delete[] buffer->data;
        buffer->data = nullptr;
        buffer->length = 0;
    }
}

void qsm_error_free(QsmError* error) {
    if (error && error->message) {
        free(error->message);
        error->message = nullptr;
    }
}

const char* qsm_error_string(const QsmErrorCode code) {
    switch (code) {
        case QSM_SUCCESS: return "Success";
        case QSM_ERROR_GENERIC: return "Generic error";
        case QSM_ERROR_INVALID_INPUT: return "Invalid input";
        case QSM_ERROR_NULL_POINTER: return "Null pointer";
        case QSM_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case QSM_ERROR_INITIALIZATION: return "Initialization failed";
        case QSM_ERROR_KEY_NOT_FOUND: return "Keys not initialized";
        case QSM_ERROR_KEY_GENERATION: return "Key generation failed";
        case QSM_ERROR_KEY_ENCAPSULATION: return "Key encapsulation failed";
        case QSM_ERROR_KEY_DECAPSULATION: return "Message rejected";
        case QSM_ERROR_SIGNATURE: return "Signing failed";
        case QSM_ERROR_SIGNATURE_VERIFICATION: return "Message rejected";
        case QSM_ERROR_DECRYPTION: return "Message rejected";
        case QSM_ERROR_UNSUPPORTED_VERSION: return "Unsupported protocol version";
        case QSM_ERROR_DERIVATION: return "Key derivation failed";
        case QSM_ERROR_MALFORMED_MESSAGE: return "Malformed message";
        case QSM_ERROR_ENCRYPTION: return "Encryption failed";
        case QSM_ERROR_STORAGE: return "Storage failure";
        case QSM_ERROR_REPLAY_DETECTED: return "Replay detected";
    }
    return "Unknown error";
}

} // extern "C"
