#pragma once

#include "qsm/c_api/qsm_export.h"

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#define QSM_API_VERSION_MAJOR 1
#define QSM_API_VERSION_MINOR 0
#define QSM_API_VERSION_PATCH 0

typedef enum {
    QSM_SUCCESS = 0,
    QSM_ERROR_GENERIC = 1,
    QSM_ERROR_INVALID_INPUT = 2,
    QSM_ERROR_NULL_POINTER = 3,
    QSM_ERROR_OUT_OF_MEMORY = 4,
    QSM_ERROR_INITIALIZATION = 5,
    QSM_ERROR_KEY_NOT_FOUND = 6,
    QSM_ERROR_KEY_GENERATION = 7,
    QSM_ERROR_KEY_ENCAPSULATION = 8,
    QSM_ERROR_KEY_DECAPSULATION = 9,
    QSM_ERROR_SIGNATURE = 10,
    QSM_ERROR_SIGNATURE_VERIFICATION = 11,
    QSM_ERROR_DECRYPTION = 12,
    QSM_ERROR_UNSUPPORTED_VERSION = 13,
    QSM_ERROR_DERIVATION = 14,
    QSM_ERROR_MALFORMED_MESSAGE = 15,
    QSM_ERROR_ENCRYPTION = 16,
    QSM_ERROR_STORAGE = 17,
    QSM_ERROR_REPLAY_DETECTED = 18
} QsmErrorCode;

typedef enum {
    QSM_SECURITY_LEVEL_1 = 1,
    QSM_SECURITY_LEVEL_3 = 3,
    QSM_SECURITY_LEVEL_5 = 5
} QsmSecurityLevel;

typedef struct QsmContextHandle QsmContextHandle;

typedef struct QsmBuffer {
    uint8_t* data;
    size_t length;
} QsmBuffer;

typedef struct QsmError {
    QsmErrorCode code;
    char* message;
} QsmError;

QSM_API const char* qsm_version(void);

QSM_API QsmErrorCode qsm_init(void);

// A context bundles the liboqs provider, an in-memory secure key store and
// the protocol engine with replay protection attached.
QSM_API QsmErrorCode qsm_context_create(
    QsmSecurityLevel security_level,
    QsmContextHandle** out_handle,
    QsmError* out_error);

QSM_API void qsm_context_destroy(QsmContextHandle* handle);

// Generates keys for user_id on first call; later calls keep the existing
// keys unless rotate is true.
QSM_API QsmErrorCode qsm_generate_keys(
    QsmContextHandle* handle,
    const char* user_id,
    bool rotate,
    QsmError* out_error);

// out_fingerprint holds NUL-terminated text; length excludes the NUL.
QSM_API QsmErrorCode qsm_export_public_keys(
    const QsmContextHandle* handle,
    const char* user_id,
    QsmBuffer* out_kem_public_key,
    QsmBuffer* out_signature_public_key,
    QsmBuffer* out_fingerprint,
    QsmError* out_error);

// Produces the JSON wire form of the message.
QSM_API QsmErrorCode qsm_encrypt(
    const QsmContextHandle* handle,
    const char* sender_user_id,
    const char* recipient_id,
    const uint8_t* recipient_kem_public_key,
    size_t recipient_kem_public_key_length,
    const uint8_t* recipient_signature_public_key,
    size_t recipient_signature_public_key_length,
    const uint8_t* plaintext,
    size_t plaintext_length,
    QsmBuffer* out_message_json,
    QsmError* out_error);

QSM_API QsmErrorCode qsm_decrypt(
    const QsmContextHandle* handle,
    const char* recipient_user_id,
    const char* sender_id,
    const uint8_t* sender_kem_public_key,
    size_t sender_kem_public_key_length,
    const uint8_t* sender_signature_public_key,
    size_t sender_signature_public_key_length,
    const uint8_t* message_json,
    size_t message_json_length,
    QsmBuffer* out_plaintext,
    QsmError* out_error);

QSM_API QsmErrorCode qsm_fingerprint(
    const uint8_t* kem_public_key,
    size_t kem_public_key_length,
    const uint8_t* signature_public_key,
    size_t signature_public_key_length,
    size_t fingerprint_bytes,
    QsmBuffer* out_fingerprint,
    QsmError* out_error);

QSM_API QsmErrorCode qsm_verify_fingerprint(
    const uint8_t* kem_public_key,
    size_t kem_public_key_length,
    const uint8_t* signature_public_key,
    size_t signature_public_key_length,
    const char* expected_fingerprint,
    size_t fingerprint_bytes,
    bool* out_matches,
    QsmError* out_error);

// Wipes and releases the buffer contents. Safe on an empty buffer.
QSM_API void qsm_buffer_free(QsmBuffer* buffer);

QSM_API void qsm_error_free(QsmError* error);

QSM_API const char* qsm_error_string(QsmErrorCode code);

#ifdef __cplusplus
}
#endif
