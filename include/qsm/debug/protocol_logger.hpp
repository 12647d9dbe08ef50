#pragma once

/**
 * @file protocol_logger.hpp
 * @brief Debug tracing of key lifecycle and message processing.
 *
 * Traces identifiers, algorithm names, byte lengths and failure kinds.
 * No macro here accepts key bytes, shared secrets, derived keys or
 * plaintext.
 *
 * Enable via CMake: -DQSM_DEBUG_LOGGING=ON
 */

#include "qsm/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace qsm::debug {

enum class Component {
    KeyStore,
    Contacts,
    Engine,
    CApi
};

#ifdef QSM_DEBUG_LOGGING

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::KeyStore: return "KEYSTORE";
        case Component::Contacts: return "CONTACTS";
        case Component::Engine: return "ENGINE";
        case Component::CApi: return "C-API";
        default: return "UNKNOWN";
    }
}

#define QSM_LOG_MSG(component, operation, message) \
    do { \
        fprintf(stderr, "[QSM-DEBUG] %s %s %s\n", \
            ::qsm::debug::ComponentToString(component), \
            operation, \
            std::string(message).c_str()); \
        fflush(stderr); \
    } while(0)

#define QSM_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stderr, "[QSM-DEBUG] %s %s %s: %s\n", \
            ::qsm::debug::ComponentToString(component), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stderr); \
    } while(0)

#define QSM_LOG_FAILURE(component, operation, failure) \
    do { \
        fprintf(stderr, "[QSM-DEBUG] %s %s failed: %s\n", \
            ::qsm::debug::ComponentToString(component), \
            operation, \
            std::string(::qsm::protocol::ToString((failure).type)).c_str()); \
        fflush(stderr); \
    } while(0)

inline void LogKeysGenerated(
    std::string_view user_id,
    std::string_view kem_algorithm,
    std::string_view signature_algorithm,
    bool rotated) {
    QSM_LOG_MSG(Component::KeyStore, rotated ? "ROTATE" : "GENERATE",
        std::string(user_id) + " " + std::string(kem_algorithm) + "/" + std::string(signature_algorithm));
}

inline void LogMessageSealed(
    std::string_view message_id,
    size_t plaintext_len,
    size_t kem_ciphertext_len,
    size_t payload_len) {
    QSM_LOG_MSG(Component::Engine, "ENCRYPT", std::string("message ") + std::string(message_id));
    QSM_LOG_VALUE(Component::Engine, "ENCRYPT", "plaintext_len", plaintext_len);
    QSM_LOG_VALUE(Component::Engine, "ENCRYPT", "kem_ciphertext_len", kem_ciphertext_len);
    QSM_LOG_VALUE(Component::Engine, "ENCRYPT", "payload_len", payload_len);
}

inline void LogMessageOpened(std::string_view message_id, size_t plaintext_len) {
    QSM_LOG_MSG(Component::Engine, "DECRYPT", std::string("message ") + std::string(message_id));
    QSM_LOG_VALUE(Component::Engine, "DECRYPT", "plaintext_len", plaintext_len);
}

#else // !QSM_DEBUG_LOGGING

#define QSM_LOG_MSG(component, operation, message) ((void)0)
#define QSM_LOG_VALUE(component, operation, name, value) ((void)0)
#define QSM_LOG_FAILURE(component, operation, failure) ((void)0)

inline void LogKeysGenerated(std::string_view, std::string_view, std::string_view, bool) {}
inline void LogMessageSealed(std::string_view, size_t, size_t, size_t) {}
inline void LogMessageOpened(std::string_view, size_t) {}

#endif // QSM_DEBUG_LOGGING

} // namespace qsm::debug
