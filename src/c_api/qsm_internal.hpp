/**
 * @file qsm_internal.hpp
 * @brief Internal types and helpers shared by the C API implementation
 *
 * Not part of the public API.
 */

#ifndef QSM_INTERNAL_HPP
#define QSM_INTERNAL_HPP

#include "qsm/c_api/qsm_api.h"
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/crypto/oqs_primitive_provider.hpp"
#include "qsm/keystore/key_material_store.hpp"
#include "qsm/protocol/protocol_engine.hpp"
#include "qsm/security/replay_protection.hpp"
#include "qsm/storage/in_memory_secure_storage.hpp"
#include <exception>
#include <memory>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <utility>

/**
 * @brief Opaque handle: one provider, store and engine per context
 */
struct QsmContextHandle {
    std::shared_ptr<qsm::protocol::crypto::OqsPrimitiveProvider> provider;
    std::shared_ptr<qsm::protocol::storage::InMemorySecureStorage> storage;
    std::unique_ptr<qsm::protocol::keystore::KeyMaterialStore> key_store;
    std::unique_ptr<qsm::protocol::ProtocolEngine> engine;
    std::shared_ptr<qsm::protocol::security::ReplayProtection> replay_protection;
};

namespace qsm::internal {

using namespace qsm::protocol;

/**
 * @brief Ensure libsodium and liboqs are initialized
 */
QsmErrorCode EnsureInitialized();

void fill_error(QsmError* out_error, QsmErrorCode code, const std::string& message);

/**
 * @brief Map a QuantumFailure to its error code and fill the error struct
 * @return The corresponding QsmErrorCode
 */
QsmErrorCode fill_error_from_failure(QsmError* out_error, const QuantumFailure& failure);

/**
 * @brief Reject a null data pointer paired with a non-zero length
 */
bool validate_buffer_param(const uint8_t* data, size_t length, QsmError* out_error);

bool validate_output_handle(const void* handle, QsmError* out_error);

/**
 * @brief Reject null or over-long C strings; fills out_error
 */
bool validate_c_string(const char* value, std::string_view name, QsmError* out_error);

/**
 * @brief Copy data to a newly allocated output buffer
 */
bool copy_to_buffer(std::span<const uint8_t> input, QsmBuffer* out_buffer, QsmError* out_error);

/**
 * @brief Copy text to an output buffer with a trailing NUL not counted in length
 */
bool copy_text_to_buffer(std::string_view text, QsmBuffer* out_buffer, QsmError* out_error);

/**
 * @brief Run an API body, converting escaping exceptions to QSM_ERROR_GENERIC
 */
template<typename F>
QsmErrorCode guarded(QsmError* out_error, F&& body) {
    try {
        return std::forward<F>(body)();
    } catch (const std::bad_alloc&) {
        fill_error(out_error, QSM_ERROR_OUT_OF_MEMORY, "Out of memory");
        return QSM_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& ex) {
        fill_error(out_error, QSM_ERROR_GENERIC, ex.what());
        return QSM_ERROR_GENERIC;
    }
}

} // namespace qsm::internal

#endif // QSM_INTERNAL_HPP
