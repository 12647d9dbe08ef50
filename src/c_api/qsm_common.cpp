#include "qsm_internal.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/protocol/constants.hpp"

#include <atomic>
#include <cstring>
#include <mutex>
#include <new>

namespace qsm::internal {

using crypto::OqsPrimitiveProvider;
using crypto::SodiumInterop;

QsmErrorCode EnsureInitialized() {
    static std::once_flag init_flag;
    static std::atomic init_success{false};

    std::call_once(init_flag, [] {
        const auto sodium = SodiumInterop::Initialize();
        const auto oqs = OqsPrimitiveProvider::Initialize();
        init_success.store(sodium.IsOk() && oqs.IsOk(), std::memory_order_release);
    });

    return init_success.load(std::memory_order_acquire)
               ? QSM_SUCCESS
               : QSM_ERROR_INITIALIZATION;
}

void fill_error(QsmError* out_error, const QsmErrorCode code, const std::string& message) {
    if (out_error) {
        out_error->code = code;
#ifdef _WIN32
        out_error->message = _strdup(message.c_str());
#else
        out_error->message = strdup(message.c_str());
#endif
    }
}

QsmErrorCode fill_error_from_failure(QsmError* out_error, const QuantumFailure& failure) {
    QsmErrorCode code = QSM_ERROR_GENERIC;
    switch (failure.type) {
        case QuantumFailureType::KeyNotFound:
            code = QSM_ERROR_KEY_NOT_FOUND;
            break;
        case QuantumFailureType::KeyEncapsulationError:
            code = QSM_ERROR_KEY_ENCAPSULATION;
            break;
        case QuantumFailureType::KeyDecapsulationError:
            code = QSM_ERROR_KEY_DECAPSULATION;
            break;
        case QuantumFailureType::SignatureError:
            code = QSM_ERROR_SIGNATURE;
            break;
        case QuantumFailureType::SignatureVerificationFailed:
            code = QSM_ERROR_SIGNATURE_VERIFICATION;
            break;
        case QuantumFailureType::DecryptionFailed:
            code = QSM_ERROR_DECRYPTION;
            break;
        case QuantumFailureType::UnsupportedProtocolVersion:
            code = QSM_ERROR_UNSUPPORTED_VERSION;
            break;
        case QuantumFailureType::DerivationError:
            code = QSM_ERROR_DERIVATION;
            break;
        case QuantumFailureType::MalformedMessage:
            code = QSM_ERROR_MALFORMED_MESSAGE;
            break;
        case QuantumFailureType::KeyGeneration:
            code = QSM_ERROR_KEY_GENERATION;
            break;
        case QuantumFailureType::EncryptionFailed:
            code = QSM_ERROR_ENCRYPTION;
            break;
        case QuantumFailureType::InvalidInput:
            code = QSM_ERROR_INVALID_INPUT;
            break;
        case QuantumFailureType::StorageFailure:
            code = QSM_ERROR_STORAGE;
            break;
        case QuantumFailureType::ReplayDetected:
            code = QSM_ERROR_REPLAY_DETECTED;
            break;
        case QuantumFailureType::InitializationFailed:
            code = QSM_ERROR_INITIALIZATION;
            break;
        case QuantumFailureType::Generic:
            code = QSM_ERROR_GENERIC;
            break;
    }
    fill_error(out_error, code, failure.message);
    return code;
}

bool validate_buffer_param(const uint8_t* data, const size_t length, QsmError* out_error) {
    if (!data && length > 0) {
        fill_error(out_error, QSM_ERROR_NULL_POINTER, "Buffer data is null but length is non-zero");
        return false;
    }
    return true;
}

bool validate_output_handle(const void* handle, QsmError* out_error) {
    if (!handle) {
        fill_error(out_error, QSM_ERROR_NULL_POINTER, "Output handle pointer is null");
        return false;
    }
    return true;
}

bool validate_c_string(const char* value, std::string_view name, QsmError* out_error) {
    if (!value) {
        fill_error(out_error, QSM_ERROR_NULL_POINTER, std::string(name) + " is null");
        return false;
    }
    const size_t length = strnlen(value, kMaxIdentifierLength + 1);
    if (length == 0 || length > kMaxIdentifierLength) {
        fill_error(out_error, QSM_ERROR_INVALID_INPUT, std::string(name) + " must be 1-256 characters");
        return false;
    }
    return true;
}

bool copy_to_buffer(const std::span<const uint8_t> input, QsmBuffer* out_buffer, QsmError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, QSM_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[input.empty() ? 1 : input.size()];
    if (!data) {
        fill_error(out_error, QSM_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    if (!input.empty()) {
        std::memcpy(data, input.data(), input.size());
    }
    out_buffer->data = data;
    out_buffer->length = input.size();
    return true;
}

bool copy_text_to_buffer(std::string_view text, QsmBuffer* out_buffer, QsmError* out_error) {
    if (!out_buffer) {
        fill_error(out_error, QSM_ERROR_NULL_POINTER, "Output buffer is null");
        return false;
    }

    auto* data = new(std::nothrow) uint8_t[text.size() + 1];
    if (!data) {
        fill_error(out_error, QSM_ERROR_OUT_OF_MEMORY, "Failed to allocate output buffer");
        return false;
    }
    std::memcpy(data, text.data(), text.size());
    data[text.size()] = 0;
    out_buffer->data = data;
    out_buffer->length = text.size();
    return true;
}

} // namespace qsm::internal
