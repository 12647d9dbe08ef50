#include "qsm/crypto/hkdf.hpp"
#include "qsm/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>
#include <string>

namespace qsm::protocol::crypto {

namespace {
    struct EvpKdfDeleter {
        void operator()(EVP_KDF* kdf) const { EVP_KDF_free(kdf); }
    };
    struct EvpKdfCtxDeleter {
        void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
    };
}

Result<Unit, QuantumFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError("HKDF output length must be positive"));
    }

    if (output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError(
                "HKDF output size exceeds maximum allowed: " +
                std::to_string(output.size()) + " > " + std::to_string(MAX_OUTPUT_LEN)));
    }

    if (ikm.empty()) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError("HKDF input key material cannot be empty"));
    }

    std::unique_ptr<EVP_KDF, EvpKdfDeleter> kdf(
        EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_HKDF.data(), nullptr));
    if (!kdf) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError("Failed to fetch HKDF algorithm"));
    }

    std::unique_ptr<EVP_KDF_CTX, EvpKdfCtxDeleter> kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OSSL_KDF_PARAM_DIGEST, const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA256.data()), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OSSL_KDF_PARAM_KEY, const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_SALT, const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            OSSL_KDF_PARAM_INFO, const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, QuantumFailure>::Err(
            QuantumFailure::DerivationError("HKDF key derivation failed"));
    }

    return Result<Unit, QuantumFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, QuantumFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info,
    const size_t length) {

    std::vector<uint8_t> output(length);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, QuantumFailure>::Err(std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, QuantumFailure>::Ok(std::move(output));
}

Result<SecureMemoryHandle, QuantumFailure> Hkdf::DeriveSecureKey(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info,
    const size_t length) {

    if (length == 0 || length > MAX_OUTPUT_LEN) {
        return Result<SecureMemoryHandle, QuantumFailure>::Err(
            QuantumFailure::DerivationError(
                "HKDF output length out of range: " + std::to_string(length)));
    }

    auto alloc_result = SecureMemoryHandle::Allocate(length);
    if (alloc_result.IsErr()) {
        return Result<SecureMemoryHandle, QuantumFailure>::Err(
            QuantumFailure::FromSodiumFailure(alloc_result.UnwrapErr()));
    }
    auto key_handle = std::move(alloc_result).Unwrap();

    auto derive_result = key_handle.WithWriteAccess([&](std::span<uint8_t> key_span) {
        return DeriveKey(ikm, key_span, salt, info);
    });
    if (derive_result.IsErr()) {
        return Result<SecureMemoryHandle, QuantumFailure>::Err(
            QuantumFailure::FromSodiumFailure(derive_result.UnwrapErr()));
    }
    if (auto inner = std::move(derive_result).Unwrap(); inner.IsErr()) {
        return Result<SecureMemoryHandle, QuantumFailure>::Err(std::move(inner).UnwrapErr());
    }

    return Result<SecureMemoryHandle, QuantumFailure>::Ok(std::move(key_handle));
}

} // namespace qsm::protocol::crypto
