#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/crypto/secure_memory_handle.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace qsm::protocol::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * The key schedule turns a KEM shared secret into the symmetric message
 * key: both parties feed the same secret and the same fixed salt/info
 * constants and therefore arrive at the same key.
 *
 * Deterministic: identical inputs always yield identical output. Every
 * failure is reported as DerivationError.
 */
class Hkdf {
public:
    /**
     * @brief Derive into a caller-supplied buffer
     *
     * @param ikm Input key material; must not be empty
     * @param output Filled completely; 1..MAX_OUTPUT_LEN bytes
     * @param salt Optional salt
     * @param info Optional context string
     */
    static Result<Unit, QuantumFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Convenience form of DeriveKey that allocates `length` bytes.
    static Result<std::vector<uint8_t>, QuantumFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info,
        size_t length);

    /// Derive straight into secure memory; no intermediate heap copy.
    static Result<SecureMemoryHandle, QuantumFailure> DeriveSecureKey(
        std::span<const uint8_t> ikm,
        std::span<const uint8_t> salt,
        std::span<const uint8_t> info,
        size_t length);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace qsm::protocol::crypto
