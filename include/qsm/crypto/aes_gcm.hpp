#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include <cstdint>
#include <span>
#include <vector>
namespace qsm::protocol::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP).
 *
 * Stateless primitive: it neither generates nor tracks nonces. The
 * protocol engine draws a fresh random 12-byte nonce for every message
 * and never accepts one from its caller, which is what keeps a
 * (key, nonce) pair from repeating. Each message key is itself single-use
 * because it is derived from a fresh KEM encapsulation.
 *
 * Output layout of Seal: ciphertext || 16-byte tag.
 *
 * Open fails closed: any tag mismatch yields DecryptionFailed and the
 * partially decrypted buffer is wiped before returning.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, QuantumFailure>
    Seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, QuantumFailure>
    Open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
