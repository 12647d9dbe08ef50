#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/crypto/secure_memory_handle.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
namespace qsm::protocol::interfaces {
using protocol::Result;
using protocol::QuantumFailure;
using crypto::SecureMemoryHandle;

/// Sizes reported by the provider for the KEM it implements.
struct KemParameters {
    std::string algorithm;
    size_t public_key_bytes = 0;
    size_t secret_key_bytes = 0;
    size_t ciphertext_bytes = 0;
    size_t shared_secret_bytes = 0;
};

/// Sizes reported by the provider for the signature scheme it implements.
struct SignatureParameters {
    std::string algorithm;
    size_t public_key_bytes = 0;
    size_t secret_key_bytes = 0;
    size_t max_signature_bytes = 0;
};

struct KeyPair {
    std::vector<uint8_t> public_key;
    SecureMemoryHandle private_key;
};

struct Encapsulation {
    std::vector<uint8_t> ciphertext;
    SecureMemoryHandle shared_secret;
};

/// Byte-in/byte-out post-quantum primitives consumed by the engine.
///
/// Implementations must be safe to call concurrently. A call either returns
/// a complete result or fails; it never leaves partial key material behind.
/// Lengths are whatever the implementation reports through the parameter
/// accessors; callers do not assume fixed sizes.
class IPrimitiveProvider {
public:
    virtual ~IPrimitiveProvider() = default;

    [[nodiscard]] virtual const KemParameters& GetKemParameters() const noexcept = 0;
    [[nodiscard]] virtual const SignatureParameters& GetSignatureParameters() const noexcept = 0;

    [[nodiscard]] virtual Result<KeyPair, QuantumFailure> KemKeygen() const = 0;

    /// Fails with KeyEncapsulationError for a malformed public key.
    [[nodiscard]] virtual Result<Encapsulation, QuantumFailure> KemEncapsulate(
        std::span<const uint8_t> public_key) const = 0;

    /// Fails with KeyDecapsulationError.
    [[nodiscard]] virtual Result<SecureMemoryHandle, QuantumFailure> KemDecapsulate(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> ciphertext) const = 0;

    [[nodiscard]] virtual Result<KeyPair, QuantumFailure> SigKeygen() const = 0;

    /// Fails with SignatureError.
    [[nodiscard]] virtual Result<std::vector<uint8_t>, QuantumFailure> Sign(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> message) const = 0;

    /// Ok(false) for a signature that does not verify, including malformed
    /// key or signature lengths.
    [[nodiscard]] virtual Result<bool, QuantumFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const = 0;
};
}
