#ifndef QSM_CRYPTO_OQS_PRIMITIVE_PROVIDER_HPP
#define QSM_CRYPTO_OQS_PRIMITIVE_PROVIDER_HPP

#include "qsm/interfaces/i_primitive_provider.hpp"
#include <memory>
#include <string_view>

struct OQS_KEM;
struct OQS_SIG;

namespace qsm::protocol::crypto {

/// OqsPrimitiveProvider - IPrimitiveProvider over liboqs
///
/// Works with any KEM and signature algorithm the linked liboqs enables,
/// selected by liboqs algorithm name (e.g. "ML-KEM-768", "ML-DSA-65").
/// All sizes are taken from the liboqs algorithm descriptors.
///
/// Secret keys and shared secrets are written directly into
/// SecureMemoryHandle allocations. liboqs randomness is routed to the
/// libsodium CSPRNG on first use.
///
/// The liboqs descriptors are immutable after construction, so a single
/// instance may be shared across threads.
///
/// @example
/// ```cpp
/// auto provider = OqsPrimitiveProvider::Create("ML-KEM-768", "ML-DSA-65");
/// if (provider.IsOk()) {
///     auto kem_pair = provider.Unwrap()->KemKeygen();
/// }
/// ```
class OqsPrimitiveProvider final : public interfaces::IPrimitiveProvider {
public:
    /// Fails with InitializationFailed when either algorithm is unknown to
    /// or disabled in the linked liboqs.
    [[nodiscard]] static Result<std::shared_ptr<OqsPrimitiveProvider>, QuantumFailure> Create(
        std::string_view kem_algorithm,
        std::string_view signature_algorithm);

    /// Binds liboqs to libsodium randomness. Idempotent.
    static Result<Unit, QuantumFailure> Initialize();

    [[nodiscard]] static bool IsKemEnabled(std::string_view algorithm);
    [[nodiscard]] static bool IsSignatureEnabled(std::string_view algorithm);

    [[nodiscard]] const interfaces::KemParameters& GetKemParameters() const noexcept override;
    [[nodiscard]] const interfaces::SignatureParameters& GetSignatureParameters() const noexcept override;

    [[nodiscard]] Result<interfaces::KeyPair, QuantumFailure> KemKeygen() const override;
    [[nodiscard]] Result<interfaces::Encapsulation, QuantumFailure> KemEncapsulate(
        std::span<const uint8_t> public_key) const override;
    [[nodiscard]] Result<SecureMemoryHandle, QuantumFailure> KemDecapsulate(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> ciphertext) const override;

    [[nodiscard]] Result<interfaces::KeyPair, QuantumFailure> SigKeygen() const override;
    [[nodiscard]] Result<std::vector<uint8_t>, QuantumFailure> Sign(
        const SecureMemoryHandle& private_key,
        std::span<const uint8_t> message) const override;
    [[nodiscard]] Result<bool, QuantumFailure> Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const override;

    OqsPrimitiveProvider(const OqsPrimitiveProvider&) = delete;
    OqsPrimitiveProvider& operator=(const OqsPrimitiveProvider&) = delete;
    ~OqsPrimitiveProvider() override;

private:
    struct OqsKemDeleter {
        void operator()(OQS_KEM* kem) const noexcept;
    };
    struct OqsSigDeleter {
        void operator()(OQS_SIG* sig) const noexcept;
    };

    OqsPrimitiveProvider(
        std::unique_ptr<OQS_KEM, OqsKemDeleter> kem,
        std::unique_ptr<OQS_SIG, OqsSigDeleter> sig);

    std::unique_ptr<OQS_KEM, OqsKemDeleter> kem_;
    std::unique_ptr<OQS_SIG, OqsSigDeleter> sig_;
    interfaces::KemParameters kem_parameters_;
    interfaces::SignatureParameters signature_parameters_;
};

} // namespace qsm::protocol::crypto

#endif // QSM_CRYPTO_OQS_PRIMITIVE_PROVIDER_HPP
