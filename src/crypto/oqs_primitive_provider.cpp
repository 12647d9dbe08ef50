#include "qsm/crypto/oqs_primitive_provider.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <oqs/oqs.h>
#include <oqs/rand.h>
#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>

namespace qsm::protocol::crypto {
    using interfaces::Encapsulation;
    using interfaces::KemParameters;
    using interfaces::KeyPair;
    using interfaces::SignatureParameters;

    namespace {
        bool IsAllZero(std::span<const uint8_t> bytes) {
            return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
        }
    }

    void OqsPrimitiveProvider::OqsKemDeleter::operator()(OQS_KEM *kem) const noexcept {
        if (kem != nullptr) {
            OQS_KEM_free(kem);
        }
    }

    void OqsPrimitiveProvider::OqsSigDeleter::operator()(OQS_SIG *sig) const noexcept {
        if (sig != nullptr) {
            OQS_SIG_free(sig);
        }
    }

    // =============================================================================
    // Construction
    // =============================================================================

    Result<Unit, QuantumFailure> OqsPrimitiveProvider::Initialize() {
        static std::once_flag rng_init_flag;
        static std::atomic<bool> initialized{false};
        std::call_once(rng_init_flag, [] {
            if (SodiumInterop::Initialize().IsErr()) {
                return;
            }
            OQS_init();
            OQS_randombytes_custom_algorithm(
                [](uint8_t *buf, size_t len) { randombytes_buf(buf, len); });
            initialized.store(true, std::memory_order_release);
        });
        if (!initialized.load(std::memory_order_acquire)) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InitializationFailed("liboqs/libsodium initialization failed"));
        }
        return Result<Unit, QuantumFailure>::Ok(unit);
    }

    bool OqsPrimitiveProvider::IsKemEnabled(std::string_view algorithm) {
        const std::string name(algorithm);
        return OQS_KEM_alg_is_enabled(name.c_str()) == 1;
    }

    bool OqsPrimitiveProvider::IsSignatureEnabled(std::string_view algorithm) {
        const std::string name(algorithm);
        return OQS_SIG_alg_is_enabled(name.c_str()) == 1;
    }

    Result<std::shared_ptr<OqsPrimitiveProvider>, QuantumFailure>
    OqsPrimitiveProvider::Create(std::string_view kem_algorithm, std::string_view signature_algorithm) {
        using CreateResult = Result<std::shared_ptr<OqsPrimitiveProvider>, QuantumFailure>;
        QSM_RETURN_IF_ERR(Initialize(), CreateResult);

        if (!IsKemEnabled(kem_algorithm)) {
            return CreateResult::Err(QuantumFailure::InitializationFailed(
                "KEM algorithm not enabled in liboqs: " + std::string(kem_algorithm)));
        }
        if (!IsSignatureEnabled(signature_algorithm)) {
            return CreateResult::Err(QuantumFailure::InitializationFailed(
                "Signature algorithm not enabled in liboqs: " + std::string(signature_algorithm)));
        }

        const std::string kem_name(kem_algorithm);
        const std::string sig_name(signature_algorithm);
        std::unique_ptr<OQS_KEM, OqsKemDeleter> kem(OQS_KEM_new(kem_name.c_str()));
        if (!kem) {
            return CreateResult::Err(QuantumFailure::InitializationFailed(
                "Failed to create KEM instance (liboqs): " + kem_name));
        }
        std::unique_ptr<OQS_SIG, OqsSigDeleter> sig(OQS_SIG_new(sig_name.c_str()));
        if (!sig) {
            return CreateResult::Err(QuantumFailure::InitializationFailed(
                "Failed to create signature instance (liboqs): " + sig_name));
        }

        return CreateResult::Ok(std::shared_ptr<OqsPrimitiveProvider>(
            new OqsPrimitiveProvider(std::move(kem), std::move(sig))));
    }

    OqsPrimitiveProvider::OqsPrimitiveProvider(
        std::unique_ptr<OQS_KEM, OqsKemDeleter> kem,
        std::unique_ptr<OQS_SIG, OqsSigDeleter> sig)
        : kem_(std::move(kem))
          , sig_(std::move(sig)) {
        kem_parameters_ = KemParameters{
            .algorithm = kem_->method_name,
            .public_key_bytes = kem_->length_public_key,
            .secret_key_bytes = kem_->length_secret_key,
            .ciphertext_bytes = kem_->length_ciphertext,
            .shared_secret_bytes = kem_->length_shared_secret
        };
        signature_parameters_ = SignatureParameters{
            .algorithm = sig_->method_name,
            .public_key_bytes = sig_->length_public_key,
            .secret_key_bytes = sig_->length_secret_key,
            .max_signature_bytes = sig_->length_signature
        };
    }

    OqsPrimitiveProvider::~OqsPrimitiveProvider() = default;

    const KemParameters &OqsPrimitiveProvider::GetKemParameters() const noexcept {
        return kem_parameters_;
    }

    const SignatureParameters &OqsPrimitiveProvider::GetSignatureParameters() const noexcept {
        return signature_parameters_;
    }

    // =============================================================================
    // KEM
    // =============================================================================

    Result<KeyPair, QuantumFailure> OqsPrimitiveProvider::KemKeygen() const {
        auto sk_handle_result = SecureMemoryHandle::Allocate(kem_parameters_.secret_key_bytes);
        if (sk_handle_result.IsErr()) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
        }
        auto sk_handle = std::move(sk_handle_result).Unwrap();
        std::vector<uint8_t> pk(kem_parameters_.public_key_bytes);

        OQS_STATUS status = OQS_ERROR;
        auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) -> Unit {
            status = OQS_KEM_keypair(kem_.get(), pk.data(), sk_span.data());
            return Unit{};
        });
        if (write_result.IsErr()) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        if (status != OQS_SUCCESS) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration(kem_parameters_.algorithm + " key generation failed"));
        }

        return Result<KeyPair, QuantumFailure>::Ok(KeyPair{
            .public_key = std::move(pk),
            .private_key = std::move(sk_handle)
        });
    }

    Result<Encapsulation, QuantumFailure>
    OqsPrimitiveProvider::KemEncapsulate(std::span<const uint8_t> public_key) const {
        if (public_key.size() != kem_parameters_.public_key_bytes) {
            return Result<Encapsulation, QuantumFailure>::Err(
                QuantumFailure::KeyEncapsulationError(
                    "Invalid " + kem_parameters_.algorithm + " public key size (expected " +
                    std::to_string(kem_parameters_.public_key_bytes) + " bytes, got " +
                    std::to_string(public_key.size()) + ")"));
        }
        if (IsAllZero(public_key)) {
            return Result<Encapsulation, QuantumFailure>::Err(
                QuantumFailure::KeyEncapsulationError(
                    "Invalid " + kem_parameters_.algorithm + " public key (all zeros)"));
        }

        auto ss_handle_result = SecureMemoryHandle::Allocate(kem_parameters_.shared_secret_bytes);
        if (ss_handle_result.IsErr()) {
            return Result<Encapsulation, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(ss_handle_result.UnwrapErr()));
        }
        auto ss_handle = std::move(ss_handle_result).Unwrap();
        std::vector<uint8_t> ciphertext(kem_parameters_.ciphertext_bytes);

        OQS_STATUS status = OQS_ERROR;
        auto write_result = ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) -> Unit {
            status = OQS_KEM_encaps(kem_.get(), ciphertext.data(), ss_span.data(), public_key.data());
            return Unit{};
        });
        if (write_result.IsErr()) {
            return Result<Encapsulation, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        if (status != OQS_SUCCESS) {
            return Result<Encapsulation, QuantumFailure>::Err(
                QuantumFailure::KeyEncapsulationError(kem_parameters_.algorithm + " encapsulation failed"));
        }

        return Result<Encapsulation, QuantumFailure>::Ok(Encapsulation{
            .ciphertext = std::move(ciphertext),
            .shared_secret = std::move(ss_handle)
        });
    }

    Result<SecureMemoryHandle, QuantumFailure>
    OqsPrimitiveProvider::KemDecapsulate(
        const SecureMemoryHandle &private_key,
        std::span<const uint8_t> ciphertext) const {
        if (ciphertext.size() != kem_parameters_.ciphertext_bytes ||
            private_key.Size() != kem_parameters_.secret_key_bytes) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::KeyDecapsulationError());
        }

        auto ss_handle_result = SecureMemoryHandle::Allocate(kem_parameters_.shared_secret_bytes);
        if (ss_handle_result.IsErr()) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(ss_handle_result.UnwrapErr()));
        }
        auto ss_handle = std::move(ss_handle_result).Unwrap();

        OQS_STATUS status = OQS_ERROR;
        auto access_result = private_key.WithReadAccess([&](std::span<const uint8_t> sk_span) {
            return ss_handle.WithWriteAccess([&](std::span<uint8_t> ss_span) -> Unit {
                status = OQS_KEM_decaps(kem_.get(), ss_span.data(), ciphertext.data(), sk_span.data());
                return Unit{};
            });
        });
        if (access_result.IsErr() || access_result.Unwrap().IsErr() || status != OQS_SUCCESS) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::KeyDecapsulationError());
        }

        return Result<SecureMemoryHandle, QuantumFailure>::Ok(std::move(ss_handle));
    }

    // =============================================================================
    // Signatures
    // =============================================================================

    Result<KeyPair, QuantumFailure> OqsPrimitiveProvider::SigKeygen() const {
        auto sk_handle_result = SecureMemoryHandle::Allocate(signature_parameters_.secret_key_bytes);
        if (sk_handle_result.IsErr()) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
        }
        auto sk_handle = std::move(sk_handle_result).Unwrap();
        std::vector<uint8_t> pk(signature_parameters_.public_key_bytes);

        OQS_STATUS status = OQS_ERROR;
        auto write_result = sk_handle.WithWriteAccess([&](std::span<uint8_t> sk_span) -> Unit {
            status = OQS_SIG_keypair(sig_.get(), pk.data(), sk_span.data());
            return Unit{};
        });
        if (write_result.IsErr()) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::FromSodiumFailure(write_result.UnwrapErr()));
        }
        if (status != OQS_SUCCESS) {
            return Result<KeyPair, QuantumFailure>::Err(
                QuantumFailure::KeyGeneration(signature_parameters_.algorithm + " key generation failed"));
        }

        return Result<KeyPair, QuantumFailure>::Ok(KeyPair{
            .public_key = std::move(pk),
            .private_key = std::move(sk_handle)
        });
    }

    Result<std::vector<uint8_t>, QuantumFailure>
    OqsPrimitiveProvider::Sign(const SecureMemoryHandle &private_key, std::span<const uint8_t> message) const {
        if (private_key.Size() != signature_parameters_.secret_key_bytes) {
            return Result<std::vector<uint8_t>, QuantumFailure>::Err(
                QuantumFailure::SignatureError(
                    "Invalid " + signature_parameters_.algorithm + " secret key size"));
        }

        std::vector<uint8_t> signature(signature_parameters_.max_signature_bytes);
        size_t signature_len = 0;
        OQS_STATUS status = OQS_ERROR;
        auto access_result = private_key.WithReadAccess([&](std::span<const uint8_t> sk_span) -> Unit {
            status = OQS_SIG_sign(sig_.get(), signature.data(), &signature_len,
                                  message.data(), message.size(), sk_span.data());
            return Unit{};
        });
        if (access_result.IsErr() || status != OQS_SUCCESS) {
            return Result<std::vector<uint8_t>, QuantumFailure>::Err(
                QuantumFailure::SignatureError(signature_parameters_.algorithm + " signing failed"));
        }

        signature.resize(signature_len);
        return Result<std::vector<uint8_t>, QuantumFailure>::Ok(std::move(signature));
    }

    Result<bool, QuantumFailure> OqsPrimitiveProvider::Verify(
        std::span<const uint8_t> public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) const {
        if (public_key.size() != signature_parameters_.public_key_bytes ||
            signature.empty() ||
            signature.size() > signature_parameters_.max_signature_bytes) {
            return Result<bool, QuantumFailure>::Ok(false);
        }
        const OQS_STATUS status = OQS_SIG_verify(sig_.get(), message.data(), message.size(),
                                                 signature.data(), signature.size(), public_key.data());
        return Result<bool, QuantumFailure>::Ok(status == OQS_SUCCESS);
    }
} // namespace qsm::protocol::crypto
