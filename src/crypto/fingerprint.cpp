#include "qsm/crypto/fingerprint.hpp"
#include "qsm/crypto/sodium_interop.hpp"

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <memory>

namespace qsm::protocol::crypto {

namespace {
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
}

Result<std::string, QuantumFailure> Fingerprint::Compute(
    std::span<const uint8_t> kem_public_key,
    std::span<const uint8_t> signature_public_key,
    const size_t length) {

    if (kem_public_key.empty() || signature_public_key.empty()) {
        return Result<std::string, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Fingerprint requires both public keys"));
    }
    if (length == 0 || length > kSha256Bytes) {
        return Result<std::string, QuantumFailure>::Err(
            QuantumFailure::InvalidInput("Fingerprint length must be between 1 and 32 bytes"));
    }

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Result<std::string, QuantumFailure>::Err(
            QuantumFailure::Generic("Failed to create digest context"));
    }

    std::array<uint8_t, kSha256Bytes> digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), kem_public_key.data(), kem_public_key.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), signature_public_key.data(), signature_public_key.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 ||
        digest_len != kSha256Bytes) {
        return Result<std::string, QuantumFailure>::Err(
            QuantumFailure::Generic("SHA-256 digest failed"));
    }

    return Result<std::string, QuantumFailure>::Ok(
        Render(std::span<const uint8_t>(digest.data(), length)));
}

Result<std::string, QuantumFailure> Fingerprint::Compute(
    const models::PublicKeyBundle& bundle,
    const size_t length) {
    return Compute(bundle.GetKemPublicKey(), bundle.GetSignaturePublicKey(), length);
}

Result<bool, QuantumFailure> Fingerprint::VerifyContact(
    const models::Contact& contact,
    std::string_view expected,
    const size_t length) {
    auto actual = Compute(contact.GetKemPublicKey(), contact.GetSignaturePublicKey(), length);
    if (actual.IsErr()) {
        return Result<bool, QuantumFailure>::Err(std::move(actual).UnwrapErr());
    }
    return Result<bool, QuantumFailure>::Ok(actual.Unwrap() == expected);
}

std::string Fingerprint::Render(std::span<const uint8_t> digest) {
    const std::string hex = SodiumInterop::ToHex(digest);
    std::string rendered;
    rendered.reserve(hex.size() + hex.size() / kFingerprintGroupHexChars);
    for (size_t i = 0; i < hex.size(); ++i) {
        if (i > 0 && i % kFingerprintGroupHexChars == 0) {
            rendered.push_back(' ');
        }
        rendered.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(hex[i]))));
    }
    return rendered;
}

} // namespace qsm::protocol::crypto
