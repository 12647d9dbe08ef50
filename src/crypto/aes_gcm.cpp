#include "qsm/crypto/aes_gcm.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/core/constants.hpp"
#include "qsm/core/format.hpp"
#include "qsm/protocol/constants.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <memory>
namespace qsm::protocol::crypto {
using OpenSSL = OpenSSLConstants;
namespace {
    struct EVP_CIPHER_CTX_Deleter {
        void operator()(EVP_CIPHER_CTX* ctx) const {
            if (ctx) {
                EVP_CIPHER_CTX_free(ctx);
            }
        }
    };
    using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter>;
    std::string GetOpenSSLError() {
        const unsigned long err = ERR_get_error();
        if (err == OpenSSL::NO_ERROR) {
            return std::string(OpenSSL::UNKNOWN_ERROR_MESSAGE);
        }
        char buffer[OpenSSL::ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        return std::string(buffer);
    }
    void Wipe(std::vector<uint8_t>& buffer) {
        SodiumInterop::WipeBytes(std::span<uint8_t>(buffer));
    }
    Result<Unit, QuantumFailure> ValidateKeyAndNonce(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce) {
        if (key.size() != kAesKeyBytes) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InvalidInput(
                    compat::format("AES-256-GCM key must be {} bytes, got {}",
                        kAesKeyBytes, key.size())));
        }
        if (nonce.size() != kAesGcmNonceBytes) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InvalidInput(
                    compat::format("AES-GCM nonce must be {} bytes, got {}",
                        kAesGcmNonceBytes, nonce.size())));
        }
        return Result<Unit, QuantumFailure>::Ok(unit);
    }
}
Result<std::vector<uint8_t>, QuantumFailure>
AesGcm::Seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    using SealResult = Result<std::vector<uint8_t>, QuantumFailure>;
    QSM_RETURN_IF_ERR(ValidateKeyAndNonce(key, nonce), SealResult);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return SealResult::Err(QuantumFailure::EncryptionFailed(
            compat::format("Failed to create cipher context: {}", GetOpenSSLError())));
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return SealResult::Err(QuantumFailure::EncryptionFailed(
            compat::format("Failed to initialize AES-256-GCM: {}", GetOpenSSLError())));
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return SealResult::Err(QuantumFailure::EncryptionFailed(
                compat::format("Failed to add associated data: {}", GetOpenSSLError())));
        }
    }
    std::vector<uint8_t> output(plaintext.size() + kAesGcmTagBytes);
    int ciphertext_len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), output.data(), &ciphertext_len,
                          plaintext.data(),
                          static_cast<int>(plaintext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return SealResult::Err(QuantumFailure::EncryptionFailed(
            compat::format("Encryption failed: {}", GetOpenSSLError())));
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return SealResult::Err(QuantumFailure::EncryptionFailed(
            compat::format("Encryption finalization failed: {}", GetOpenSSLError())));
    }
    ciphertext_len += final_len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            output.data() + ciphertext_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return SealResult::Err(QuantumFailure::EncryptionFailed(
            compat::format("Failed to get authentication tag: {}", GetOpenSSLError())));
    }
    output.resize(static_cast<size_t>(ciphertext_len) + kAesGcmTagBytes);
    return SealResult::Ok(std::move(output));
}
Result<std::vector<uint8_t>, QuantumFailure>
AesGcm::Open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    using OpenResult = Result<std::vector<uint8_t>, QuantumFailure>;
    QSM_RETURN_IF_ERR(ValidateKeyAndNonce(key, nonce), OpenResult);
    if (ciphertext_with_tag.size() < kAesGcmTagBytes) {
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    const size_t ciphertext_len = ciphertext_with_tag.size() - kAesGcmTagBytes;
    std::span<const uint8_t> ciphertext = ciphertext_with_tag.subspan(0, ciphertext_len);
    std::span<const uint8_t> tag = ciphertext_with_tag.subspan(ciphertext_len);
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != OpenSSL::SUCCESS ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != OpenSSL::SUCCESS ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != OpenSSL::SUCCESS) {
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    if (!associated_data.empty()) {
        int outlen = 0;
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &outlen,
                              associated_data.data(),
                              static_cast<int>(associated_data.size())) != OpenSSL::SUCCESS) {
            return OpenResult::Err(QuantumFailure::DecryptionFailed());
        }
    }
    // One spare byte keeps data() non-null for an empty payload.
    std::vector<uint8_t> output(ciphertext_len + 1);
    int plaintext_len = 0;
    if (!ciphertext.empty() &&
        EVP_DecryptUpdate(ctx.get(), output.data(), &plaintext_len,
                          ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    std::vector<uint8_t> tag_copy(tag.begin(), tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(kAesGcmTagBytes),
                            tag_copy.data()) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), output.data() + plaintext_len, &final_len) != OpenSSL::SUCCESS) {
        Wipe(output);
        return OpenResult::Err(QuantumFailure::DecryptionFailed());
    }
    plaintext_len += final_len;
    output.resize(static_cast<size_t>(plaintext_len));
    return OpenResult::Ok(std::move(output));
}
}
