#include <catch2/catch_test_macros.hpp>
#include "qsm/crypto/aes_gcm.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/protocol/constants.hpp"
using namespace qsm::protocol;
using namespace qsm::protocol::crypto;
TEST_CASE("AES-GCM - Basic encryption and decryption", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Seal and open round-trip with associated data") {
        std::vector<uint8_t> key(kAesKeyBytes, 0xAA);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0xBB);
        std::vector<uint8_t> plaintext = {'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd', '!'};
        std::vector<uint8_t> ad = {'a', 'd'};
        auto sealed = AesGcm::Seal(key, nonce, plaintext, ad);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == plaintext.size() + kAesGcmTagBytes);
        auto opened = AesGcm::Open(key, nonce, sealed.Unwrap(), ad);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap() == plaintext);
    }
    SECTION("Empty plaintext yields a bare tag") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x11);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x22);
        auto sealed = AesGcm::Seal(key, nonce, std::vector<uint8_t>{});
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().size() == kAesGcmTagBytes);
        auto opened = AesGcm::Open(key, nonce, sealed.Unwrap());
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
}
TEST_CASE("AES-GCM - Authentication failures", "[aes_gcm][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> key(kAesKeyBytes, 0x66);
    std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x77);
    std::vector<uint8_t> plaintext = {'s', 'e', 'c', 'r', 'e', 't'};
    std::vector<uint8_t> ad = {'h', 'd', 'r'};
    auto sealed = AesGcm::Seal(key, nonce, plaintext, ad).Unwrap();
    SECTION("Flipped ciphertext bit") {
        auto tampered = sealed;
        tampered[0] ^= 0x01;
        auto opened = AesGcm::Open(key, nonce, tampered, ad);
        REQUIRE(opened.IsErr());
        REQUIRE(opened.UnwrapErr().type == QuantumFailureType::DecryptionFailed);
    }
    SECTION("Flipped tag bit") {
        auto tampered = sealed;
        tampered.back() ^= 0x80;
        REQUIRE(AesGcm::Open(key, nonce, tampered, ad).IsErr());
    }
    SECTION("Wrong key") {
        std::vector<uint8_t> other(kAesKeyBytes, 0x67);
        REQUIRE(AesGcm::Open(other, nonce, sealed, ad).IsErr());
    }
    SECTION("Different associated data") {
        std::vector<uint8_t> other_ad = {'h', 'd', 'R'};
        REQUIRE(AesGcm::Open(key, nonce, sealed, other_ad).IsErr());
        REQUIRE(AesGcm::Open(key, nonce, sealed).IsErr());
    }
    SECTION("Truncated below tag length") {
        std::vector<uint8_t> truncated(sealed.begin(), sealed.begin() + kAesGcmTagBytes - 1);
        REQUIRE(AesGcm::Open(key, nonce, truncated, ad).UnwrapErr().type ==
                QuantumFailureType::DecryptionFailed);
    }
}
TEST_CASE("AES-GCM - Parameter validation", "[aes_gcm]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> plaintext = {1, 2, 3};
    SECTION("Short key") {
        std::vector<uint8_t> key(16, 0x01);
        std::vector<uint8_t> nonce(kAesGcmNonceBytes, 0x02);
        auto result = AesGcm::Seal(key, nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == QuantumFailureType::InvalidInput);
    }
    SECTION("Wrong nonce length") {
        std::vector<uint8_t> key(kAesKeyBytes, 0x01);
        std::vector<uint8_t> nonce(8, 0x02);
        REQUIRE(AesGcm::Seal(key, nonce, plaintext).UnwrapErr().type == QuantumFailureType::InvalidInput);
        REQUIRE(AesGcm::Open(key, nonce, plaintext).UnwrapErr().type == QuantumFailureType::InvalidInput);
    }
}
