#include <catch2/catch_test_macros.hpp>
#include "qsm/keystore/contact_store.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "qsm/crypto/sodium_interop.hpp"
#include "qsm/protocol/constants.hpp"
#include "qsm/storage/in_memory_secure_storage.hpp"
using namespace qsm::protocol;
using namespace qsm::protocol::keystore;
using namespace qsm::protocol::models;
using qsm::protocol::interfaces::StorageNamespace;
TEST_CASE("ContactStore - Save and load", "[contacts][storage]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto storage = std::make_shared<storage::InMemorySecureStorage>();
    ContactStore contacts(storage, kDefaultFingerprintBytes);
    std::vector<uint8_t> kem(64, 0x21);
    std::vector<uint8_t> sig(64, 0x42);
    auto contact = Contact::Create("bob_456", "Bob", kem, sig).Unwrap();
    REQUIRE(contacts.Save(contact).IsOk());
    REQUIRE(contacts.Contains("bob_456"));
    SECTION("Loaded contact matches") {
        auto loaded = contacts.Load("bob_456");
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().GetDisplayName() == "Bob");
        REQUIRE(loaded.Unwrap().GetKemPublicKey() == kem);
        REQUIRE(loaded.Unwrap().GetSignaturePublicKey() == sig);
        REQUIRE_FALSE(loaded.Unwrap().IsVerified());
    }
    SECTION("Verification persists") {
        const auto fingerprint = crypto::Fingerprint::Compute(kem, sig).Unwrap();
        REQUIRE(contacts.MarkVerified("bob_456", fingerprint).Unwrap());
        auto loaded = contacts.Load("bob_456").Unwrap();
        REQUIRE(loaded.IsVerified());
        REQUIRE(loaded.GetVerifiedFingerprint().value() == fingerprint);
    }
    SECTION("Wrong fingerprint is not persisted") {
        REQUIRE_FALSE(contacts.MarkVerified("bob_456", "DEAD BEEF").Unwrap());
        REQUIRE_FALSE(contacts.Load("bob_456").Unwrap().IsVerified());
    }
    SECTION("Replacing the keys drops a stale verification") {
        const auto fingerprint = crypto::Fingerprint::Compute(kem, sig).Unwrap();
        REQUIRE(contacts.MarkVerified("bob_456", fingerprint).Unwrap());
        auto verified = contacts.Load("bob_456").Unwrap();
        REQUIRE(verified.IsVerified());
        std::vector<uint8_t> new_kem(64, 0x22);
        auto replaced = Contact::Create("bob_456", "Bob", new_kem, sig).Unwrap();
        REQUIRE(replaced.MarkVerified(fingerprint, kDefaultFingerprintBytes).Unwrap() == false);
        REQUIRE(contacts.Save(replaced).IsOk());
        REQUIRE_FALSE(contacts.Load("bob_456").Unwrap().IsVerified());
    }
    SECTION("Remove") {
        REQUIRE(contacts.Remove("bob_456").Unwrap());
        REQUIRE_FALSE(contacts.Contains("bob_456"));
        REQUIRE(contacts.Load("bob_456").UnwrapErr().type == QuantumFailureType::KeyNotFound);
    }
}
TEST_CASE("ContactStore - Corrupt records", "[contacts][storage]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    auto storage = std::make_shared<storage::InMemorySecureStorage>();
    ContactStore contacts(storage, kDefaultFingerprintBytes);
    SECTION("Unknown contact") {
        REQUIRE(contacts.Load("ghost").UnwrapErr().type == QuantumFailureType::KeyNotFound);
        REQUIRE(contacts.MarkVerified("ghost", "0000").UnwrapErr().type == QuantumFailureType::KeyNotFound);
    }
    SECTION("Garbage bytes") {
        std::vector<uint8_t> garbage = {0xFF, 0xFF, 0xFF, 0xFF};
        REQUIRE(storage->Put(StorageNamespace::Contacts, "bob_456", garbage).IsOk());
        REQUIRE(contacts.Load("bob_456").UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
    SECTION("Record stored under another id") {
        auto carol = Contact::Create("carol", "Carol", std::vector<uint8_t>(8, 1), std::vector<uint8_t>(8, 2)).Unwrap();
        REQUIRE(contacts.Save(carol).IsOk());
        auto bytes = storage->Get(StorageNamespace::Contacts, "carol").Unwrap();
        auto raw = bytes.ReadBytes(bytes.Size()).Unwrap();
        REQUIRE(storage->Put(StorageNamespace::Contacts, "bob_456", raw).IsOk());
        REQUIRE(contacts.Load("bob_456").UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
}
