#include <catch2/catch_test_macros.hpp>
#include "qsm/keystore/key_material_store.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "helpers/counting_primitive_provider.hpp"
#include "helpers/failing_secure_storage.hpp"
#include "helpers/messaging_fixture.hpp"
#include <string>
using namespace qsm::protocol;
using namespace qsm::protocol::keystore;
using namespace qsm::protocol::test_helpers;
using qsm::protocol::configuration::ProtocolConfig;
using qsm::protocol::interfaces::StorageNamespace;
namespace {
    std::unique_ptr<KeyMaterialStore> MakeStore(
        std::shared_ptr<const interfaces::IPrimitiveProvider> provider,
        std::shared_ptr<interfaces::ISecureStorage> storage) {
        return KeyMaterialStore::Create(std::move(provider), std::move(storage), ProtocolConfig::Default()).Unwrap();
    }
}
TEST_CASE("KeyMaterialStore - Construction", "[keystore]") {
    auto storage = std::make_shared<storage::InMemorySecureStorage>();
    REQUIRE(KeyMaterialStore::Create(nullptr, storage, ProtocolConfig::Default()).UnwrapErr().type ==
            QuantumFailureType::InvalidInput);
    REQUIRE(KeyMaterialStore::Create(DefaultProvider(), nullptr, ProtocolConfig::Default()).IsErr());
    configuration::ProtocolParameters bad;
    REQUIRE(KeyMaterialStore::Create(DefaultProvider(), storage, ProtocolConfig::Custom(bad)).IsErr());
    SECTION("Provider must implement the configured algorithms") {
        const auto level1 = ProtocolConfig::ForSecurityLevel(configuration::SecurityLevel::Level1);
        auto small_provider = OqsPrimitiveProvider::Create(
            level1.GetKemAlgorithm(), level1.GetSignatureAlgorithm()).Unwrap();
        auto mismatched = KeyMaterialStore::Create(small_provider, storage, ProtocolConfig::Default());
        REQUIRE(mismatched.IsErr());
        REQUIRE(mismatched.UnwrapErr().type == QuantumFailureType::InvalidInput);
        REQUIRE(KeyMaterialStore::Create(small_provider, storage, level1).IsOk());
    }
}
TEST_CASE("KeyMaterialStore - Generate and load", "[keystore]") {
    auto counting = std::make_shared<CountingPrimitiveProvider>(DefaultProvider());
    auto storage = std::make_shared<storage::InMemorySecureStorage>();
    auto store = MakeStore(counting, storage);
    auto bundle = store->GenerateAndStoreKeys("alice_123");
    REQUIRE(bundle.IsOk());
    REQUIRE(bundle.Unwrap().GetUserId() == "alice_123");
    REQUIRE(bundle.Unwrap().GetKemPublicKey().size() == counting->GetKemParameters().public_key_bytes);
    REQUIRE(bundle.Unwrap().GetSignaturePublicKey().size() == counting->GetSignatureParameters().public_key_bytes);
    REQUIRE(store->HasKeys("alice_123"));
    SECTION("Private keys round-trip through storage") {
        auto keys = store->GetPrivateKeys("alice_123");
        REQUIRE(keys.IsOk());
        auto& material = keys.Unwrap();
        REQUIRE(material.user_id == "alice_123");
        REQUIRE(material.kem_public_key == bundle.Unwrap().GetKemPublicKey());
        REQUIRE(material.kem_private_key.Size() == counting->GetKemParameters().secret_key_bytes);
        REQUIRE(material.signature_private_key.Size() == counting->GetSignatureParameters().secret_key_bytes);
        REQUIRE(material.created_at_ms == bundle.Unwrap().GetCreatedAtMs());
    }
    SECTION("Stored private keys are usable") {
        auto keys = store->GetPrivateKeys("alice_123").Unwrap();
        std::vector<uint8_t> message = {1, 2, 3};
        auto signature = counting->Sign(keys.signature_private_key, message).Unwrap();
        REQUIRE(counting->Verify(keys.signature_public_key, message, signature).Unwrap());
        auto enc = counting->KemEncapsulate(keys.kem_public_key).Unwrap();
        auto secret = counting->KemDecapsulate(keys.kem_private_key, enc.ciphertext).Unwrap();
        REQUIRE(secret.ReadBytes(32).Unwrap() == enc.shared_secret.ReadBytes(32).Unwrap());
    }
    SECTION("Generating again reuses the existing keys") {
        counting->ResetCounts();
        auto again = store->GenerateAndStoreKeys("alice_123");
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().GetKemPublicKey() == bundle.Unwrap().GetKemPublicKey());
        REQUIRE(counting->kem_keygen_calls.load() == 0);
        REQUIRE(counting->sig_keygen_calls.load() == 0);
    }
    SECTION("Rotation replaces the keys") {
        auto rotated = store->RotateKeys("alice_123");
        REQUIRE(rotated.IsOk());
        REQUIRE(rotated.Unwrap().GetKemPublicKey() != bundle.Unwrap().GetKemPublicKey());
        REQUIRE(store->GetPublicKeys("alice_123").Unwrap().GetKemPublicKey() ==
                rotated.Unwrap().GetKemPublicKey());
        REQUIRE(store->GetPrivateKeys("alice_123").Unwrap().signature_public_key ==
                rotated.Unwrap().GetSignaturePublicKey());
    }
    SECTION("Users are independent") {
        REQUIRE_FALSE(store->HasKeys("bob_456"));
        auto bob = store->GenerateAndStoreKeys("bob_456").Unwrap();
        REQUIRE(bob.GetKemPublicKey() != bundle.Unwrap().GetKemPublicKey());
        REQUIRE(storage->Count(StorageNamespace::PrivateKeys) == 2);
    }
}
TEST_CASE("KeyMaterialStore - Missing keys", "[keystore]") {
    auto store = MakeStore(DefaultProvider(), std::make_shared<storage::InMemorySecureStorage>());
    auto keys = store->GetPrivateKeys("nobody");
    REQUIRE(keys.IsErr());
    REQUIRE(keys.UnwrapErr().type == QuantumFailureType::KeyNotFound);
    REQUIRE(keys.UnwrapErr().Category() == FailureCategory::KeysNotInitialized);
    REQUIRE(store->GetPublicKeys("nobody").UnwrapErr().type == QuantumFailureType::KeyNotFound);
    REQUIRE(store->ExportPublicKeys("nobody").UnwrapErr().type == QuantumFailureType::KeyNotFound);
    REQUIRE_FALSE(store->HasKeys("nobody"));
}
TEST_CASE("KeyMaterialStore - User id validation", "[keystore]") {
    auto store = MakeStore(DefaultProvider(), std::make_shared<storage::InMemorySecureStorage>());
    REQUIRE(store->GenerateAndStoreKeys("").UnwrapErr().type == QuantumFailureType::InvalidInput);
    REQUIRE(store->GenerateAndStoreKeys(std::string(257, 'u')).IsErr());
    REQUIRE(store->GetPrivateKeys("").UnwrapErr().type == QuantumFailureType::InvalidInput);
    REQUIRE_FALSE(store->HasKeys(""));
}
TEST_CASE("KeyMaterialStore - Export and wipe", "[keystore]") {
    auto store = MakeStore(DefaultProvider(), std::make_shared<storage::InMemorySecureStorage>());
    auto bundle = store->GenerateAndStoreKeys("alice_123").Unwrap();
    SECTION("Export carries the fingerprint of the stored keys") {
        auto exported = store->ExportPublicKeys("alice_123").Unwrap();
        REQUIRE(exported.kem_public_key == bundle.GetKemPublicKey());
        REQUIRE(exported.signature_public_key == bundle.GetSignaturePublicKey());
        REQUIRE(exported.fingerprint == crypto::Fingerprint::Compute(bundle).Unwrap());
    }
    SECTION("Wipe removes both records") {
        REQUIRE(store->WipeKeys("alice_123").Unwrap());
        REQUIRE_FALSE(store->HasKeys("alice_123"));
        REQUIRE(store->GetPrivateKeys("alice_123").UnwrapErr().type == QuantumFailureType::KeyNotFound);
        REQUIRE_FALSE(store->WipeKeys("alice_123").Unwrap());
    }
}
TEST_CASE("KeyMaterialStore - Per-user locks do not accumulate", "[keystore]") {
    auto store = MakeStore(DefaultProvider(), std::make_shared<storage::InMemorySecureStorage>());
    REQUIRE(store->GenerateAndStoreKeys("alice_123").IsOk());
    REQUIRE(store->TrackedLockCount() == 1);
    SECTION("Lookups of unknown users leave nothing behind") {
        for (int i = 0; i < 100; ++i) {
            const auto id = "stranger_" + std::to_string(i);
            REQUIRE_FALSE(store->HasKeys(id));
            REQUIRE(store->GetPublicKeys(id).UnwrapErr().type == QuantumFailureType::KeyNotFound);
            REQUIRE(store->GetPrivateKeys(id).UnwrapErr().type == QuantumFailureType::KeyNotFound);
            REQUIRE(store->ExportPublicKeys(id).IsErr());
        }
        REQUIRE(store->TrackedLockCount() == 1);
        REQUIRE(store->HasKeys("alice_123"));
        REQUIRE(store->TrackedLockCount() == 1);
    }
    SECTION("Wiping releases the user's lock") {
        REQUIRE(store->WipeKeys("alice_123").Unwrap());
        REQUIRE(store->TrackedLockCount() == 0);
        REQUIRE_FALSE(store->WipeKeys("bob_456").Unwrap());
        REQUIRE(store->TrackedLockCount() == 0);
    }
    SECTION("A wiped user can generate again") {
        const auto first = store->GetPublicKeys("alice_123").Unwrap();
        REQUIRE(store->WipeKeys("alice_123").Unwrap());
        auto again = store->GenerateAndStoreKeys("alice_123");
        REQUIRE(again.IsOk());
        REQUIRE(again.Unwrap().GetKemPublicKey() != first.GetKemPublicKey());
        REQUIRE(store->GetPrivateKeys("alice_123").IsOk());
        REQUIRE(store->TrackedLockCount() == 1);
    }
}
TEST_CASE("KeyMaterialStore - Failed writes leave no half-written pair", "[keystore][storage]") {
    auto storage = std::make_shared<FailingSecureStorage>();
    auto store = MakeStore(DefaultProvider(), storage);
    SECTION("First generation") {
        storage->FailPutsTo(StorageNamespace::PublicKeys);
        auto result = store->GenerateAndStoreKeys("alice_123");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == QuantumFailureType::StorageFailure);
        REQUIRE_FALSE(storage->Contains(StorageNamespace::PrivateKeys, "alice_123"));
        REQUIRE_FALSE(store->HasKeys("alice_123"));
    }
    SECTION("Rotation keeps the previous pair") {
        auto original = store->GenerateAndStoreKeys("alice_123").Unwrap();
        storage->FailPutsTo(StorageNamespace::PublicKeys);
        REQUIRE(store->RotateKeys("alice_123").IsErr());
        storage->StopFailing();
        auto keys = store->GetPrivateKeys("alice_123");
        REQUIRE(keys.IsOk());
        REQUIRE(keys.Unwrap().kem_public_key == original.GetKemPublicKey());
    }
    SECTION("Private write failure") {
        storage->FailPutsTo(StorageNamespace::PrivateKeys);
        REQUIRE(store->GenerateAndStoreKeys("alice_123").UnwrapErr().type == QuantumFailureType::StorageFailure);
        REQUIRE_FALSE(store->HasKeys("alice_123"));
    }
}
TEST_CASE("KeyMaterialStore - Keys from another parameter set are rejected", "[keystore]") {
    auto storage = std::make_shared<storage::InMemorySecureStorage>();
    const auto level1 = ProtocolConfig::ForSecurityLevel(configuration::SecurityLevel::Level1);
    auto small_provider = OqsPrimitiveProvider::Create(level1.GetKemAlgorithm(), level1.GetSignatureAlgorithm()).Unwrap();
    auto small_store = KeyMaterialStore::Create(small_provider, storage, level1).Unwrap();
    REQUIRE(small_store->GenerateAndStoreKeys("alice_123").IsOk());
    auto default_store = MakeStore(DefaultProvider(), storage);
    auto keys = default_store->GetPrivateKeys("alice_123");
    REQUIRE(keys.IsErr());
    REQUIRE(keys.UnwrapErr().type == QuantumFailureType::StorageFailure);
}
