/**
 * @file basic_messaging_example.cpp
 * @brief Two users exchange a post-quantum encrypted message
 */

#include "qsm/codec/message_codec.hpp"
#include "qsm/configuration/protocol_config.hpp"
#include "qsm/crypto/fingerprint.hpp"
#include "qsm/crypto/oqs_primitive_provider.hpp"
#include "qsm/keystore/key_material_store.hpp"
#include "qsm/models/contact.hpp"
#include "qsm/protocol/protocol_engine.hpp"
#include "qsm/storage/in_memory_secure_storage.hpp"

#include <iostream>

using namespace qsm::protocol;
using namespace qsm::protocol::configuration;
using namespace qsm::protocol::crypto;
using namespace qsm::protocol::keystore;
using namespace qsm::protocol::models;

namespace {
    int fail(const std::string& step, const QuantumFailure& failure) {
        std::cerr << step << " failed: " << failure.message << std::endl;
        return 1;
    }
}

int main() {
    std::cout << "=== QSM - Basic Messaging Example ===" << std::endl;
    std::cout << std::endl;

    const auto config = ProtocolConfig::Default();
    std::cout << "1. Creating primitive provider (" << config.GetKemAlgorithm()
              << " / " << config.GetSignatureAlgorithm() << ")..." << std::endl;
    auto provider_result = OqsPrimitiveProvider::Create(config.GetKemAlgorithm(), config.GetSignatureAlgorithm());
    if (provider_result.IsErr()) {
        return fail("Provider creation", provider_result.UnwrapErr());
    }
    auto provider = std::move(provider_result).Unwrap();
    std::cout << "   ✓ KEM public key: " << provider->GetKemParameters().public_key_bytes << " bytes" << std::endl;
    std::cout << "   ✓ Signature public key: " << provider->GetSignatureParameters().public_key_bytes
              << " bytes" << std::endl;
    std::cout << std::endl;

    // Each user keeps keys on their own device
    auto alice_store = KeyMaterialStore::Create(provider, std::make_shared<storage::InMemorySecureStorage>(), config);
    auto bob_store = KeyMaterialStore::Create(provider, std::make_shared<storage::InMemorySecureStorage>(), config);
    if (alice_store.IsErr() || bob_store.IsErr()) {
        std::cerr << "Key store creation failed" << std::endl;
        return 1;
    }

    std::cout << "2. Generating identity keys..." << std::endl;
    if (auto r = alice_store.Unwrap()->GenerateAndStoreKeys("alice_123"); r.IsErr()) {
        return fail("Alice key generation", r.UnwrapErr());
    }
    if (auto r = bob_store.Unwrap()->GenerateAndStoreKeys("bob_456"); r.IsErr()) {
        return fail("Bob key generation", r.UnwrapErr());
    }
    auto alice_export = alice_store.Unwrap()->ExportPublicKeys("alice_123");
    auto bob_export = bob_store.Unwrap()->ExportPublicKeys("bob_456");
    if (alice_export.IsErr() || bob_export.IsErr()) {
        std::cerr << "Public key export failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Alice fingerprint: " << alice_export.Unwrap().fingerprint << std::endl;
    std::cout << "   ✓ Bob fingerprint:   " << bob_export.Unwrap().fingerprint << std::endl;
    std::cout << std::endl;

    std::cout << "3. Exchanging contacts and verifying fingerprints..." << std::endl;
    auto bob_contact = Contact::Create(
        "bob_456", "Bob",
        bob_export.Unwrap().kem_public_key, bob_export.Unwrap().signature_public_key);
    auto alice_contact = Contact::Create(
        "alice_123", "Alice",
        alice_export.Unwrap().kem_public_key, alice_export.Unwrap().signature_public_key);
    if (bob_contact.IsErr() || alice_contact.IsErr()) {
        std::cerr << "Contact creation failed" << std::endl;
        return 1;
    }
    auto verified = bob_contact.Unwrap().MarkVerified(bob_export.Unwrap().fingerprint, config.GetFingerprintBytes());
    if (verified.IsErr() || !verified.Unwrap()) {
        std::cerr << "Fingerprint verification failed" << std::endl;
        return 1;
    }
    std::cout << "   ✓ Bob verified by Alice" << std::endl;
    std::cout << std::endl;

    auto alice_engine = ProtocolEngine::Create(provider, config);
    auto bob_engine = ProtocolEngine::Create(provider, config);
    if (alice_engine.IsErr() || bob_engine.IsErr()) {
        std::cerr << "Engine creation failed" << std::endl;
        return 1;
    }

    std::cout << "4. Alice encrypts a message for Bob..." << std::endl;
    auto alice_keys = alice_store.Unwrap()->GetPrivateKeys("alice_123");
    if (alice_keys.IsErr()) {
        return fail("Loading Alice's keys", alice_keys.UnwrapErr());
    }
    auto message = alice_engine.Unwrap()->EncryptText(
        "Hello Bob! This message is quantum-secure.", bob_contact.Unwrap(), alice_keys.Unwrap());
    if (message.IsErr()) {
        return fail("Encryption", message.UnwrapErr());
    }
    auto json = codec::MessageCodec::ToJson(message.Unwrap());
    if (json.IsErr()) {
        return fail("Serialization", json.UnwrapErr());
    }
    std::cout << "   ✓ Message " << message.Unwrap().GetId() << " ("
              << json.Unwrap().size() << " bytes of JSON)" << std::endl;
    std::cout << std::endl;

    std::cout << "5. Bob decrypts the message..." << std::endl;
    auto received = codec::MessageCodec::FromJson(json.Unwrap());
    if (received.IsErr()) {
        return fail("Parsing", received.UnwrapErr());
    }
    auto bob_keys = bob_store.Unwrap()->GetPrivateKeys("bob_456");
    if (bob_keys.IsErr()) {
        return fail("Loading Bob's keys", bob_keys.UnwrapErr());
    }
    auto plaintext = bob_engine.Unwrap()->DecryptText(received.Unwrap(), alice_contact.Unwrap(), bob_keys.Unwrap());
    if (plaintext.IsErr()) {
        return fail("Decryption", plaintext.UnwrapErr());
    }
    std::cout << "   ✓ Decrypted: " << plaintext.Unwrap() << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
