#include <catch2/catch_test_macros.hpp>
#include "qsm/security/replay_protection.hpp"
#include "helpers/counting_primitive_provider.hpp"
#include "helpers/messaging_fixture.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace qsm::protocol;
using namespace qsm::protocol::test_helpers;
using qsm::protocol::models::QuantumMessage;

TEST_CASE("Concurrency - First-time key generation for one user", "[concurrency][keystore]") {
    auto counting = std::make_shared<CountingPrimitiveProvider>(DefaultProvider());
    auto storage = std::make_shared<InMemorySecureStorage>();
    auto store = KeyMaterialStore::Create(counting, storage, ProtocolConfig::Default()).Unwrap();

    constexpr int THREAD_COUNT = 16;

    std::vector<std::vector<uint8_t>> kem_keys(THREAD_COUNT);
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&, t]() {
            auto bundle = store->GenerateAndStoreKeys("alice_123");
            if (bundle.IsErr()) {
                failures.fetch_add(1);
                return;
            }
            kem_keys[t] = bundle.Unwrap().GetKemPublicKey();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE(counting->kem_keygen_calls.load() == 1);
    REQUIRE(counting->sig_keygen_calls.load() == 1);
    for (const auto& key : kem_keys) {
        REQUIRE(key == kem_keys.front());
    }
    REQUIRE(store->GetPublicKeys("alice_123").Unwrap().GetKemPublicKey() == kem_keys.front());
}

TEST_CASE("Concurrency - Independent users generate in parallel", "[concurrency][keystore]") {
    auto storage = std::make_shared<InMemorySecureStorage>();
    auto store = KeyMaterialStore::Create(DefaultProvider(), storage, ProtocolConfig::Default()).Unwrap();

    constexpr int USER_COUNT = 8;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(USER_COUNT);
    for (int u = 0; u < USER_COUNT; ++u) {
        threads.emplace_back([&, u]() {
            if (store->GenerateAndStoreKeys("user_" + std::to_string(u)).IsErr()) {
                failures.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    for (int u = 0; u < USER_COUNT; ++u) {
        REQUIRE(store->HasKeys("user_" + std::to_string(u)));
    }
}

TEST_CASE("Concurrency - Parallel encryption produces unique nonces and ids", "[concurrency][engine][nonce]") {
    auto alice = MakeParty("alice_123");
    auto bob = MakeParty("bob_456");
    const auto alice_keys = alice.Keys();
    const auto bob_contact = bob.AsContact();

    constexpr int THREAD_COUNT = 8;
    constexpr int MESSAGES_PER_THREAD = 125;

    std::unordered_set<std::string> nonces;
    std::unordered_set<std::string> ids;
    std::mutex sets_mutex;
    std::atomic<bool> collision_detected{false};
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);
    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < MESSAGES_PER_THREAD; ++i) {
                auto message = alice.engine->EncryptText("same plaintext", bob_contact, alice_keys);
                if (message.IsErr()) {
                    failures.fetch_add(1);
                    continue;
                }
                const auto& nonce = message.Unwrap().GetNonce();
                std::string nonce_str(nonce.begin(), nonce.end());

                std::lock_guard<std::mutex> lock(sets_mutex);
                if (!nonces.insert(std::move(nonce_str)).second) {
                    collision_detected.store(true);
                }
                if (!ids.insert(message.Unwrap().GetId()).second) {
                    collision_detected.store(true);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(failures.load() == 0);
    REQUIRE_FALSE(collision_detected.load());
    REQUIRE(nonces.size() == THREAD_COUNT * MESSAGES_PER_THREAD);
    REQUIRE(ids.size() == THREAD_COUNT * MESSAGES_PER_THREAD);
}

TEST_CASE("Concurrency - Parallel decryption with shared replay protection", "[concurrency][engine][replay]") {
    auto alice = MakeParty("alice_123");
    auto bob = MakeParty("bob_456");
    bob.engine->AttachReplayProtection(
        std::make_shared<security::ReplayProtection>(ProtocolConfig::Default().GetReplaySettings()));

    constexpr int MESSAGE_COUNT = 64;
    constexpr int THREAD_COUNT = 4;

    const auto alice_keys = alice.Keys();
    const auto bob_contact = bob.AsContact();
    std::vector<QuantumMessage> messages;
    messages.reserve(MESSAGE_COUNT);
    for (int i = 0; i < MESSAGE_COUNT; ++i) {
        messages.push_back(
            alice.engine->EncryptText("message " + std::to_string(i), bob_contact, alice_keys).Unwrap());
    }

    const auto bob_keys = bob.Keys();
    const auto alice_contact = alice.AsContact();

    SECTION("Every message is accepted exactly once when all threads race on all messages") {
        std::atomic<int> accepted{0};
        std::atomic<int> replayed{0};
        std::atomic<int> unexpected{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (const auto& message : messages) {
                    auto result = bob.engine->Decrypt(message, alice_contact, bob_keys);
                    if (result.IsOk()) {
                        accepted.fetch_add(1);
                    } else if (result.UnwrapErr().type == QuantumFailureType::ReplayDetected) {
                        replayed.fetch_add(1);
                    } else {
                        unexpected.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(unexpected.load() == 0);
        REQUIRE(accepted.load() == MESSAGE_COUNT);
        REQUIRE(replayed.load() == MESSAGE_COUNT * (THREAD_COUNT - 1));
    }

    SECTION("Disjoint slices decrypt to the right plaintext") {
        std::atomic<int> mismatches{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);
        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&, t]() {
                for (int i = t; i < MESSAGE_COUNT; i += THREAD_COUNT) {
                    auto result = bob.engine->DecryptText(messages[i], alice_contact, bob_keys);
                    if (result.IsErr() || result.Unwrap() != "message " + std::to_string(i)) {
                        mismatches.fetch_add(1);
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(mismatches.load() == 0);
    }
}

TEST_CASE("Concurrency - Readers during rotation", "[concurrency][keystore]") {
    auto bob = MakeParty("bob_456");
    std::atomic<bool> stop{false};
    std::atomic<int> read_failures{0};

    std::thread reader([&]() {
        while (!stop.load()) {
            auto keys = bob.key_store->GetPrivateKeys("bob_456");
            if (keys.IsErr() || keys.Unwrap().kem_private_key.IsInvalid()) {
                read_failures.fetch_add(1);
            }
        }
    });

    for (int i = 0; i < 3; ++i) {
        REQUIRE(bob.key_store->RotateKeys("bob_456").IsOk());
    }
    stop.store(true);
    reader.join();

    REQUIRE(read_failures.load() == 0);
}
