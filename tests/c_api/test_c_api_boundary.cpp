#include <catch2/catch_test_macros.hpp>
#include "qsm/c_api/qsm_api.h"
#include <cstring>
#include <string>

TEST_CASE("C API - Initialization", "[c_api][boundary][init]") {
    SECTION("Initialize succeeds") {
        REQUIRE(qsm_init() == QSM_SUCCESS);
    }

    SECTION("Multiple initialize calls are safe") {
        REQUIRE(qsm_init() == QSM_SUCCESS);
        REQUIRE(qsm_init() == QSM_SUCCESS);
    }

    SECTION("Version string is valid") {
        const char* version = qsm_version();
        REQUIRE(version != nullptr);
        REQUIRE(std::strcmp(version, "1.0.0") == 0);
    }
}

TEST_CASE("C API - Context creation", "[c_api][boundary][context]") {
    SECTION("Every security level") {
        for (auto level : {QSM_SECURITY_LEVEL_1, QSM_SECURITY_LEVEL_3, QSM_SECURITY_LEVEL_5}) {
            QsmContextHandle* handle = nullptr;
            QsmError error{};
            REQUIRE(qsm_context_create(level, &handle, &error) == QSM_SUCCESS);
            REQUIRE(handle != nullptr);
            qsm_context_destroy(handle);
        }
    }

    SECTION("Unknown security level") {
        QsmContextHandle* handle = nullptr;
        QsmError error{};
        REQUIRE(qsm_context_create(static_cast<QsmSecurityLevel>(2), &handle, &error) == QSM_ERROR_INVALID_INPUT);
        REQUIRE(handle == nullptr);
        REQUIRE(error.code == QSM_ERROR_INVALID_INPUT);
        REQUIRE(error.message != nullptr);
        qsm_error_free(&error);
    }

    SECTION("NULL output handle") {
        QsmError error{};
        REQUIRE(qsm_context_create(QSM_SECURITY_LEVEL_3, nullptr, &error) == QSM_ERROR_NULL_POINTER);
        qsm_error_free(&error);
    }

    SECTION("NULL error output is safe") {
        QsmContextHandle* handle = nullptr;
        REQUIRE(qsm_context_create(static_cast<QsmSecurityLevel>(4), &handle, nullptr) == QSM_ERROR_INVALID_INPUT);
    }

    SECTION("Destroying NULL is safe") {
        qsm_context_destroy(nullptr);
    }
}

TEST_CASE("C API - NULL pointer handling", "[c_api][boundary][null]") {
    QsmContextHandle* handle = nullptr;
    QsmError error{};
    REQUIRE(qsm_context_create(QSM_SECURITY_LEVEL_3, &handle, &error) == QSM_SUCCESS);
    REQUIRE(qsm_generate_keys(handle, "alice_123", false, &error) == QSM_SUCCESS);

    QsmBuffer kem{}, sig{}, fingerprint{};
    REQUIRE(qsm_export_public_keys(handle, "alice_123", &kem, &sig, &fingerprint, &error) == QSM_SUCCESS);
    const uint8_t text[] = {'h', 'i'};

    SECTION("Generate keys - NULL context") {
        REQUIRE(qsm_generate_keys(nullptr, "alice_123", false, &error) == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Generate keys - NULL user id") {
        REQUIRE(qsm_generate_keys(handle, nullptr, false, &error) == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Export - NULL output buffers") {
        REQUIRE(qsm_export_public_keys(handle, "alice_123", nullptr, &sig, &fingerprint, &error)
                == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Encrypt - NULL recipient key with non-zero length") {
        QsmBuffer json{};
        REQUIRE(qsm_encrypt(handle, "alice_123", "alice_123", nullptr, kem.length, sig.data, sig.length,
                            text, sizeof(text), &json, &error) == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Encrypt - NULL output") {
        REQUIRE(qsm_encrypt(handle, "alice_123", "alice_123", kem.data, kem.length, sig.data, sig.length,
                            text, sizeof(text), nullptr, &error) == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Decrypt - NULL message with non-zero length") {
        QsmBuffer plaintext{};
        REQUIRE(qsm_decrypt(handle, "alice_123", "alice_123", kem.data, kem.length, sig.data, sig.length,
                            nullptr, 10, &plaintext, &error) == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Fingerprint - NULL output") {
        REQUIRE(qsm_fingerprint(kem.data, kem.length, sig.data, sig.length, 16, nullptr, &error)
                == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Verify fingerprint - NULL expected text") {
        bool matches = true;
        REQUIRE(qsm_verify_fingerprint(kem.data, kem.length, sig.data, sig.length, nullptr, 16, &matches, &error)
                == QSM_ERROR_NULL_POINTER);
    }

    SECTION("Buffer and error free accept NULL") {
        qsm_buffer_free(nullptr);
        qsm_error_free(nullptr);
        QsmBuffer empty{};
        qsm_buffer_free(&empty);
    }

    qsm_error_free(&error);
    qsm_buffer_free(&kem);
    qsm_buffer_free(&sig);
    qsm_buffer_free(&fingerprint);
    qsm_context_destroy(handle);
}

TEST_CASE("C API - Invalid input", "[c_api][boundary][input]") {
    QsmContextHandle* handle = nullptr;
    QsmError error{};
    REQUIRE(qsm_context_create(QSM_SECURITY_LEVEL_3, &handle, &error) == QSM_SUCCESS);

    SECTION("Empty user id") {
        REQUIRE(qsm_generate_keys(handle, "", false, &error) == QSM_ERROR_INVALID_INPUT);
    }

    SECTION("Over-long user id") {
        const std::string long_id(300, 'x');
        REQUIRE(qsm_generate_keys(handle, long_id.c_str(), false, &error) == QSM_ERROR_INVALID_INPUT);
    }

    SECTION("Recipient key of the wrong size") {
        REQUIRE(qsm_generate_keys(handle, "alice_123", false, &error) == QSM_SUCCESS);
        const uint8_t short_key[32] = {};
        const uint8_t text[] = {'h', 'i'};
        QsmBuffer json{};
        const auto code = qsm_encrypt(handle, "alice_123", "bob_456", short_key, sizeof(short_key),
                                      short_key, sizeof(short_key), text, sizeof(text), &json, &error);
        REQUIRE(code == QSM_ERROR_KEY_ENCAPSULATION);
        REQUIRE(json.data == nullptr);
    }

    SECTION("Empty keys cannot be fingerprinted") {
        QsmBuffer out{};
        const uint8_t key[4] = {1, 2, 3, 4};
        REQUIRE(qsm_fingerprint(nullptr, 0, key, sizeof(key), 16, &out, &error) == QSM_ERROR_INVALID_INPUT);
    }

    SECTION("Fingerprint length outside 1..32") {
        QsmBuffer out{};
        const uint8_t key[4] = {1, 2, 3, 4};
        REQUIRE(qsm_fingerprint(key, sizeof(key), key, sizeof(key), 0, &out, &error) == QSM_ERROR_INVALID_INPUT);
        qsm_error_free(&error);
        REQUIRE(qsm_fingerprint(key, sizeof(key), key, sizeof(key), 33, &out, &error) == QSM_ERROR_INVALID_INPUT);
    }

    qsm_error_free(&error);
    qsm_context_destroy(handle);
}

TEST_CASE("C API - Error strings", "[c_api][boundary][errors]") {
    REQUIRE(std::string(qsm_error_string(QSM_SUCCESS)) == "Success");
    REQUIRE(std::string(qsm_error_string(QSM_ERROR_KEY_NOT_FOUND)) == "Keys not initialized");
    REQUIRE(std::string(qsm_error_string(QSM_ERROR_REPLAY_DETECTED)) == "Replay detected");

    SECTION("Rejections share one description") {
        const std::string decrypt = qsm_error_string(QSM_ERROR_DECRYPTION);
        REQUIRE(decrypt == qsm_error_string(QSM_ERROR_SIGNATURE_VERIFICATION));
        REQUIRE(decrypt == qsm_error_string(QSM_ERROR_KEY_DECAPSULATION));
    }

    SECTION("Unknown codes") {
        REQUIRE(std::string(qsm_error_string(static_cast<QsmErrorCode>(31))) == "Unknown error");
    }
}
