#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace qsm::protocol::models {

/// Public half of a user's identity keys. Freely copyable and exportable.
class PublicKeyBundle {
public:
    PublicKeyBundle(
        std::string user_id,
        std::vector<uint8_t> kem_public_key,
        std::vector<uint8_t> signature_public_key,
        int64_t created_at_ms)
        : user_id_(std::move(user_id))
        , kem_public_key_(std::move(kem_public_key))
        , signature_public_key_(std::move(signature_public_key))
        , created_at_ms_(created_at_ms) {}
    PublicKeyBundle(const PublicKeyBundle&) = default;
    PublicKeyBundle(PublicKeyBundle&&) noexcept = default;
    PublicKeyBundle& operator=(const PublicKeyBundle&) = default;
    PublicKeyBundle& operator=(PublicKeyBundle&&) noexcept = default;
    ~PublicKeyBundle() = default;
    [[nodiscard]] const std::string& GetUserId() const noexcept {
        return user_id_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetKemPublicKey() const noexcept {
        return kem_public_key_;
    }
    [[nodiscard]] const std::vector<uint8_t>& GetSignaturePublicKey() const noexcept {
        return signature_public_key_;
    }
    [[nodiscard]] int64_t GetCreatedAtMs() const noexcept {
        return created_at_ms_;
    }
private:
    std::string user_id_;
    std::vector<uint8_t> kem_public_key_;
    std::vector<uint8_t> signature_public_key_;
    int64_t created_at_ms_;
};

/// What ExportPublicKeys hands to the outside world.
struct PublicKeyExport {
    std::vector<uint8_t> kem_public_key;
    std::vector<uint8_t> signature_public_key;
    std::string fingerprint;
};

}
