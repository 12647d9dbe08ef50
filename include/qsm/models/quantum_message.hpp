#pragma once
#include <cstdint>
#include <string>
#include <vector>
namespace qsm::protocol::models {

/// Field values of a QuantumMessage, in wire order.
struct QuantumMessageFields {
    std::string id;
    std::string sender_id;
    std::string recipient_id;
    std::vector<uint8_t> kem_ciphertext;
    std::vector<uint8_t> encrypted_payload;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> signature;
    int64_t timestamp_ms = 0;
    std::string version;
};

/**
 * @brief The wire message
 *
 * Immutable once constructed. A modified copy can only be produced by
 * building a new message from edited fields, after which the signature no
 * longer verifies.
 */
class QuantumMessage {
public:
    explicit QuantumMessage(QuantumMessageFields fields)
        : fields_(std::move(fields)) {}
    QuantumMessage(const QuantumMessage&) = default;
    QuantumMessage(QuantumMessage&&) noexcept = default;
    QuantumMessage& operator=(const QuantumMessage&) = default;
    QuantumMessage& operator=(QuantumMessage&&) noexcept = default;
    ~QuantumMessage() = default;

    [[nodiscard]] const std::string& GetId() const noexcept { return fields_.id; }
    [[nodiscard]] const std::string& GetSenderId() const noexcept { return fields_.sender_id; }
    [[nodiscard]] const std::string& GetRecipientId() const noexcept { return fields_.recipient_id; }
    [[nodiscard]] const std::vector<uint8_t>& GetKemCiphertext() const noexcept { return fields_.kem_ciphertext; }
    [[nodiscard]] const std::vector<uint8_t>& GetEncryptedPayload() const noexcept { return fields_.encrypted_payload; }
    [[nodiscard]] const std::vector<uint8_t>& GetNonce() const noexcept { return fields_.nonce; }
    [[nodiscard]] const std::vector<uint8_t>& GetSignature() const noexcept { return fields_.signature; }
    [[nodiscard]] int64_t GetTimestampMs() const noexcept { return fields_.timestamp_ms; }
    [[nodiscard]] const std::string& GetVersion() const noexcept { return fields_.version; }

    /// Copy of every field, for building a derived message.
    [[nodiscard]] const QuantumMessageFields& GetFields() const noexcept { return fields_; }

private:
    QuantumMessageFields fields_;
};

}
