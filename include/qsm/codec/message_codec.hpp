#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/models/quantum_message.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace qsm::protocol::codec {

/**
 * @brief Wire encoding of QuantumMessage and the byte strings the
 * engine signs and authenticates
 *
 * Two wire forms share one protobuf schema (messaging/quantum_message.proto):
 * - binary: protobuf encoding
 * - textual: protobuf JSON mapping with fields id, senderId, recipientId,
 *   kemCiphertext, encryptedPayload, nonce, signature, timestamp, version;
 *   bytes are base64. timestamp is emitted as a JSON string (int64 rule of
 *   the mapping) and accepted as a string or a number.
 *
 * Decoding fails with MalformedMessage when a field is absent, an
 * identifier exceeds kMaxIdentifierLength, the timestamp is negative or
 * the input exceeds kMaxMessageBytes. Field sizes that depend on the
 * protocol version (nonce, GCM tag) are left to ValidateFieldSizes, which
 * the engine applies only after the version has been accepted.
 */
class MessageCodec {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, QuantumFailure> ToBytes(
        const models::QuantumMessage& message);

    [[nodiscard]] static Result<models::QuantumMessage, QuantumFailure> FromBytes(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static Result<std::string, QuantumFailure> ToJson(
        const models::QuantumMessage& message);

    [[nodiscard]] static Result<models::QuantumMessage, QuantumFailure> FromJson(
        std::string_view json);

    /// Version-independent presence checks applied by the decoders.
    /// Fails with MalformedMessage.
    [[nodiscard]] static Result<Unit, QuantumFailure> ValidateStructure(
        const models::QuantumMessageFields& fields);

    /// Nonce and tag sizes of the current message layout. Only meaningful
    /// once the message version has been accepted.
    [[nodiscard]] static Result<Unit, QuantumFailure> ValidateFieldSizes(
        const models::QuantumMessageFields& fields);

    /**
     * @brief Bytes covered by the message signature
     *
     * "QSM-Message-Signature" label, then id, sender_id, recipient_id,
     * kem_ciphertext, encrypted_payload, nonce (each a 4-byte big-endian
     * length followed by the bytes), the timestamp as 8 bytes big-endian
     * and finally the length-prefixed version. The signature field itself
     * is excluded.
     */
    [[nodiscard]] static std::vector<uint8_t> CanonicalSigningInput(
        const models::QuantumMessageFields& fields);

    /// AEAD associated data binding the payload to its routing header:
    /// "QSM-Message-Header" label, then length-prefixed id, sender_id,
    /// recipient_id and version.
    [[nodiscard]] static std::vector<uint8_t> AssociatedData(
        std::string_view id,
        std::string_view sender_id,
        std::string_view recipient_id,
        std::string_view version);

private:
    MessageCodec() = delete;
};

} // namespace qsm::protocol::codec
