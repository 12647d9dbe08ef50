#include "qsm/codec/message_codec.hpp"
#include "qsm/core/format.hpp"
#include "qsm/protocol/constants.hpp"
#include "messaging/quantum_message.pb.h"

#include <google/protobuf/util/json_util.h>


namespace qsm::protocol::codec {
    using models::QuantumMessage;
    using models::QuantumMessageFields;

    namespace {
        using WireMessage = proto::messaging::QuantumMessage;

        void AppendLengthPrefixed(std::vector<uint8_t> &out, std::span<const uint8_t> bytes) {
            const auto length = static_cast<uint32_t>(bytes.size());
            out.push_back(static_cast<uint8_t>(length >> 24));
            out.push_back(static_cast<uint8_t>(length >> 16));
            out.push_back(static_cast<uint8_t>(length >> 8));
            out.push_back(static_cast<uint8_t>(length));
            out.insert(out.end(), bytes.begin(), bytes.end());
        }

        void AppendLengthPrefixed(std::vector<uint8_t> &out, std::string_view text) {
            AppendLengthPrefixed(out, std::span<const uint8_t>(
                reinterpret_cast<const uint8_t *>(text.data()), text.size()));
        }

        void AppendUint64(std::vector<uint8_t> &out, const uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        std::vector<uint8_t> ToByteVector(const std::string &bytes) {
            return std::vector<uint8_t>(bytes.begin(), bytes.end());
        }

        WireMessage ToWire(const QuantumMessage &message) {
            WireMessage wire;
            wire.set_id(message.GetId());
            wire.set_sender_id(message.GetSenderId());
            wire.set_recipient_id(message.GetRecipientId());
            wire.set_kem_ciphertext(message.GetKemCiphertext().data(), message.GetKemCiphertext().size());
            wire.set_encrypted_payload(message.GetEncryptedPayload().data(), message.GetEncryptedPayload().size());
            wire.set_nonce(message.GetNonce().data(), message.GetNonce().size());
            wire.set_signature(message.GetSignature().data(), message.GetSignature().size());
            wire.set_timestamp(message.GetTimestampMs());
            wire.set_version(message.GetVersion());
            return wire;
        }

        Result<QuantumMessage, QuantumFailure> FromWire(const WireMessage &wire) {
            if (!wire.has_timestamp()) {
                return Result<QuantumMessage, QuantumFailure>::Err(
                    QuantumFailure::MalformedMessage("Message field timestamp is missing"));
            }
            QuantumMessageFields fields{
                .id = wire.id(),
                .sender_id = wire.sender_id(),
                .recipient_id = wire.recipient_id(),
                .kem_ciphertext = ToByteVector(wire.kem_ciphertext()),
                .encrypted_payload = ToByteVector(wire.encrypted_payload()),
                .nonce = ToByteVector(wire.nonce()),
                .signature = ToByteVector(wire.signature()),
                .timestamp_ms = wire.timestamp(),
                .version = wire.version()
            };
            QSM_RETURN_IF_ERR(MessageCodec::ValidateStructure(fields), Result<QuantumMessage, QuantumFailure>);
            return Result<QuantumMessage, QuantumFailure>::Ok(QuantumMessage(std::move(fields)));
        }

        Result<Unit, QuantumFailure> ValidateIdentifier(const std::string &value, std::string_view name) {
            if (value.empty()) {
                return Result<Unit, QuantumFailure>::Err(
                    QuantumFailure::MalformedMessage(compat::format("Message field {} is missing", name)));
            }
            if (value.size() > kMaxIdentifierLength) {
                return Result<Unit, QuantumFailure>::Err(
                    QuantumFailure::MalformedMessage(compat::format("Message field {} is too long", name)));
            }
            return Result<Unit, QuantumFailure>::Ok(unit);
        }
    }

    Result<Unit, QuantumFailure> MessageCodec::ValidateStructure(const QuantumMessageFields &fields) {
        using ValidateResult = Result<Unit, QuantumFailure>;
        QSM_RETURN_IF_ERR(ValidateIdentifier(fields.id, "id"), ValidateResult);
        QSM_RETURN_IF_ERR(ValidateIdentifier(fields.sender_id, "senderId"), ValidateResult);
        QSM_RETURN_IF_ERR(ValidateIdentifier(fields.recipient_id, "recipientId"), ValidateResult);
        QSM_RETURN_IF_ERR(ValidateIdentifier(fields.version, "version"), ValidateResult);

        if (fields.kem_ciphertext.empty()) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage("Message field kemCiphertext is missing"));
        }
        if (fields.encrypted_payload.empty()) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage("Message field encryptedPayload is missing"));
        }
        if (fields.nonce.empty()) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage("Message field nonce is missing"));
        }
        if (fields.signature.empty()) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage("Message field signature is missing"));
        }
        if (fields.timestamp_ms < 0) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage("Message timestamp is negative"));
        }
        return ValidateResult::Ok(unit);
    }

    Result<Unit, QuantumFailure> MessageCodec::ValidateFieldSizes(const QuantumMessageFields &fields) {
        using ValidateResult = Result<Unit, QuantumFailure>;
        if (fields.encrypted_payload.size() < kAesGcmTagBytes) {
            return ValidateResult::Err(
                QuantumFailure::MalformedMessage("Message field encryptedPayload is shorter than the GCM tag"));
        }
        if (fields.nonce.size() != kAesGcmNonceBytes) {
            return ValidateResult::Err(QuantumFailure::MalformedMessage(
                compat::format("Message nonce must be {} bytes, got {}", kAesGcmNonceBytes, fields.nonce.size())));
        }
        return ValidateResult::Ok(unit);
    }

    // =============================================================================
    // Binary form
    // =============================================================================

    Result<std::vector<uint8_t>, QuantumFailure> MessageCodec::ToBytes(const QuantumMessage &message) {
        const WireMessage wire = ToWire(message);
        const size_t size = wire.ByteSizeLong();
        if (size > kMaxMessageBytes) {
            return Result<std::vector<uint8_t>, QuantumFailure>::Err(
                QuantumFailure::InvalidInput("Encoded message exceeds the maximum message size"));
        }
        std::vector<uint8_t> bytes(size);
        if (!wire.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<std::vector<uint8_t>, QuantumFailure>::Err(
                QuantumFailure::Generic("Failed to serialize QuantumMessage"));
        }
        return Result<std::vector<uint8_t>, QuantumFailure>::Ok(std::move(bytes));
    }

    Result<QuantumMessage, QuantumFailure> MessageCodec::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.empty()) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message is empty"));
        }
        if (bytes.size() > kMaxMessageBytes) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message exceeds the maximum message size"));
        }
        WireMessage wire;
        if (!wire.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message is not a QuantumMessage"));
        }
        return FromWire(wire);
    }

    // =============================================================================
    // JSON form
    // =============================================================================

    Result<std::string, QuantumFailure> MessageCodec::ToJson(const QuantumMessage &message) {
        const WireMessage wire = ToWire(message);
        std::string json;
        google::protobuf::util::JsonPrintOptions options;
        options.add_whitespace = false;
        options.preserve_proto_field_names = false;
        if (const auto status = google::protobuf::util::MessageToJsonString(wire, &json, options); !status.ok()) {
            return Result<std::string, QuantumFailure>::Err(
                QuantumFailure::Generic("Failed to render QuantumMessage as JSON"));
        }
        return Result<std::string, QuantumFailure>::Ok(std::move(json));
    }

    Result<QuantumMessage, QuantumFailure> MessageCodec::FromJson(std::string_view json) {
        if (json.empty()) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message is empty"));
        }
        if (json.size() > kMaxMessageBytes) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message exceeds the maximum message size"));
        }
        WireMessage wire;
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = false;
        if (const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &wire, options);
            !status.ok()) {
            return Result<QuantumMessage, QuantumFailure>::Err(
                QuantumFailure::MalformedMessage("Encoded message is not a valid QuantumMessage JSON object"));
        }
        return FromWire(wire);
    }

    // =============================================================================
    // Signed and authenticated byte strings
    // =============================================================================

    std::vector<uint8_t> MessageCodec::CanonicalSigningInput(const QuantumMessageFields &fields) {
        std::vector<uint8_t> out;
        out.reserve(kSignatureDomainLabel.size() + 7 * 4 + 8 +
                    fields.id.size() + fields.sender_id.size() + fields.recipient_id.size() +
                    fields.kem_ciphertext.size() + fields.encrypted_payload.size() +
                    fields.nonce.size() + fields.version.size());
        out.insert(out.end(), kSignatureDomainLabel.begin(), kSignatureDomainLabel.end());
        AppendLengthPrefixed(out, fields.id);
        AppendLengthPrefixed(out, fields.sender_id);
        AppendLengthPrefixed(out, fields.recipient_id);
        AppendLengthPrefixed(out, fields.kem_ciphertext);
        AppendLengthPrefixed(out, fields.encrypted_payload);
        AppendLengthPrefixed(out, fields.nonce);
        AppendUint64(out, static_cast<uint64_t>(fields.timestamp_ms));
        AppendLengthPrefixed(out, fields.version);
        return out;
    }

    std::vector<uint8_t> MessageCodec::AssociatedData(
        std::string_view id,
        std::string_view sender_id,
        std::string_view recipient_id,
        std::string_view version) {
        std::vector<uint8_t> out;
        out.reserve(kAssociatedDataLabel.size() + 4 * 4 +
                    id.size() + sender_id.size() + recipient_id.size() + version.size());
        out.insert(out.end(), kAssociatedDataLabel.begin(), kAssociatedDataLabel.end());
        AppendLengthPrefixed(out, id);
        AppendLengthPrefixed(out, sender_id);
        AppendLengthPrefixed(out, recipient_id);
        AppendLengthPrefixed(out, version);
        return out;
    }
} // namespace qsm::protocol::codec
