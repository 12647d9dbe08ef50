#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "qsm/codec/message_codec.hpp"
#include "qsm/protocol/constants.hpp"
#include <string>
using namespace qsm::protocol;
using namespace qsm::protocol::codec;
using namespace qsm::protocol::models;
using Catch::Matchers::ContainsSubstring;
namespace {
    QuantumMessageFields SampleFields() {
        return QuantumMessageFields{
            .id = "0123456789abcdef0123456789abcdef",
            .sender_id = "alice_123",
            .recipient_id = "bob_456",
            .kem_ciphertext = std::vector<uint8_t>(32, 0x11),
            .encrypted_payload = std::vector<uint8_t>(40, 0x22),
            .nonce = std::vector<uint8_t>(kAesGcmNonceBytes, 0x33),
            .signature = std::vector<uint8_t>(64, 0x44),
            .timestamp_ms = 1700000000000,
            .version = "1.0.0"
        };
    }
    void RequireSameMessage(const QuantumMessage& a, const QuantumMessage& b) {
        REQUIRE(a.GetId() == b.GetId());
        REQUIRE(a.GetSenderId() == b.GetSenderId());
        REQUIRE(a.GetRecipientId() == b.GetRecipientId());
        REQUIRE(a.GetKemCiphertext() == b.GetKemCiphertext());
        REQUIRE(a.GetEncryptedPayload() == b.GetEncryptedPayload());
        REQUIRE(a.GetNonce() == b.GetNonce());
        REQUIRE(a.GetSignature() == b.GetSignature());
        REQUIRE(a.GetTimestampMs() == b.GetTimestampMs());
        REQUIRE(a.GetVersion() == b.GetVersion());
    }
}
TEST_CASE("MessageCodec - JSON form", "[codec]") {
    const QuantumMessage message(SampleFields());
    auto json = MessageCodec::ToJson(message);
    REQUIRE(json.IsOk());
    SECTION("Uses the camelCase field names") {
        const auto& text = json.Unwrap();
        for (const char* field : {"\"id\"", "\"senderId\"", "\"recipientId\"", "\"kemCiphertext\"",
                                  "\"encryptedPayload\"", "\"nonce\"", "\"signature\"", "\"timestamp\"",
                                  "\"version\""}) {
            REQUIRE_THAT(text, ContainsSubstring(field));
        }
        REQUIRE_THAT(text, ContainsSubstring("\"MzMzMzMzMzMzMzMz\""));
    }
    SECTION("Parses back") {
        auto parsed = MessageCodec::FromJson(json.Unwrap());
        REQUIRE(parsed.IsOk());
        RequireSameMessage(parsed.Unwrap(), message);
    }
    SECTION("Numeric timestamps are accepted") {
        std::string text = json.Unwrap();
        const std::string quoted = "\"timestamp\":\"1700000000000\"";
        const auto pos = text.find(quoted);
        REQUIRE(pos != std::string::npos);
        text.replace(pos, quoted.size(), "\"timestamp\":1700000000000");
        auto parsed = MessageCodec::FromJson(text);
        REQUIRE(parsed.IsOk());
        REQUIRE(parsed.Unwrap().GetTimestampMs() == 1700000000000);
    }
}
TEST_CASE("MessageCodec - Binary form", "[codec]") {
    const QuantumMessage message(SampleFields());
    auto bytes = MessageCodec::ToBytes(message);
    REQUIRE(bytes.IsOk());
    auto parsed = MessageCodec::FromBytes(bytes.Unwrap());
    REQUIRE(parsed.IsOk());
    RequireSameMessage(parsed.Unwrap(), message);
}
TEST_CASE("MessageCodec - Malformed input", "[codec][security]") {
    SECTION("Empty and unparsable input") {
        REQUIRE(MessageCodec::FromJson("").UnwrapErr().type == QuantumFailureType::MalformedMessage);
        REQUIRE(MessageCodec::FromJson("not json").UnwrapErr().type == QuantumFailureType::MalformedMessage);
        REQUIRE(MessageCodec::FromJson("[1,2,3]").UnwrapErr().type == QuantumFailureType::MalformedMessage);
        REQUIRE(MessageCodec::FromJson("{\"unknownField\":1}").UnwrapErr().type ==
                QuantumFailureType::MalformedMessage);
        REQUIRE(MessageCodec::FromBytes(std::vector<uint8_t>{}).UnwrapErr().type ==
                QuantumFailureType::MalformedMessage);
        std::vector<uint8_t> junk = {0xFF, 0xFF, 0xFF};
        REQUIRE(MessageCodec::FromBytes(junk).UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
    SECTION("Missing fields") {
        REQUIRE(MessageCodec::FromJson("{}").UnwrapErr().type == QuantumFailureType::MalformedMessage);
        auto json = MessageCodec::ToJson(QuantumMessage(SampleFields())).Unwrap();
        auto without_signature = json;
        const auto pos = without_signature.find("\"signature\"");
        REQUIRE(pos != std::string::npos);
        const auto end = without_signature.find(',', pos);
        without_signature.erase(pos, end - pos + 1);
        REQUIRE(MessageCodec::FromJson(without_signature).UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
    SECTION("Missing timestamp") {
        auto json = MessageCodec::ToJson(QuantumMessage(SampleFields())).Unwrap();
        const std::string timestamp = "\"timestamp\":\"1700000000000\",";
        const auto pos = json.find(timestamp);
        REQUIRE(pos != std::string::npos);
        json.erase(pos, timestamp.size());
        auto parsed = MessageCodec::FromJson(json);
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == QuantumFailureType::MalformedMessage);
        REQUIRE_THAT(parsed.UnwrapErr().message, ContainsSubstring("timestamp"));
    }
    SECTION("Zero timestamp is present, not missing") {
        auto fields = SampleFields();
        fields.timestamp_ms = 0;
        auto json = MessageCodec::ToJson(QuantumMessage(fields)).Unwrap();
        REQUIRE_THAT(json, ContainsSubstring("\"timestamp\""));
        REQUIRE(MessageCodec::FromJson(json).Unwrap().GetTimestampMs() == 0);
        auto bytes = MessageCodec::ToBytes(QuantumMessage(fields)).Unwrap();
        REQUIRE(MessageCodec::FromBytes(bytes).IsOk());
    }
    SECTION("Oversized input") {
        std::string huge(kMaxMessageBytes + 1, ' ');
        REQUIRE(MessageCodec::FromJson(huge).UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
}
TEST_CASE("MessageCodec - Structure validation", "[codec]") {
    REQUIRE(MessageCodec::ValidateStructure(SampleFields()).IsOk());
    auto fields = SampleFields();
    SECTION("Identifiers") {
        fields.sender_id.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
        fields = SampleFields();
        fields.recipient_id = std::string(kMaxIdentifierLength + 1, 'r');
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
        fields = SampleFields();
        fields.version.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
    }
    SECTION("Byte fields") {
        fields.kem_ciphertext.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
        fields = SampleFields();
        fields.encrypted_payload.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
        fields = SampleFields();
        fields.nonce.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
        fields = SampleFields();
        fields.signature.clear();
        REQUIRE(MessageCodec::ValidateStructure(fields).IsErr());
    }
    SECTION("Sizes are left to the layout check") {
        fields.nonce.resize(24);
        REQUIRE(MessageCodec::ValidateStructure(fields).IsOk());
        REQUIRE(MessageCodec::ValidateFieldSizes(fields).UnwrapErr().type == QuantumFailureType::MalformedMessage);
        fields = SampleFields();
        fields.nonce.resize(8);
        REQUIRE(MessageCodec::ValidateFieldSizes(fields).IsErr());
        fields = SampleFields();
        fields.encrypted_payload.resize(kAesGcmTagBytes - 1);
        REQUIRE(MessageCodec::ValidateStructure(fields).IsOk());
        REQUIRE(MessageCodec::ValidateFieldSizes(fields).IsErr());
        fields.encrypted_payload.resize(kAesGcmTagBytes);
        REQUIRE(MessageCodec::ValidateFieldSizes(fields).IsOk());
    }
    SECTION("Negative timestamp") {
        fields.timestamp_ms = -1;
        REQUIRE(MessageCodec::ValidateStructure(fields).UnwrapErr().type == QuantumFailureType::MalformedMessage);
    }
}
TEST_CASE("MessageCodec - Signed bytes cover every field", "[codec][security]") {
    const auto base_fields = SampleFields();
    const auto base = MessageCodec::CanonicalSigningInput(base_fields);
    REQUIRE(MessageCodec::CanonicalSigningInput(base_fields) == base);
    auto changed = base_fields;
    SECTION("id") { changed.id[0] = 'f'; }
    SECTION("sender") { changed.sender_id = "alice_124"; }
    SECTION("recipient") { changed.recipient_id = "bob_457"; }
    SECTION("ciphertext") { changed.kem_ciphertext[0] ^= 1; }
    SECTION("payload") { changed.encrypted_payload.back() ^= 1; }
    SECTION("nonce") { changed.nonce[5] ^= 1; }
    SECTION("timestamp") { changed.timestamp_ms += 1; }
    SECTION("version") { changed.version = "1.0.1"; }
    SECTION("field boundaries") {
        changed.sender_id = "alice_12";
        changed.recipient_id = "3bob_456";
    }
    REQUIRE(MessageCodec::CanonicalSigningInput(changed) != base);
}
TEST_CASE("MessageCodec - Associated data binds the header", "[codec][security]") {
    const auto base = MessageCodec::AssociatedData("id", "alice", "bob", "1.0.0");
    REQUIRE(MessageCodec::AssociatedData("id", "alice", "bob", "1.0.0") == base);
    REQUIRE(MessageCodec::AssociatedData("id", "alice", "carol", "1.0.0") != base);
    REQUIRE(MessageCodec::AssociatedData("id", "alicebob", "", "1.0.0") != base);
    REQUIRE(MessageCodec::AssociatedData("id", "alice", "bob", "1.0.1") != base);
}
