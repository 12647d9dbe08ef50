#pragma once
#include <string>
#include <string_view>
namespace qsm::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class QuantumFailureType {
    KeyNotFound,
    KeyEncapsulationError,
    KeyDecapsulationError,
    SignatureError,
    SignatureVerificationFailed,
    DecryptionFailed,
    UnsupportedProtocolVersion,
    DerivationError,
    MalformedMessage,
    KeyGeneration,
    EncryptionFailed,
    InvalidInput,
    StorageFailure,
    ReplayDetected,
    InitializationFailed,
    Generic
};

/// What a caller can tell its user about a failure.
enum class FailureCategory {
    /// Uniform rejection of an inbound message ("cannot decrypt").
    CannotDecrypt,
    /// Local keys were never generated ("set up your keys first").
    KeysNotInitialized,
    /// Anything else: bad arguments, storage, provider or configuration trouble.
    LocalFailure
};

class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Failure raised by any qsm operation.
///
/// Messages describe the failed step only; they never embed key bytes,
/// shared secrets, derived keys or plaintext.
class QuantumFailure {
public:
    QuantumFailureType type;
    std::string message;
    QuantumFailure(const QuantumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}

    /// Text shared by every inbound-message rejection so the message alone
    /// does not reveal which check failed.
    static constexpr std::string_view kRejectedMessageText = "Message rejected";

    static QuantumFailure KeyNotFound(std::string msg) {
        return {QuantumFailureType::KeyNotFound, std::move(msg)};
    }
    static QuantumFailure KeyEncapsulationError(std::string msg) {
        return {QuantumFailureType::KeyEncapsulationError, std::move(msg)};
    }
    static QuantumFailure KeyDecapsulationError() {
        return {QuantumFailureType::KeyDecapsulationError, std::string(kRejectedMessageText)};
    }
    static QuantumFailure SignatureError(std::string msg) {
        return {QuantumFailureType::SignatureError, std::move(msg)};
    }
    static QuantumFailure SignatureVerificationFailed() {
        return {QuantumFailureType::SignatureVerificationFailed, std::string(kRejectedMessageText)};
    }
    static QuantumFailure DecryptionFailed() {
        return {QuantumFailureType::DecryptionFailed, std::string(kRejectedMessageText)};
    }
    static QuantumFailure UnsupportedProtocolVersion(std::string msg) {
        return {QuantumFailureType::UnsupportedProtocolVersion, std::move(msg)};
    }
    static QuantumFailure DerivationError(std::string msg) {
        return {QuantumFailureType::DerivationError, std::move(msg)};
    }
    static QuantumFailure MalformedMessage(std::string msg) {
        return {QuantumFailureType::MalformedMessage, std::move(msg)};
    }
    static QuantumFailure KeyGeneration(std::string msg) {
        return {QuantumFailureType::KeyGeneration, std::move(msg)};
    }
    static QuantumFailure EncryptionFailed(std::string msg) {
        return {QuantumFailureType::EncryptionFailed, std::move(msg)};
    }
    static QuantumFailure InvalidInput(std::string msg) {
        return {QuantumFailureType::InvalidInput, std::move(msg)};
    }
    static QuantumFailure StorageFailure(std::string msg) {
        return {QuantumFailureType::StorageFailure, std::move(msg)};
    }
    static QuantumFailure ReplayDetected(std::string msg) {
        return {QuantumFailureType::ReplayDetected, std::move(msg)};
    }
    static QuantumFailure InitializationFailed(std::string msg) {
        return {QuantumFailureType::InitializationFailed, std::move(msg)};
    }
    static QuantumFailure Generic(std::string msg) {
        return {QuantumFailureType::Generic, std::move(msg)};
    }
    static QuantumFailure FromSodiumFailure(const SodiumFailure& sf) {
        if (sf.type == SodiumFailureType::InitializationFailed) {
            return InitializationFailed(sf.message);
        }
        return Generic(sf.message);
    }

    [[nodiscard]] FailureCategory Category() const noexcept {
        switch (type) {
            case QuantumFailureType::SignatureVerificationFailed:
            case QuantumFailureType::DecryptionFailed:
            case QuantumFailureType::KeyDecapsulationError:
            case QuantumFailureType::MalformedMessage:
            case QuantumFailureType::UnsupportedProtocolVersion:
            case QuantumFailureType::ReplayDetected:
                return FailureCategory::CannotDecrypt;
            case QuantumFailureType::KeyNotFound:
                return FailureCategory::KeysNotInitialized;
            default:
                return FailureCategory::LocalFailure;
        }
    }
};

[[nodiscard]] std::string_view ToString(QuantumFailureType type) noexcept;
}
