#include "qsm/core/failures.hpp"

namespace qsm::protocol {

std::string_view ToString(const QuantumFailureType type) noexcept {
    switch (type) {
        case QuantumFailureType::KeyNotFound: return "KeyNotFound";
        case QuantumFailureType::KeyEncapsulationError: return "KeyEncapsulationError";
        case QuantumFailureType::KeyDecapsulationError: return "KeyDecapsulationError";
        case QuantumFailureType::SignatureError: return "SignatureError";
        case QuantumFailureType::SignatureVerificationFailed: return "SignatureVerificationFailed";
        case QuantumFailureType::DecryptionFailed: return "DecryptionFailed";
        case QuantumFailureType::UnsupportedProtocolVersion: return "UnsupportedProtocolVersion";
        case QuantumFailureType::DerivationError: return "DerivationError";
        case QuantumFailureType::MalformedMessage: return "MalformedMessage";
        case QuantumFailureType::KeyGeneration: return "KeyGeneration";
        case QuantumFailureType::EncryptionFailed: return "EncryptionFailed";
        case QuantumFailureType::InvalidInput: return "InvalidInput";
        case QuantumFailureType::StorageFailure: return "StorageFailure";
        case QuantumFailureType::ReplayDetected: return "ReplayDetected";
        case QuantumFailureType::InitializationFailed: return "InitializationFailed";
        case QuantumFailureType::Generic: return "Generic";
    }
    return "Unknown";
}

}
