#pragma once
#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/crypto/secure_memory_handle.hpp"
#include <cstdint>
#include <span>
#include <string_view>
namespace qsm::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::QuantumFailure;
using crypto::SecureMemoryHandle;

/// Key spaces of the secure key-value collaborator. Private key records
/// never share a namespace with public material.
enum class StorageNamespace : uint8_t {
    PrivateKeys,
    PublicKeys,
    Contacts
};

[[nodiscard]] constexpr std::string_view ToString(const StorageNamespace ns) noexcept {
    switch (ns) {
        case StorageNamespace::PrivateKeys: return "private_keys";
        case StorageNamespace::PublicKeys: return "public_keys";
        case StorageNamespace::Contacts: return "contacts";
    }
    return "unknown";
}

/// Secure key-value store consumed by the key and contact stores.
///
/// Values are opaque serialized records. Get hands out an independent
/// secure copy so the caller's lifetime never depends on the store's.
class ISecureStorage {
public:
    virtual ~ISecureStorage() = default;

    /// Inserts or replaces.
    [[nodiscard]] virtual Result<Unit, QuantumFailure> Put(
        StorageNamespace ns,
        std::string_view key,
        std::span<const uint8_t> value) = 0;

    /// Fails with KeyNotFound when nothing is stored under `key`.
    [[nodiscard]] virtual Result<SecureMemoryHandle, QuantumFailure> Get(
        StorageNamespace ns,
        std::string_view key) const = 0;

    /// Ok(false) when there was nothing to remove.
    [[nodiscard]] virtual Result<bool, QuantumFailure> Remove(
        StorageNamespace ns,
        std::string_view key) = 0;

    [[nodiscard]] virtual bool Contains(StorageNamespace ns, std::string_view key) const = 0;
};
}
