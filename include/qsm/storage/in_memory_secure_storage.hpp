#pragma once
#include "qsm/interfaces/i_secure_storage.hpp"
#include <map>
#include <shared_mutex>
#include <string>
#include <utility>
namespace qsm::protocol::storage {
using crypto::SecureMemoryHandle;

/**
 * @brief Process-local ISecureStorage
 *
 * Every value is held in its own SecureMemoryHandle, so stored records
 * are guard-paged and wiped when replaced or removed. Reads take a shared
 * lock, writes an exclusive one.
 */
class InMemorySecureStorage final : public interfaces::ISecureStorage {
public:
    InMemorySecureStorage() = default;
    InMemorySecureStorage(const InMemorySecureStorage&) = delete;
    InMemorySecureStorage& operator=(const InMemorySecureStorage&) = delete;

    [[nodiscard]] Result<Unit, QuantumFailure> Put(
        interfaces::StorageNamespace ns,
        std::string_view key,
        std::span<const uint8_t> value) override;

    [[nodiscard]] Result<SecureMemoryHandle, QuantumFailure> Get(
        interfaces::StorageNamespace ns,
        std::string_view key) const override;

    [[nodiscard]] Result<bool, QuantumFailure> Remove(
        interfaces::StorageNamespace ns,
        std::string_view key) override;

    [[nodiscard]] bool Contains(interfaces::StorageNamespace ns, std::string_view key) const override;

    [[nodiscard]] size_t Count(interfaces::StorageNamespace ns) const;

private:
    using Key = std::pair<interfaces::StorageNamespace, std::string>;

    mutable std::shared_mutex lock_;
    std::map<Key, SecureMemoryHandle> entries_;
};

}
