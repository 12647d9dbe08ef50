#include "qsm/storage/in_memory_secure_storage.hpp"
#include <algorithm>
#include <mutex>

namespace qsm::protocol::storage {
    using interfaces::StorageNamespace;

    Result<Unit, QuantumFailure> InMemorySecureStorage::Put(
        const StorageNamespace ns,
        std::string_view key,
        std::span<const uint8_t> value) {
        if (key.empty()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InvalidInput("Storage key must not be empty"));
        }
        if (value.empty()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::InvalidInput("Storage value must not be empty"));
        }

        auto handle_result = SecureMemoryHandle::FromBytes(value);
        if (handle_result.IsErr()) {
            return Result<Unit, QuantumFailure>::Err(
                QuantumFailure::StorageFailure(
                    "Failed to allocate secure storage for " + std::string(ToString(ns)) + ": " +
                    handle_result.UnwrapErr().message));
        }

        std::unique_lock guard(lock_);
        entries_.insert_or_assign(Key{ns, std::string(key)}, std::move(handle_result).Unwrap());
        return Result<Unit, QuantumFailure>::Ok(Unit{});
    }

    Result<SecureMemoryHandle, QuantumFailure> InMemorySecureStorage::Get(
        const StorageNamespace ns,
        std::string_view key) const {
        std::shared_lock guard(lock_);
        const auto it = entries_.find(Key{ns, std::string(key)});
        if (it == entries_.end()) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::KeyNotFound(
                    "Nothing stored in " + std::string(ToString(ns))));
        }
        auto clone_result = it->second.Clone();
        if (clone_result.IsErr()) {
            return Result<SecureMemoryHandle, QuantumFailure>::Err(
                QuantumFailure::StorageFailure(clone_result.UnwrapErr().message));
        }
        return Result<SecureMemoryHandle, QuantumFailure>::Ok(std::move(clone_result).Unwrap());
    }

    Result<bool, QuantumFailure> InMemorySecureStorage::Remove(
        const StorageNamespace ns,
        std::string_view key) {
        std::unique_lock guard(lock_);
        return Result<bool, QuantumFailure>::Ok(entries_.erase(Key{ns, std::string(key)}) > 0);
    }

    bool InMemorySecureStorage::Contains(const StorageNamespace ns, std::string_view key) const {
        std::shared_lock guard(lock_);
        return entries_.contains(Key{ns, std::string(key)});
    }

    size_t InMemorySecureStorage::Count(const StorageNamespace ns) const {
        std::shared_lock guard(lock_);
        return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                 [ns](const auto& entry) { return entry.first.first == ns; }));
    }
}
