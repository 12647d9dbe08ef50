#pragma once
#include "qsm/storage/in_memory_secure_storage.hpp"
#include <optional>

namespace qsm::protocol::test_helpers {
using crypto::SecureMemoryHandle;

using interfaces::ISecureStorage;
using interfaces::StorageNamespace;

/// In-memory storage whose writes to one namespace can be made to fail.
class FailingSecureStorage final : public ISecureStorage {
public:
    void FailPutsTo(StorageNamespace ns) { failing_namespace_ = ns; }
    void StopFailing() { failing_namespace_.reset(); }

    [[nodiscard]] Result<Unit, QuantumFailure> Put(
        StorageNamespace ns,
        std::string_view key,
        std::span<const uint8_t> value) override {
        if (failing_namespace_ == ns) {
            return Result<Unit, QuantumFailure>::Err(QuantumFailure::StorageFailure("Injected write failure"));
        }
        return inner_.Put(ns, key, value);
    }

    [[nodiscard]] Result<SecureMemoryHandle, QuantumFailure> Get(
        StorageNamespace ns,
        std::string_view key) const override {
        return inner_.Get(ns, key);
    }

    [[nodiscard]] Result<bool, QuantumFailure> Remove(StorageNamespace ns, std::string_view key) override {
        return inner_.Remove(ns, key);
    }

    [[nodiscard]] bool Contains(StorageNamespace ns, std::string_view key) const override {
        return inner_.Contains(ns, key);
    }

private:
    storage::InMemorySecureStorage inner_;
    std::optional<StorageNamespace> failing_namespace_;
};

} // namespace qsm::protocol::test_helpers
