#pragma once

#include "qsm/core/result.hpp"
#include "qsm/core/failures.hpp"
#include "qsm/core/constants.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace qsm::protocol::crypto {

/**
 * @brief Interop layer for the libsodium primitives qsm relies on
 *
 * Covers initialization, the CSPRNG, secure wiping, constant-time
 * comparison, hex rendering and guarded allocation. Every other module
 * goes through this class instead of calling libsodium directly.
 */
class SodiumInterop {
public:
    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Must succeed before any other call.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /// Fill a new vector with `size` bytes from the libsodium CSPRNG.
    static std::vector<uint8_t> GetRandomBytes(size_t size);

    static void FillRandom(std::span<uint8_t> buffer) noexcept;

    /// Zero and clear a string that held secret bytes (protobuf bytes fields).
    static void WipeString(std::string& value) noexcept;

    /// Zero a buffer on a cleanup path. Needs no prior Initialize() and
    /// has no size limit, so it cannot fail.
    static void WipeBytes(std::span<uint8_t> buffer) noexcept;

    /// Lowercase hex rendering (sodium_bin2hex).
    static std::string ToHex(std::span<const uint8_t> data);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

/// Wipes `buffer` when leaving scope. For temporaries holding secrets.
class ScopedWipe {
public:
    explicit ScopedWipe(std::vector<uint8_t>& buffer) noexcept : buffer_(buffer) {}
    ~ScopedWipe() {
        SodiumInterop::WipeBytes(std::span<uint8_t>(buffer_));
    }
    ScopedWipe(const ScopedWipe&) = delete;
    ScopedWipe& operator=(const ScopedWipe&) = delete;
private:
    std::vector<uint8_t>& buffer_;
};

} // namespace qsm::protocol::crypto
