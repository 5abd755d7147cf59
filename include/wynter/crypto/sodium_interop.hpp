#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace wynter::relay::crypto {

/**
 * @brief Interop layer for libsodium
 *
 * Owns the one-time library initialisation and the small set of memory
 * helpers every other component relies on (wipe, constant-time compare,
 * CSPRNG bytes, guarded allocation).
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Thread-safe and idempotent. Seeds the CSPRNG; a failure here means no
     * key material can be generated.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Small buffers are cleared through a volatile pointer, larger ones with
     * sodium_memzero. Both are immune to dead-store elimination.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer with CSPRNG bytes from randombytes_buf
     *
     * Callers must have initialised the library; otherwise the result is an
     * InitializationFailed error rather than weak randomness.
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> output);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /**
     * @brief Guarded allocation via sodium_malloc
     *
     * Guard pages around the region, mlock'ed, zeroed on free.
     */
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static void WipeSmallBuffer(std::span<uint8_t> buffer) noexcept;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}  // namespace wynter::relay::crypto
