#include "wynter/crypto/sodium_interop.hpp"

#include <format>
#include <string>

namespace wynter::relay::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init returns 1 when already initialised by the host.
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("Failed to initialize libsodium"));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }

    if (buffer.size() > kMaxSecureBufferBytes) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(
                std::format("Buffer size {} exceeds maximum {}",
                    buffer.size(), kMaxSecureBufferBytes)));
    }

    if (buffer.size() <= kSmallBufferThreshold) {
        WipeSmallBuffer(buffer);
    } else {
        sodium_memzero(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

void SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) noexcept {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> output) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                "CSPRNG requested before libsodium initialization"));
    }
    randombytes_buf(output.data(), output.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

}  // namespace wynter::relay::crypto
