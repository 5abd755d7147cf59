#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

namespace wynter::relay::crypto {

/**
 * @brief RAII owner of a libsodium guarded allocation
 *
 * Holds private scalars and session keys. The region is guard-paged, locked
 * in RAM and zeroed when freed. Move-only; a moved-from handle is invalid.
 *
 * @code
 * auto handle = SecureMemoryHandle::Allocate(32);
 * if (handle.IsOk()) {
 *     auto key = std::move(handle).Unwrap();
 *     key.Write(bytes);
 * }
 * @endcode
 */
class SecureMemoryHandle {
public:
    static Result<SecureMemoryHandle, SodiumFailure> Allocate(size_t size);

    /// Allocate and fill in one step.
    static Result<SecureMemoryHandle, SodiumFailure> FromBytes(std::span<const uint8_t> data);

    ~SecureMemoryHandle();

    SecureMemoryHandle() noexcept : ptr_(nullptr), size_(0) {}

    SecureMemoryHandle(SecureMemoryHandle&& other) noexcept;
    SecureMemoryHandle& operator=(SecureMemoryHandle&& other) noexcept;

    SecureMemoryHandle(const SecureMemoryHandle&) = delete;
    SecureMemoryHandle& operator=(const SecureMemoryHandle&) = delete;

    /**
     * @brief Copy data into the region
     *
     * Bytes past data.size() are zeroed.
     */
    Result<Unit, SodiumFailure> Write(std::span<const uint8_t> data);

    /**
     * @brief Copy the whole region into a new vector
     *
     * The caller owns the copy and is responsible for wiping it.
     */
    Result<std::vector<uint8_t>, SodiumFailure> ReadBytes() const;

    /**
     * @brief Run func over a read-only view without copying the secret out
     */
    template<typename F>
    auto WithReadAccess(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, SodiumFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;

        if (IsInvalid()) {
            return Result<T, SodiumFailure>::Err(
                SodiumFailure::InvalidOperation("Handle has been disposed"));
        }

        const std::span<const uint8_t> secure_span(
            static_cast<const uint8_t*>(ptr_), size_);
        return Result<T, SodiumFailure>::Ok(std::forward<F>(func)(secure_span));
    }

    [[nodiscard]] bool IsInvalid() const noexcept {
        return ptr_ == nullptr;
    }

    [[nodiscard]] size_t Size() const noexcept {
        return size_;
    }

private:
    SecureMemoryHandle(void* ptr, size_t size) noexcept
        : ptr_(ptr), size_(size) {}

    void Release() noexcept;

    void* ptr_;
    size_t size_;
};

}  // namespace wynter::relay::crypto
