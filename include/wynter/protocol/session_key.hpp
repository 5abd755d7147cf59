#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/crypto/secure_memory_handle.hpp"
#include "wynter/identity/device_key_pair.hpp"
#include <cstdint>
#include <span>
#include <type_traits>
namespace wynter::relay::protocol {

/**
 * Symmetric key shared by exactly two paired devices.
 *
 * K = HKDF-SHA256(X25519(local_private, peer_public), salt = none,
 *                 info = "wynter-relay-v1", L = 32)
 *
 * Deterministic and symmetric: both ends compute the same K without further
 * interaction. Never serialised; lives in guarded memory for the lifetime of
 * the pairing.
 */
class SessionKey {
public:
    static Result<SessionKey, RelayFailure> Derive(
        const identity::DeviceKeyPair& local,
        std::span<const uint8_t> peer_public_key);

    static Result<SessionKey, RelayFailure> DeriveFromPrivateKey(
        std::span<const uint8_t> local_private_key,
        std::span<const uint8_t> peer_public_key);

    /// Wraps existing 32-byte key material (tests and key-rotation hosts).
    static Result<SessionKey, RelayFailure> FromBytes(std::span<const uint8_t> key);

    SessionKey(SessionKey&&) noexcept = default;
    SessionKey& operator=(SessionKey&&) noexcept = default;
    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;
    ~SessionKey() = default;

    template<typename F>
    auto WithKey(F&& func) const
        -> Result<std::invoke_result_t<F, std::span<const uint8_t>>, RelayFailure> {
        using T = std::invoke_result_t<F, std::span<const uint8_t>>;
        auto result = key_.WithReadAccess(std::forward<F>(func));
        if (result.IsErr()) {
            return Result<T, RelayFailure>::Err(
                RelayFailure::InvalidState(result.UnwrapErr().message));
        }
        return Result<T, RelayFailure>::Ok(std::move(result).Unwrap());
    }

private:
    explicit SessionKey(crypto::SecureMemoryHandle key) : key_(std::move(key)) {}

    crypto::SecureMemoryHandle key_;
};
}
