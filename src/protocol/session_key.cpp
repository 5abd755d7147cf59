#include "wynter/protocol/session_key.hpp"
#include "wynter/crypto/hkdf.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include "wynter/security/validation/dh_validator.hpp"
#include <sodium.h>
#include <array>
#include <format>
namespace wynter::relay::protocol {
using crypto::Hkdf;
using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;
using security::DhValidator;
Result<SessionKey, RelayFailure> SessionKey::Derive(
    const identity::DeviceKeyPair& local,
    std::span<const uint8_t> peer_public_key) {
    auto result = local.PrivateKeyHandle().WithReadAccess(
        [peer_public_key](std::span<const uint8_t> private_key) {
            return DeriveFromPrivateKey(private_key, peer_public_key);
        });
    if (result.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::InvalidState(result.UnwrapErr().message));
    }
    return std::move(result).Unwrap();
}
Result<SessionKey, RelayFailure> SessionKey::DeriveFromPrivateKey(
    std::span<const uint8_t> local_private_key,
    std::span<const uint8_t> peer_public_key) {
    if (local_private_key.size() != kX25519PrivateKeyBytes) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format("Private key must be {} bytes, got {}",
                    kX25519PrivateKeyBytes, local_private_key.size())));
    }
    if (auto valid = DhValidator::ValidateX25519PublicKey(peer_public_key); valid.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(std::move(valid).UnwrapErr());
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    std::array<uint8_t, kX25519SharedSecretBytes> shared{};
    if (crypto_scalarmult(shared.data(), local_private_key.data(), peer_public_key.data()) != 0) {
        (void)SodiumInterop::SecureWipe(shared);
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat("X25519 produced an all-zero shared secret"));
    }

    const auto* info = reinterpret_cast<const uint8_t*>(kRelayKeyInfo.data());
    std::array<uint8_t, kSessionKeyBytes> derived{};
    auto hkdf = Hkdf::DeriveKey(shared, derived, {},
                                std::span<const uint8_t>(info, kRelayKeyInfo.size()));
    (void)SodiumInterop::SecureWipe(shared);
    if (hkdf.IsErr()) {
        (void)SodiumInterop::SecureWipe(derived);
        return Result<SessionKey, RelayFailure>::Err(std::move(hkdf).UnwrapErr());
    }

    auto handle = SecureMemoryHandle::FromBytes(derived);
    (void)SodiumInterop::SecureWipe(derived);
    if (handle.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SessionKey, RelayFailure>::Ok(SessionKey(std::move(handle).Unwrap()));
}
Result<SessionKey, RelayFailure> SessionKey::FromBytes(std::span<const uint8_t> key) {
    if (key.size() != kSessionKeyBytes) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::InvalidInput(
                std::format("Session key must be {} bytes, got {}", kSessionKeyBytes, key.size())));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    auto handle = SecureMemoryHandle::FromBytes(key);
    if (handle.IsErr()) {
        return Result<SessionKey, RelayFailure>::Err(
            RelayFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    return Result<SessionKey, RelayFailure>::Ok(SessionKey(std::move(handle).Unwrap()));
}
}
