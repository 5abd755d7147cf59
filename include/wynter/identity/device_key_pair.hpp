#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/crypto/secure_memory_handle.hpp"
#include "wynter/protocol/constants.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace wynter::relay::identity {

using PublicKeyBytes = std::array<uint8_t, kX25519PublicKeyBytes>;

/**
 * @brief Long-term X25519 identity of one device
 *
 * The private scalar is held in guarded memory and never leaves this object
 * except through ExportPrivateKey(), which exists for the persistence layer.
 * The public key is exported as standard base64 for the pairing code.
 *
 * Invariant: public key == X25519(private key, base point).
 */
class DeviceKeyPair {
public:
    /// Fresh identity from the CSPRNG. EntropyUnavailable if libsodium cannot
    /// be initialised or guarded memory cannot be obtained.
    static Result<DeviceKeyPair, RelayFailure> Generate();

    /// Restores an identity from a persisted 32-byte scalar.
    static Result<DeviceKeyPair, RelayFailure> FromPrivateKey(std::span<const uint8_t> private_key);

    /// Decodes a base64 public key from a pairing code; anything that is not
    /// exactly 32 bytes after decoding is InvalidKeyFormat.
    static Result<PublicKeyBytes, RelayFailure> ImportPublicKey(std::string_view encoded);

    DeviceKeyPair(DeviceKeyPair&&) noexcept = default;
    DeviceKeyPair& operator=(DeviceKeyPair&&) noexcept = default;
    DeviceKeyPair(const DeviceKeyPair&) = delete;
    DeviceKeyPair& operator=(const DeviceKeyPair&) = delete;
    ~DeviceKeyPair() = default;

    [[nodiscard]] const PublicKeyBytes& PublicKey() const noexcept { return public_key_; }

    [[nodiscard]] std::string ExportPublicKey() const;

    /// Copy of the private scalar. Wipe it once persisted.
    [[nodiscard]] Result<std::vector<uint8_t>, RelayFailure> ExportPrivateKey() const;

    [[nodiscard]] const crypto::SecureMemoryHandle& PrivateKeyHandle() const noexcept {
        return private_key_;
    }

private:
    DeviceKeyPair(crypto::SecureMemoryHandle private_key, const PublicKeyBytes& public_key)
        : private_key_(std::move(private_key)), public_key_(public_key) {}

    crypto::SecureMemoryHandle private_key_;
    PublicKeyBytes public_key_{};
};

}  // namespace wynter::relay::identity
