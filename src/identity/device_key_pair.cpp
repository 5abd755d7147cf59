#include "wynter/identity/device_key_pair.hpp"
#include "wynter/codec/byte_codec.hpp"
#include "wynter/core/logging.hpp"
#include "wynter/crypto/sodium_interop.hpp"

#include <sodium.h>

#include <algorithm>
#include <format>

namespace wynter::relay::identity {

using crypto::SecureMemoryHandle;
using crypto::SodiumInterop;

namespace {

Result<DeviceKeyPair, RelayFailure> EntropyError(const SodiumFailure& failure) {
    return Result<DeviceKeyPair, RelayFailure>::Err(RelayFailure::FromSodiumFailure(failure));
}

}  // namespace

Result<DeviceKeyPair, RelayFailure> DeviceKeyPair::Generate() {
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        logging::Logger()->error("Cannot create device identity: {}", init.UnwrapErr().message);
        return EntropyError(init.UnwrapErr());
    }

    std::array<uint8_t, kX25519PrivateKeyBytes> scalar{};
    if (auto fill = SodiumInterop::FillRandom(scalar); fill.IsErr()) {
        logging::Logger()->error("Cannot create device identity: {}", fill.UnwrapErr().message);
        return EntropyError(fill.UnwrapErr());
    }

    auto result = FromPrivateKey(scalar);
    (void)SodiumInterop::SecureWipe(scalar);
    if (result.IsErr()) {
        // A CSPRNG scalar that fails to restore means secure memory is gone.
        return Result<DeviceKeyPair, RelayFailure>::Err(
            RelayFailure::EntropyUnavailable(result.UnwrapErr().message));
    }
    return result;
}

Result<DeviceKeyPair, RelayFailure> DeviceKeyPair::FromPrivateKey(
    std::span<const uint8_t> private_key) {

    if (private_key.size() != kX25519PrivateKeyBytes) {
        return Result<DeviceKeyPair, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format("Private key must be {} bytes, got {}",
                    kX25519PrivateKeyBytes, private_key.size())));
    }

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return EntropyError(init.UnwrapErr());
    }

    auto handle_result = SecureMemoryHandle::FromBytes(private_key);
    if (handle_result.IsErr()) {
        return EntropyError(handle_result.UnwrapErr());
    }
    SecureMemoryHandle handle = std::move(handle_result).Unwrap();

    PublicKeyBytes public_key{};
    auto derive_result = handle.WithReadAccess([&public_key](std::span<const uint8_t> scalar) {
        return crypto_scalarmult_base(public_key.data(), scalar.data()) == 0;
    });
    if (derive_result.IsErr()) {
        return EntropyError(derive_result.UnwrapErr());
    }
    if (!derive_result.Unwrap()) {
        return Result<DeviceKeyPair, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat("Private key yields the identity point"));
    }

    return Result<DeviceKeyPair, RelayFailure>::Ok(DeviceKeyPair(std::move(handle), public_key));
}

Result<PublicKeyBytes, RelayFailure> DeviceKeyPair::ImportPublicKey(std::string_view encoded) {
    if (encoded.size() != kPublicKeyBase64Chars) {
        return Result<PublicKeyBytes, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format("Public key must be {} base64 characters, got {}",
                    kPublicKeyBase64Chars, encoded.size())));
    }

    auto decoded = codec::ByteCodec::FromBase64(encoded);
    if (decoded.IsErr()) {
        return Result<PublicKeyBytes, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(decoded.UnwrapErr().message));
    }

    const auto& bytes = decoded.Unwrap();
    if (bytes.size() != kX25519PublicKeyBytes) {
        return Result<PublicKeyBytes, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format("Public key must decode to {} bytes, got {}",
                    kX25519PublicKeyBytes, bytes.size())));
    }

    PublicKeyBytes public_key{};
    std::copy(bytes.begin(), bytes.end(), public_key.begin());
    return Result<PublicKeyBytes, RelayFailure>::Ok(public_key);
}

std::string DeviceKeyPair::ExportPublicKey() const {
    return codec::ByteCodec::ToBase64(public_key_);
}

Result<std::vector<uint8_t>, RelayFailure> DeviceKeyPair::ExportPrivateKey() const {
    auto bytes = private_key_.ReadBytes();
    if (bytes.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::InvalidState(bytes.UnwrapErr().message));
    }
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(bytes).Unwrap());
}

}  // namespace wynter::relay::identity
