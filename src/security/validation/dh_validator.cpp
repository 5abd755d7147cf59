#include "wynter/security/validation/dh_validator.hpp"

#include <format>

namespace wynter::relay::security {

Result<Unit, RelayFailure> DhValidator::ValidateX25519PublicKey(
    std::span<const uint8_t> public_key) {

    if (public_key.size() != kX25519PublicKeyBytes) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format(
                    "Invalid X25519 public key size: expected {}, got {}",
                    kX25519PublicKeyBytes,
                    public_key.size())));
    }

    if (HasSmallOrder(public_key)) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                "X25519 public key is a small-order point"));
    }

    if ((public_key[kX25519PublicKeyBytes - 1] & 0x80) != 0) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                "X25519 public key has the most significant bit set"));
    }

    if (!IsCanonicalFieldElement(public_key)) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                "X25519 public key is not a canonical Curve25519 field element"));
    }

    return Result<Unit, RelayFailure>::Ok(unit);
}

bool DhValidator::HasSmallOrder(std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }

    // Accumulate over every candidate so timing does not reveal which one hit.
    uint8_t any_match = 0;
    for (const auto& point : SMALL_ORDER_POINTS) {
        uint8_t diff = 0;
        for (size_t i = 0; i < kX25519PublicKeyBytes - 1; ++i) {
            diff |= public_key[i] ^ point[i];
        }
        diff |= (public_key[kX25519PublicKeyBytes - 1] & 0x7f) ^ point[kX25519PublicKeyBytes - 1];
        any_match |= static_cast<uint8_t>(diff == 0);
    }
    return any_match != 0;
}

bool DhValidator::IsCanonicalFieldElement(std::span<const uint8_t> public_key) {
    if (public_key.size() != kX25519PublicKeyBytes) {
        return false;
    }

    // Compare as little-endian integers from the most significant byte down.
    for (size_t i = kX25519PublicKeyBytes; i-- > 0;) {
        const uint8_t key_byte = i == kX25519PublicKeyBytes - 1
            ? static_cast<uint8_t>(public_key[i] & 0x7f)
            : public_key[i];
        if (key_byte < CURVE_25519_PRIME[i]) {
            return true;
        }
        if (key_byte > CURVE_25519_PRIME[i]) {
            return false;
        }
    }
    return false;
}

}  // namespace wynter::relay::security
