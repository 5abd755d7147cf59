#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/constants.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <vector>
namespace wynter::relay::crypto {

/**
 * XChaCha20-Poly1305 (IETF construction) authenticated encryption.
 *
 * Stateless primitive. The 192-bit nonce is wide enough to be drawn at
 * random for every message under one key; GenerateNonce() does exactly
 * that. Callers must never reuse a (key, nonce) pair.
 *
 * Output layout of Encrypt: ciphertext || 16-byte Poly1305 tag, so the
 * ciphertext is always plaintext.size() + kPoly1305TagBytes long.
 */
class XChaCha20Poly1305 {
public:
    using Nonce = std::array<uint8_t, kXChaChaNonceBytes>;

    struct Sealed {
        Nonce nonce{};
        std::vector<uint8_t> ciphertext;
    };

    [[nodiscard]] static Result<Nonce, RelayFailure> GenerateNonce();

    /// Draws a fresh random nonce and encrypts under it.
    [[nodiscard]] static Result<Sealed, RelayFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext);

    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});

    /// Fails with AuthenticationFailed on any tag mismatch, a short
    /// ciphertext or a nonce of the wrong length; no partial plaintext is
    /// ever returned.
    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});

private:
    XChaCha20Poly1305() = delete;
};
}
