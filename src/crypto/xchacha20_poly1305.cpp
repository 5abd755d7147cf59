#include "wynter/crypto/xchacha20_poly1305.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include <sodium.h>
#include <format>
namespace wynter::relay::crypto {
namespace {
    static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == kXChaChaKeyBytes);
    static_assert(crypto_aead_xchacha20poly1305_ietf_NPUBBYTES == kXChaChaNonceBytes);
    static_assert(crypto_aead_xchacha20poly1305_ietf_ABYTES == kPoly1305TagBytes);

    Result<Unit, RelayFailure> CheckKey(std::span<const uint8_t> key) {
        if (key.size() != kXChaChaKeyBytes) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    std::format("XChaCha20-Poly1305 key must be {} bytes, got {}",
                        kXChaChaKeyBytes, key.size())));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }
}
Result<XChaCha20Poly1305::Nonce, RelayFailure> XChaCha20Poly1305::GenerateNonce() {
    Nonce nonce{};
    auto fill_result = SodiumInterop::FillRandom(nonce);
    if (fill_result.IsErr()) {
        return Result<Nonce, RelayFailure>::Err(
            RelayFailure::FromSodiumFailure(fill_result.UnwrapErr()));
    }
    return Result<Nonce, RelayFailure>::Ok(nonce);
}
Result<XChaCha20Poly1305::Sealed, RelayFailure>
XChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext) {
    auto nonce_result = GenerateNonce();
    if (nonce_result.IsErr()) {
        return Result<Sealed, RelayFailure>::Err(std::move(nonce_result).UnwrapErr());
    }
    Sealed sealed;
    sealed.nonce = nonce_result.Unwrap();
    auto encrypt_result = Encrypt(key, sealed.nonce, plaintext);
    if (encrypt_result.IsErr()) {
        return Result<Sealed, RelayFailure>::Err(std::move(encrypt_result).UnwrapErr());
    }
    sealed.ciphertext = std::move(encrypt_result).Unwrap();
    return Result<Sealed, RelayFailure>::Ok(std::move(sealed));
}
Result<std::vector<uint8_t>, RelayFailure>
XChaCha20Poly1305::Encrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(std::move(check).UnwrapErr());
    }
    if (nonce.size() != kXChaChaNonceBytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::InvalidInput(
                std::format("XChaCha20-Poly1305 nonce must be {} bytes, got {}",
                    kXChaChaNonceBytes, nonce.size())));
    }
    std::vector<uint8_t> output(plaintext.size() + kPoly1305TagBytes);
    unsigned long long output_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        output.data(), &output_len,
        plaintext.data(), plaintext.size(),
        associated_data.empty() ? nullptr : associated_data.data(),
        associated_data.size(),
        nullptr,
        nonce.data(), key.data());
    if (rc != 0) {
        (void)SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::Encode("XChaCha20-Poly1305 encryption failed"));
    }
    output.resize(static_cast<size_t>(output_len));
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(output));
}
Result<std::vector<uint8_t>, RelayFailure>
XChaCha20Poly1305::Decrypt(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> ciphertext_with_tag,
    std::span<const uint8_t> associated_data) {
    if (auto check = CheckKey(key); check.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(std::move(check).UnwrapErr());
    }
    if (nonce.size() != kXChaChaNonceBytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::AuthenticationFailed(
                std::format("Nonce must be {} bytes, got {}", kXChaChaNonceBytes, nonce.size())));
    }
    if (ciphertext_with_tag.size() < kPoly1305TagBytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::AuthenticationFailed(
                std::format("Ciphertext too small: {} bytes (minimum {} for tag)",
                    ciphertext_with_tag.size(), kPoly1305TagBytes)));
    }
    std::vector<uint8_t> output(ciphertext_with_tag.size() - kPoly1305TagBytes);
    unsigned long long output_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        output.data(), &output_len,
        nullptr,
        ciphertext_with_tag.data(), ciphertext_with_tag.size(),
        associated_data.empty() ? nullptr : associated_data.data(),
        associated_data.size(),
        nonce.data(), key.data());
    if (rc != 0) {
        (void)SodiumInterop::SecureWipe(output);
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::AuthenticationFailed(
                "Authentication tag verification failed"));
    }
    output.resize(static_cast<size_t>(output_len));
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(output));
}
}
