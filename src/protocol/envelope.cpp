#include "wynter/protocol/envelope.hpp"
#include "wynter/codec/byte_codec.hpp"
#include "wynter/crypto/xchacha20_poly1305.hpp"

#include <format>

namespace wynter::relay::protocol {

using codec::ByteCodec;
using crypto::XChaCha20Poly1305;

Result<EncryptedEnvelope, RelayFailure> Envelope::Seal(
    std::span<const uint8_t> plaintext,
    const SessionKey& key,
    const std::string_view sender_id,
    const std::string_view recipient_id,
    const int64_t timestamp) {

    auto sealed = key.WithKey([plaintext](std::span<const uint8_t> key_bytes) {
        return XChaCha20Poly1305::Encrypt(key_bytes, plaintext);
    });
    if (sealed.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(sealed).UnwrapErr());
    }
    auto encrypted = std::move(sealed).Unwrap();
    if (encrypted.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(encrypted).UnwrapErr());
    }
    const XChaCha20Poly1305::Sealed box = std::move(encrypted).Unwrap();

    EncryptedEnvelope envelope;
    envelope.set_sender_id(std::string(sender_id));
    envelope.set_recipient_id(std::string(recipient_id));
    envelope.set_timestamp(timestamp);
    envelope.set_nonce(ByteCodec::ToBase64(box.nonce));
    envelope.set_ciphertext(ByteCodec::ToBase64(box.ciphertext));
    return Result<EncryptedEnvelope, RelayFailure>::Ok(std::move(envelope));
}

Result<std::vector<uint8_t>, RelayFailure> Envelope::DecodeNonce(
    const EncryptedEnvelope& envelope) {

    auto nonce = ByteCodec::FromBase64(envelope.nonce());
    if (nonce.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Envelope nonce: {}", nonce.UnwrapErr().message)));
    }
    if (nonce.Unwrap().size() != kXChaChaNonceBytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Envelope nonce must decode to {} bytes, got {}",
                    kXChaChaNonceBytes, nonce.Unwrap().size())));
    }
    return nonce;
}

Result<std::vector<uint8_t>, RelayFailure> Envelope::Open(
    const EncryptedEnvelope& envelope,
    const SessionKey& key) {

    auto nonce = DecodeNonce(envelope);
    if (nonce.IsErr()) {
        return nonce;
    }

    auto ciphertext = ByteCodec::FromBase64(envelope.ciphertext());
    if (ciphertext.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Envelope ciphertext: {}", ciphertext.UnwrapErr().message)));
    }

    const auto& nonce_bytes = nonce.Unwrap();
    const auto& ciphertext_bytes = ciphertext.Unwrap();
    auto opened = key.WithKey([&nonce_bytes, &ciphertext_bytes](std::span<const uint8_t> key_bytes) {
        return XChaCha20Poly1305::Decrypt(key_bytes, nonce_bytes, ciphertext_bytes);
    });
    if (opened.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(std::move(opened).UnwrapErr());
    }
    return std::move(opened).Unwrap();
}

}  // namespace wynter::relay::protocol
