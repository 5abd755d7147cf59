#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/payload_codec.hpp"
#include "wynter/protocol/session_key.hpp"
#include "wynter/crypto/sodium_interop.hpp"

#include "relay/envelope.pb.h"

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace wynter::relay::protocol {

using EncryptedEnvelope = proto::relay::EncryptedEnvelope;

/// Seconds since the Unix epoch, truncated.
[[nodiscard]] inline int64_t ToUnixSeconds(const std::chrono::system_clock::time_point time) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

/**
 * @brief Byte-level envelope sealing
 *
 * Seal: random nonce, XChaCha20-Poly1305 with no associated data, base64 of
 * nonce and ciphertext, routing ids and timestamp copied verbatim.
 *
 * Open: base64 decode (MalformedMessage on bad base64 or a nonce that is not
 * 24 bytes), then decrypt (AuthenticationFailed on any tag mismatch).
 */
class Envelope {
public:
    static Result<EncryptedEnvelope, RelayFailure> Seal(
        std::span<const uint8_t> plaintext,
        const SessionKey& key,
        std::string_view sender_id,
        std::string_view recipient_id,
        int64_t timestamp);

    static Result<std::vector<uint8_t>, RelayFailure> Open(
        const EncryptedEnvelope& envelope,
        const SessionKey& key);

    /// Raw nonce bytes of an envelope, used as the replay cache key.
    static Result<std::vector<uint8_t>, RelayFailure> DecodeNonce(
        const EncryptedEnvelope& envelope);

private:
    Envelope() = delete;
};

/**
 * @brief Serialize, encrypt and package one application message
 *
 * @param message Payload; T needs a PayloadCodec specialisation
 * @param now Sender clock, stamped into the envelope as Unix seconds
 */
template<typename T>
Result<EncryptedEnvelope, RelayFailure> EncryptMessage(
    const T& message,
    const SessionKey& key,
    std::string_view sender_id,
    std::string_view recipient_id,
    const std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) {

    auto encoded = PayloadCodec<T>::Encode(message);
    if (encoded.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(encoded).UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(encoded).Unwrap();
    auto sealed = Envelope::Seal(plaintext, key, sender_id, recipient_id, ToUnixSeconds(now));
    (void)crypto::SodiumInterop::SecureWipe(plaintext);
    return sealed;
}

/**
 * @brief Open an envelope and parse its payload as T
 *
 * Does no routing or freshness checks; RelayChannel layers those on top.
 */
template<typename T>
Result<T, RelayFailure> DecryptMessage(
    const EncryptedEnvelope& envelope,
    const SessionKey& key) {

    auto opened = Envelope::Open(envelope, key);
    if (opened.IsErr()) {
        return Result<T, RelayFailure>::Err(std::move(opened).UnwrapErr());
    }
    std::vector<uint8_t> plaintext = std::move(opened).Unwrap();
    auto decoded = PayloadCodec<T>::Decode(plaintext);
    (void)crypto::SodiumInterop::SecureWipe(plaintext);
    return decoded;
}

}  // namespace wynter::relay::protocol
