#pragma once

#include "wynter/configuration/channel_config.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/core/result.hpp"
#include "wynter/identity/device_key_pair.hpp"
#include "wynter/interfaces/i_channel_event_handler.hpp"
#include "wynter/interfaces/i_relay_transport.hpp"
#include "wynter/models/pairing_record.hpp"
#include "wynter/protocol/envelope.hpp"
#include "wynter/protocol/payload_codec.hpp"
#include "wynter/protocol/session_key.hpp"
#include "wynter/security/replay_guard.hpp"

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wynter::relay::protocol {

struct ChannelOptions {
    configuration::ChannelConfig config = configuration::ChannelConfig::Default();
    /// Local time source; the system clock when empty.
    std::function<std::chrono::system_clock::time_point()> clock;
    std::shared_ptr<IRelayTransport> transport;
    std::shared_ptr<IChannelEventHandler> event_handler;
};

using MessageHandler = std::function<void(const google::protobuf::Value&)>;
using HandlerId = uint64_t;

/**
 * @brief End-to-end encrypted channel between this device and one peer
 *
 * States: Unpaired -> Active (Pair / RestorePairing) -> Unpaired (Unpair).
 * Key exchange and activation coincide because derivation is synchronous.
 *
 * Inbound envelopes pass these checks in order, the first failure wins:
 * 1. channel is Active                          (InvalidState)
 * 2. recipient is us and sender is the peer     (MisroutedEnvelope, no decrypt)
 * 3. |timestamp - now| <= max clock skew        (StaleEnvelope)
 * 4. tag verifies, payload parses               (AuthenticationFailed / MalformedMessage)
 * 5. nonce not accepted before                  (ReplayDetected)
 *
 * A nonce is remembered only after step 4, so forged envelopes cannot fill
 * the replay cache. Every rejection is logged at warn with routing ids and
 * the reason, and reported to the event handler.
 *
 * Thread-safe. Message handlers and event callbacks run on the calling
 * thread with no channel lock held.
 */
class RelayChannel {
public:
    [[nodiscard]] static Result<std::unique_ptr<RelayChannel>, RelayFailure> Create(
        std::string local_device_id,
        identity::DeviceKeyPair key_pair,
        ChannelOptions options = {});

    RelayChannel(const RelayChannel&) = delete;
    RelayChannel& operator=(const RelayChannel&) = delete;
    ~RelayChannel() = default;

    // ========================================================================
    // Pairing
    // ========================================================================

    /// Derives the session key for the peer and activates the channel.
    /// Re-pairing replaces the previous peer and key.
    Result<Unit, RelayFailure> Pair(
        std::string peer_device_id,
        std::span<const uint8_t> peer_public_key);

    /// Pair from the base64 key carried by a pairing code.
    Result<Unit, RelayFailure> PairWithEncodedKey(
        std::string peer_device_id,
        std::string_view peer_public_key_base64);

    /// Wipes the session key, forgets the peer and the replay cache.
    void Unpair();

    [[nodiscard]] Result<models::PairingRecord, RelayFailure> ExportPairing() const;

    Result<Unit, RelayFailure> RestorePairing(const models::PairingRecord& record);

    [[nodiscard]] ChannelState State() const;
    [[nodiscard]] const std::string& LocalDeviceId() const noexcept { return local_device_id_; }
    [[nodiscard]] std::optional<std::string> PeerDeviceId() const;
    [[nodiscard]] std::string ExportPublicKey() const { return key_pair_.ExportPublicKey(); }
    [[nodiscard]] const configuration::ChannelConfig& Config() const noexcept { return config_; }

    // ========================================================================
    // Messaging
    // ========================================================================

    /// Encrypt a message for the peer without sending it.
    template<typename T>
    Result<EncryptedEnvelope, RelayFailure> Seal(const T& message) const {
        auto encoded = PayloadCodec<T>::Encode(message);
        if (encoded.IsErr()) {
            return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(encoded).UnwrapErr());
        }
        std::vector<uint8_t> plaintext = std::move(encoded).Unwrap();
        auto sealed = SealBytes(plaintext);
        (void)crypto::SodiumInterop::SecureWipe(plaintext);
        return sealed;
    }

    /// Encrypt a message and hand it to the transport as a relay message
    /// frame. Returns the envelope that was sent.
    template<typename T>
    Result<EncryptedEnvelope, RelayFailure> Send(const T& message) {
        auto sealed = Seal(message);
        if (sealed.IsErr()) {
            return sealed;
        }
        if (auto delivered = Transmit(sealed.Unwrap()); delivered.IsErr()) {
            return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(delivered).UnwrapErr());
        }
        return sealed;
    }

    /// Validate, decrypt and parse one inbound envelope.
    template<typename T>
    Result<T, RelayFailure> OnEnvelope(const EncryptedEnvelope& envelope) {
        const auto now = Now();
        auto opened = OpenAuthenticated(envelope, now);
        if (opened.IsErr()) {
            return Result<T, RelayFailure>::Err(std::move(opened).UnwrapErr());
        }
        std::vector<uint8_t> plaintext = std::move(opened).Unwrap();
        auto decoded = PayloadCodec<T>::Decode(plaintext);
        (void)crypto::SodiumInterop::SecureWipe(plaintext);
        if (decoded.IsErr()) {
            Reject(envelope, decoded.UnwrapErr());
            return decoded;
        }
        if (auto accepted = AcceptNonce(envelope, now); accepted.IsErr()) {
            return Result<T, RelayFailure>::Err(std::move(accepted).UnwrapErr());
        }
        return decoded;
    }

    /// OnEnvelope as free-form JSON, then notify every message handler.
    Result<Unit, RelayFailure> Dispatch(const EncryptedEnvelope& envelope);

    HandlerId AddMessageHandler(MessageHandler handler);
    bool RemoveMessageHandler(HandlerId id);

    // ========================================================================
    // Relay session
    // ========================================================================

    /// Identify this device to the relay.
    Result<Unit, RelayFailure> SendHandshake(std::string_view token);

    Result<Unit, RelayFailure> SendPing();

    /// Route one frame received from the relay. Message frames go through
    /// Dispatch; the others update relay status.
    Result<Unit, RelayFailure> HandleServerFrame(std::string_view frame_json);

    [[nodiscard]] bool IsRelayAuthenticated() const;
    [[nodiscard]] std::optional<bool> IsPeerOnline() const;

private:
    RelayChannel(
        std::string local_device_id,
        identity::DeviceKeyPair key_pair,
        ChannelOptions options);

    [[nodiscard]] std::chrono::system_clock::time_point Now() const;

    Result<EncryptedEnvelope, RelayFailure> SealBytes(std::span<const uint8_t> plaintext) const;

    Result<std::vector<uint8_t>, RelayFailure> OpenAuthenticated(
        const EncryptedEnvelope& envelope,
        std::chrono::system_clock::time_point now);

    Result<Unit, RelayFailure> AcceptNonce(
        const EncryptedEnvelope& envelope,
        std::chrono::system_clock::time_point now);

    Result<Unit, RelayFailure> Transmit(const EncryptedEnvelope& envelope);
    Result<Unit, RelayFailure> DeliverFrame(const std::string& frame_json);

    Result<Unit, RelayFailure> Activate(
        std::string peer_device_id,
        std::span<const uint8_t> peer_public_key,
        int64_t paired_at_unix);

    void Reject(const EncryptedEnvelope& envelope, const RelayFailure& failure) const;
    void NotifyStateChanged(ChannelState state) const;

    const std::string local_device_id_;
    const identity::DeviceKeyPair key_pair_;
    const configuration::ChannelConfig config_;
    const std::function<std::chrono::system_clock::time_point()> clock_;
    const std::shared_ptr<IRelayTransport> transport_;
    const std::shared_ptr<IChannelEventHandler> event_handler_;

    mutable std::shared_mutex state_mutex_;
    ChannelState state_ = ChannelState::Unpaired;
    std::string peer_device_id_;
    identity::PublicKeyBytes peer_public_key_{};
    int64_t paired_at_unix_ = 0;
    std::unique_ptr<SessionKey> session_key_;

    security::ReplayGuard replay_guard_;

    mutable std::mutex relay_mutex_;
    bool relay_authenticated_ = false;
    std::optional<bool> peer_online_;

    mutable std::mutex handlers_mutex_;
    HandlerId next_handler_id_ = 1;
    std::vector<std::pair<HandlerId, MessageHandler>> handlers_;
};

}  // namespace wynter::relay::protocol
