#include "wynter/protocol/relay_channel.hpp"
#include "wynter/core/logging.hpp"
#include "wynter/protocol/relay_frame.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <type_traits>
#include <variant>

namespace wynter::relay::protocol {
    using identity::DeviceKeyPair;
    using models::PairingRecord;

    namespace {
        constexpr std::string_view ToString(const ChannelState state) noexcept {
            switch (state) {
                case ChannelState::Unpaired: return "Unpaired";
                case ChannelState::Active: return "Active";
            }
            return "Unknown";
        }
    }

    RelayChannel::RelayChannel(
        std::string local_device_id,
        DeviceKeyPair key_pair,
        ChannelOptions options)
        : local_device_id_(std::move(local_device_id))
          , key_pair_(std::move(key_pair))
          , config_(options.config)
          , clock_(std::move(options.clock))
          , transport_(std::move(options.transport))
          , event_handler_(std::move(options.event_handler))
          , replay_guard_(options.config.ReplayCacheCapacity(), options.config.NonceRetention()) {
    }

    Result<std::unique_ptr<RelayChannel>, RelayFailure> RelayChannel::Create(
        std::string local_device_id,
        DeviceKeyPair key_pair,
        ChannelOptions options) {
        if (local_device_id.empty()) {
            return Result<std::unique_ptr<RelayChannel>, RelayFailure>::Err(
                RelayFailure::InvalidInput("Local device id cannot be empty"));
        }
        if (auto valid = options.config.Validate(); valid.IsErr()) {
            return Result<std::unique_ptr<RelayChannel>, RelayFailure>::Err(
                std::move(valid).UnwrapErr());
        }
        auto channel = std::unique_ptr<RelayChannel>(
            new RelayChannel(std::move(local_device_id), std::move(key_pair), std::move(options)));
        return Result<std::unique_ptr<RelayChannel>, RelayFailure>::Ok(std::move(channel));
    }

    std::chrono::system_clock::time_point RelayChannel::Now() const {
        return clock_ ? clock_() : std::chrono::system_clock::now();
    }

    // ========================================================================
    // Pairing
    // ========================================================================

    Result<Unit, RelayFailure> RelayChannel::Pair(
        std::string peer_device_id,
        std::span<const uint8_t> peer_public_key) {
        return Activate(std::move(peer_device_id), peer_public_key, ToUnixSeconds(Now()));
    }

    Result<Unit, RelayFailure> RelayChannel::PairWithEncodedKey(
        std::string peer_device_id,
        const std::string_view peer_public_key_base64) {
        auto imported = DeviceKeyPair::ImportPublicKey(peer_public_key_base64);
        if (imported.IsErr()) {
            logging::Logger()->warn("Pairing with '{}' refused: {}",
                                    peer_device_id, imported.UnwrapErr().message);
            return Result<Unit, RelayFailure>::Err(std::move(imported).UnwrapErr());
        }
        return Pair(std::move(peer_device_id), imported.Unwrap());
    }

    Result<Unit, RelayFailure> RelayChannel::Activate(
        std::string peer_device_id,
        std::span<const uint8_t> peer_public_key,
        const int64_t paired_at_unix) {
        if (peer_device_id.empty()) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Peer device id cannot be empty"));
        }
        if (peer_device_id == local_device_id_) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("A device cannot pair with itself"));
        }

        auto derived = SessionKey::Derive(key_pair_, peer_public_key);
        if (derived.IsErr()) {
            logging::Logger()->warn("Pairing with '{}' refused: {}",
                                    peer_device_id, derived.UnwrapErr().message);
            return Result<Unit, RelayFailure>::Err(std::move(derived).UnwrapErr());
        }

        {
            std::unique_lock lock(state_mutex_);
            session_key_ = std::make_unique<SessionKey>(std::move(derived).Unwrap());
            peer_device_id_ = peer_device_id;
            std::copy(peer_public_key.begin(), peer_public_key.end(), peer_public_key_.begin());
            paired_at_unix_ = paired_at_unix;
            state_ = ChannelState::Active;
            replay_guard_.Reset();
        }

        logging::Logger()->info("Channel '{}' paired with '{}'", local_device_id_, peer_device_id);
        NotifyStateChanged(ChannelState::Active);
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    void RelayChannel::Unpair() {
        bool was_active = false;
        {
            std::unique_lock lock(state_mutex_);
            was_active = state_ == ChannelState::Active;
            session_key_.reset();
            peer_device_id_.clear();
            peer_public_key_.fill(0);
            paired_at_unix_ = 0;
            state_ = ChannelState::Unpaired;
            replay_guard_.Reset();
        }
        {
            std::lock_guard lock(relay_mutex_);
            relay_authenticated_ = false;
            peer_online_.reset();
        }
        if (was_active) {
            logging::Logger()->info("Channel '{}' unpaired", local_device_id_);
            NotifyStateChanged(ChannelState::Unpaired);
        }
    }

    Result<PairingRecord, RelayFailure> RelayChannel::ExportPairing() const {
        std::shared_lock lock(state_mutex_);
        if (state_ != ChannelState::Active) {
            return Result<PairingRecord, RelayFailure>::Err(
                RelayFailure::InvalidState("Channel is not paired"));
        }
        PairingRecord record;
        record.set_local_device_id(local_device_id_);
        record.set_peer_device_id(peer_device_id_);
        record.set_peer_public_key(peer_public_key_.data(), peer_public_key_.size());
        record.set_paired_at_unix(paired_at_unix_);
        return Result<PairingRecord, RelayFailure>::Ok(std::move(record));
    }

    Result<Unit, RelayFailure> RelayChannel::RestorePairing(const PairingRecord& record) {
        if (auto valid = models::PairingRecordCodec::Validate(record); valid.IsErr()) {
            return valid;
        }
        if (record.local_device_id() != local_device_id_) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    std::format("Pairing record belongs to '{}', not '{}'",
                                record.local_device_id(), local_device_id_)));
        }
        const auto* key = reinterpret_cast<const uint8_t*>(record.peer_public_key().data());
        return Activate(record.peer_device_id(),
                        std::span<const uint8_t>(key, record.peer_public_key().size()),
                        record.paired_at_unix());
    }

    ChannelState RelayChannel::State() const {
        std::shared_lock lock(state_mutex_);
        return state_;
    }

    std::optional<std::string> RelayChannel::PeerDeviceId() const {
        std::shared_lock lock(state_mutex_);
        if (state_ != ChannelState::Active) {
            return std::nullopt;
        }
        return peer_device_id_;
    }

    // ========================================================================
    // Messaging
    // ========================================================================

    Result<EncryptedEnvelope, RelayFailure> RelayChannel::SealBytes(
        std::span<const uint8_t> plaintext) const {
        const int64_t timestamp = ToUnixSeconds(Now());
        std::shared_lock lock(state_mutex_);
        if (state_ != ChannelState::Active || !session_key_) {
            return Result<EncryptedEnvelope, RelayFailure>::Err(
                RelayFailure::InvalidState("Cannot send: channel is not paired"));
        }
        auto sealed = Envelope::Seal(plaintext, *session_key_, local_device_id_, peer_device_id_, timestamp);
        if (sealed.IsOk()) {
            logging::Logger()->debug("Sealed {} byte payload for '{}'", plaintext.size(), peer_device_id_);
        }
        return sealed;
    }

    Result<std::vector<uint8_t>, RelayFailure> RelayChannel::OpenAuthenticated(
        const EncryptedEnvelope& envelope,
        const std::chrono::system_clock::time_point now) {
        auto opened = [&]() -> Result<std::vector<uint8_t>, RelayFailure> {
            std::shared_lock lock(state_mutex_);
            if (state_ != ChannelState::Active || !session_key_) {
                return Result<std::vector<uint8_t>, RelayFailure>::Err(
                    RelayFailure::InvalidState("Cannot receive: channel is not paired"));
            }
            if (envelope.recipient_id() != local_device_id_) {
                return Result<std::vector<uint8_t>, RelayFailure>::Err(
                    RelayFailure::MisroutedEnvelope(
                        std::format("Envelope addressed to '{}'", envelope.recipient_id())));
            }
            if (envelope.sender_id() != peer_device_id_) {
                return Result<std::vector<uint8_t>, RelayFailure>::Err(
                    RelayFailure::MisroutedEnvelope(
                        std::format("Envelope from unpaired sender '{}'", envelope.sender_id())));
            }

            const int64_t local_time = ToUnixSeconds(now);
            const int64_t sent_at = envelope.timestamp();
            const int64_t max_skew = config_.MaxClockSkew().count();
            const bool stale = sent_at < 0 ||
                               (sent_at > local_time ? sent_at - local_time : local_time - sent_at) > max_skew;
            if (stale) {
                return Result<std::vector<uint8_t>, RelayFailure>::Err(
                    RelayFailure::StaleEnvelope(
                        std::format("Envelope timestamp {} outside {} s of local time {}",
                                    sent_at, max_skew, local_time)));
            }

            return Envelope::Open(envelope, *session_key_);
        }();

        if (opened.IsErr()) {
            Reject(envelope, opened.UnwrapErr());
        }
        return opened;
    }

    Result<Unit, RelayFailure> RelayChannel::AcceptNonce(
        const EncryptedEnvelope& envelope,
        const std::chrono::system_clock::time_point now) {
        if (!config_.IsReplayProtectionEnabled()) {
            return Result<Unit, RelayFailure>::Ok(unit);
        }
        auto nonce = Envelope::DecodeNonce(envelope);
        if (nonce.IsErr()) {
            Reject(envelope, nonce.UnwrapErr());
            return Result<Unit, RelayFailure>::Err(std::move(nonce).UnwrapErr());
        }
        auto accepted = replay_guard_.CheckAndRecord(nonce.Unwrap(), now);
        if (accepted.IsErr()) {
            Reject(envelope, accepted.UnwrapErr());
        }
        return accepted;
    }

    void RelayChannel::Reject(const EncryptedEnvelope& envelope, const RelayFailure& failure) const {
        logging::Logger()->warn("Dropped envelope from '{}' to '{}': {}",
                                envelope.sender_id(), envelope.recipient_id(), relay::ToString(failure.type));
        if (event_handler_) {
            event_handler_->OnEnvelopeRejected(failure.type, envelope.sender_id());
        }
    }

    Result<Unit, RelayFailure> RelayChannel::Dispatch(const EncryptedEnvelope& envelope) {
        auto message = OnEnvelope<google::protobuf::Value>(envelope);
        if (message.IsErr()) {
            return Result<Unit, RelayFailure>::Err(std::move(message).UnwrapErr());
        }

        std::vector<MessageHandler> handlers;
        {
            std::lock_guard lock(handlers_mutex_);
            handlers.reserve(handlers_.size());
            for (const auto& [id, handler] : handlers_) {
                handlers.push_back(handler);
            }
        }

        const google::protobuf::Value& value = message.Unwrap();
        for (const auto& handler : handlers) {
            try {
                handler(value);
            } catch (const std::exception& ex) {
                logging::Logger()->error("Message handler threw: {}", ex.what());
            } catch (...) {
                logging::Logger()->error("Message handler threw a non-standard exception");
            }
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    HandlerId RelayChannel::AddMessageHandler(MessageHandler handler) {
        std::lock_guard lock(handlers_mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_.emplace_back(id, std::move(handler));
        return id;
    }

    bool RelayChannel::RemoveMessageHandler(const HandlerId id) {
        std::lock_guard lock(handlers_mutex_);
        const auto it = std::find_if(handlers_.begin(), handlers_.end(),
                                     [id](const auto& entry) { return entry.first == id; });
        if (it == handlers_.end()) {
            return false;
        }
        handlers_.erase(it);
        return true;
    }

    // ========================================================================
    // Relay session
    // ========================================================================

    Result<Unit, RelayFailure> RelayChannel::DeliverFrame(const std::string& frame_json) {
        if (!transport_) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::Transport("No relay transport attached"));
        }
        auto delivered = transport_->Deliver(frame_json);
        if (delivered.IsErr()) {
            logging::Logger()->warn("Relay transport refused frame: {}", delivered.UnwrapErr().message);
        }
        return delivered;
    }

    Result<Unit, RelayFailure> RelayChannel::Transmit(const EncryptedEnvelope& envelope) {
        auto frame = RelayFrameCodec::EncodeClientFrame(OutboundMessageFrame{envelope});
        if (frame.IsErr()) {
            return Result<Unit, RelayFailure>::Err(std::move(frame).UnwrapErr());
        }
        return DeliverFrame(frame.Unwrap());
    }

    Result<Unit, RelayFailure> RelayChannel::SendHandshake(const std::string_view token) {
        HandshakeFrame handshake;
        {
            std::shared_lock lock(state_mutex_);
            if (state_ != ChannelState::Active) {
                return Result<Unit, RelayFailure>::Err(
                    RelayFailure::InvalidState("Cannot join the relay: channel is not paired"));
            }
            handshake.peer_id = peer_device_id_;
        }
        handshake.device_id = local_device_id_;
        handshake.token = std::string(token);
        handshake.public_key = key_pair_.ExportPublicKey();

        auto frame = RelayFrameCodec::EncodeClientFrame(handshake);
        if (frame.IsErr()) {
            return Result<Unit, RelayFailure>::Err(std::move(frame).UnwrapErr());
        }
        return DeliverFrame(frame.Unwrap());
    }

    Result<Unit, RelayFailure> RelayChannel::SendPing() {
        auto frame = RelayFrameCodec::EncodeClientFrame(PingFrame{});
        if (frame.IsErr()) {
            return Result<Unit, RelayFailure>::Err(std::move(frame).UnwrapErr());
        }
        return DeliverFrame(frame.Unwrap());
    }

    Result<Unit, RelayFailure> RelayChannel::HandleServerFrame(const std::string_view frame_json) {
        auto decoded = RelayFrameCodec::DecodeServerFrame(frame_json);
        if (decoded.IsErr()) {
            logging::Logger()->warn("Dropped relay frame: {}", decoded.UnwrapErr().message);
            return Result<Unit, RelayFailure>::Err(std::move(decoded).UnwrapErr());
        }

        return std::visit([this](const auto& frame) -> Result<Unit, RelayFailure> {
            using F = std::decay_t<decltype(frame)>;
            if constexpr (std::is_same_v<F, HandshakeAckFrame>) {
                {
                    std::lock_guard lock(relay_mutex_);
                    relay_authenticated_ = frame.success;
                }
                if (frame.success) {
                    logging::Logger()->info("Relay accepted handshake for '{}'", local_device_id_);
                } else {
                    logging::Logger()->warn("Relay rejected handshake: {}", frame.error.value_or("no reason given"));
                }
                if (event_handler_) {
                    event_handler_->OnHandshakeResult(frame.success, frame.error);
                }
                return Result<Unit, RelayFailure>::Ok(unit);
            } else if constexpr (std::is_same_v<F, InboundMessageFrame>) {
                return Dispatch(frame.envelope);
            } else if constexpr (std::is_same_v<F, PeerStatusFrame>) {
                {
                    std::lock_guard lock(relay_mutex_);
                    peer_online_ = frame.online;
                }
                logging::Logger()->debug("Peer online={} pending={}", frame.online, frame.pending_count);
                if (event_handler_) {
                    event_handler_->OnPeerStatus(frame.online, frame.pending_count);
                }
                return Result<Unit, RelayFailure>::Ok(unit);
            } else {
                logging::Logger()->debug("Relay pong");
                return Result<Unit, RelayFailure>::Ok(unit);
            }
        }, decoded.Unwrap());
    }

    bool RelayChannel::IsRelayAuthenticated() const {
        std::lock_guard lock(relay_mutex_);
        return relay_authenticated_;
    }

    std::optional<bool> RelayChannel::IsPeerOnline() const {
        std::lock_guard lock(relay_mutex_);
        return peer_online_;
    }

    void RelayChannel::NotifyStateChanged(const ChannelState state) const {
        logging::Logger()->debug("Channel '{}' state -> {}", local_device_id_, ToString(state));
        if (event_handler_) {
            event_handler_->OnStateChanged(state);
        }
    }
}
