#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/envelope.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wynter::relay::protocol {

// Client -> relay

struct HandshakeFrame {
    std::string device_id;
    std::string peer_id;
    std::string token;
    // Base64 X25519 public key of the connecting device.
    std::string public_key;
};

struct OutboundMessageFrame {
    EncryptedEnvelope envelope;
};

struct PingFrame {};

using ClientFrame = std::variant<HandshakeFrame, OutboundMessageFrame, PingFrame>;

// Relay -> client

struct HandshakeAckFrame {
    bool success = false;
    std::optional<std::string> error;
};

struct InboundMessageFrame {
    EncryptedEnvelope envelope;
    // Relay's view of the sender and receive time; informational only.
    std::string sender_id;
    int64_t timestamp = 0;
};

struct PeerStatusFrame {
    bool online = false;
    uint32_t pending_count = 0;
};

struct PongFrame {};

using ServerFrame = std::variant<HandshakeAckFrame, InboundMessageFrame, PeerStatusFrame, PongFrame>;

/**
 * @brief JSON codec for relay control frames
 *
 * Frames are JSON objects discriminated by "type". Envelopes inside message
 * frames go through EnvelopeWire and are decoded strictly; unknown frame
 * fields added by the relay are ignored. Unknown types and missing or
 * mistyped fields are MalformedMessage.
 *
 * Both directions are provided so relay simulators and tests can speak
 * the server side.
 */
class RelayFrameCodec {
public:
    static Result<std::string, RelayFailure> EncodeClientFrame(const ClientFrame& frame);
    static Result<ServerFrame, RelayFailure> DecodeServerFrame(std::string_view text);

    static Result<std::string, RelayFailure> EncodeServerFrame(const ServerFrame& frame);
    static Result<ClientFrame, RelayFailure> DecodeClientFrame(std::string_view text);

private:
    RelayFrameCodec() = delete;
};

}  // namespace wynter::relay::protocol
