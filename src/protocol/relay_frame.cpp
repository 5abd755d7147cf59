#include "wynter/protocol/relay_frame.hpp"
#include "wynter/protocol/envelope_wire.hpp"

#include <google/protobuf/struct.pb.h>

#include <array>
#include <cmath>
#include <format>
#include <limits>
#include <type_traits>
#include <utility>

namespace wynter::relay::protocol {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

template<typename>
inline constexpr bool kAlwaysFalse = false;

void PutString(Struct& object, const std::string_view key, const std::string_view text) {
    (*object.mutable_fields())[std::string(key)].set_string_value(std::string(text));
}

void PutBool(Struct& object, const std::string_view key, const bool flag) {
    (*object.mutable_fields())[std::string(key)].set_bool_value(flag);
}

void PutNumber(Struct& object, const std::string_view key, const double number) {
    (*object.mutable_fields())[std::string(key)].set_number_value(number);
}

void PutEnvelope(Struct& object, const EncryptedEnvelope& envelope) {
    *(*object.mutable_fields())["envelope"].mutable_struct_value() = EnvelopeWire::ToStruct(envelope);
}

const Value* Find(const Struct& object, const std::string_view key) {
    const auto it = object.fields().find(std::string(key));
    return it == object.fields().end() ? nullptr : &it->second;
}

Result<std::string, RelayFailure> GetString(const Struct& object, const std::string_view key) {
    const Value* value = Find(object, key);
    if (value == nullptr || value->kind_case() != Value::kStringValue) {
        return Result<std::string, RelayFailure>::Err(
            RelayFailure::MalformedMessage(std::format("Frame field '{}' must be a string", key)));
    }
    return Result<std::string, RelayFailure>::Ok(value->string_value());
}

Result<bool, RelayFailure> GetBool(const Struct& object, const std::string_view key) {
    const Value* value = Find(object, key);
    if (value == nullptr || value->kind_case() != Value::kBoolValue) {
        return Result<bool, RelayFailure>::Err(
            RelayFailure::MalformedMessage(std::format("Frame field '{}' must be a boolean", key)));
    }
    return Result<bool, RelayFailure>::Ok(value->bool_value());
}

Result<int64_t, RelayFailure> GetNonNegativeInteger(
    const Struct& object,
    const std::string_view key,
    const double max_value) {

    const Value* value = Find(object, key);
    if (value == nullptr || value->kind_case() != Value::kNumberValue) {
        return Result<int64_t, RelayFailure>::Err(
            RelayFailure::MalformedMessage(std::format("Frame field '{}' must be a number", key)));
    }
    const double raw = value->number_value();
    if (!std::isfinite(raw) || std::trunc(raw) != raw || raw < 0.0 || raw > max_value) {
        return Result<int64_t, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Frame field '{}' must be a non-negative integer", key)));
    }
    return Result<int64_t, RelayFailure>::Ok(static_cast<int64_t>(raw));
}

Result<EncryptedEnvelope, RelayFailure> GetEnvelope(const Struct& object) {
    const Value* value = Find(object, "envelope");
    if (value == nullptr || value->kind_case() != Value::kStructValue) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Frame field 'envelope' must be an object"));
    }
    return EnvelopeWire::FromStruct(value->struct_value());
}

Result<Struct, RelayFailure> ParseTyped(const std::string_view text, std::string& type) {
    auto parsed = json::Parse(text);
    if (parsed.IsErr()) {
        return parsed;
    }
    auto type_result = GetString(parsed.Unwrap(), "type");
    if (type_result.IsErr()) {
        return Result<Struct, RelayFailure>::Err(std::move(type_result).UnwrapErr());
    }
    type = std::move(type_result).Unwrap();
    return parsed;
}

}  // namespace

Result<std::string, RelayFailure> RelayFrameCodec::EncodeClientFrame(const ClientFrame& frame) {
    Struct object;
    std::visit([&object](const auto& f) {
        using F = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<F, HandshakeFrame>) {
            PutString(object, "type", kFrameHandshake);
            PutString(object, "device_id", f.device_id);
            PutString(object, "peer_id", f.peer_id);
            PutString(object, "token", f.token);
            PutString(object, "public_key", f.public_key);
        } else if constexpr (std::is_same_v<F, OutboundMessageFrame>) {
            PutString(object, "type", kFrameMessage);
            PutEnvelope(object, f.envelope);
        } else if constexpr (std::is_same_v<F, PingFrame>) {
            PutString(object, "type", kFramePing);
        } else {
            static_assert(kAlwaysFalse<F>, "unhandled client frame");
        }
    }, frame);
    return json::Print(object);
}

Result<ServerFrame, RelayFailure> RelayFrameCodec::DecodeServerFrame(const std::string_view text) {
    std::string type;
    auto parsed = ParseTyped(text, type);
    if (parsed.IsErr()) {
        return Result<ServerFrame, RelayFailure>::Err(std::move(parsed).UnwrapErr());
    }
    const Struct& object = parsed.Unwrap();

    if (type == kFrameHandshakeAck) {
        auto success = GetBool(object, "success");
        if (success.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(success).UnwrapErr());
        }
        HandshakeAckFrame ack;
        ack.success = success.Unwrap();
        if (const Value* error = Find(object, "error");
            error != nullptr && error->kind_case() != Value::kNullValue) {
            if (error->kind_case() != Value::kStringValue) {
                return Result<ServerFrame, RelayFailure>::Err(
                    RelayFailure::MalformedMessage("Frame field 'error' must be a string"));
            }
            ack.error = error->string_value();
        }
        return Result<ServerFrame, RelayFailure>::Ok(std::move(ack));
    }

    if (type == kFrameMessage) {
        auto envelope = GetEnvelope(object);
        if (envelope.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(envelope).UnwrapErr());
        }
        auto sender = GetString(object, "sender_id");
        if (sender.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(sender).UnwrapErr());
        }
        auto timestamp = GetNonNegativeInteger(
            object, "timestamp", static_cast<double>(EnvelopeWire::MAX_EXACT_TIMESTAMP));
        if (timestamp.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(timestamp).UnwrapErr());
        }
        InboundMessageFrame message;
        message.envelope = std::move(envelope).Unwrap();
        message.sender_id = std::move(sender).Unwrap();
        message.timestamp = timestamp.Unwrap();
        return Result<ServerFrame, RelayFailure>::Ok(std::move(message));
    }

    if (type == kFramePeerStatus) {
        auto online = GetBool(object, "online");
        if (online.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(online).UnwrapErr());
        }
        auto pending = GetNonNegativeInteger(
            object, "pending_count", static_cast<double>(std::numeric_limits<uint32_t>::max()));
        if (pending.IsErr()) {
            return Result<ServerFrame, RelayFailure>::Err(std::move(pending).UnwrapErr());
        }
        return Result<ServerFrame, RelayFailure>::Ok(
            PeerStatusFrame{online.Unwrap(), static_cast<uint32_t>(pending.Unwrap())});
    }

    if (type == kFramePong) {
        return Result<ServerFrame, RelayFailure>::Ok(PongFrame{});
    }

    return Result<ServerFrame, RelayFailure>::Err(
        RelayFailure::MalformedMessage(std::format("Unknown relay frame type '{}'", type)));
}

Result<std::string, RelayFailure> RelayFrameCodec::EncodeServerFrame(const ServerFrame& frame) {
    Struct object;
    std::visit([&object](const auto& f) {
        using F = std::decay_t<decltype(f)>;
        if constexpr (std::is_same_v<F, HandshakeAckFrame>) {
            PutString(object, "type", kFrameHandshakeAck);
            PutBool(object, "success", f.success);
            if (f.error.has_value()) {
                PutString(object, "error", *f.error);
            }
        } else if constexpr (std::is_same_v<F, InboundMessageFrame>) {
            PutString(object, "type", kFrameMessage);
            PutEnvelope(object, f.envelope);
            PutString(object, "sender_id", f.sender_id);
            PutNumber(object, "timestamp", static_cast<double>(f.timestamp));
        } else if constexpr (std::is_same_v<F, PeerStatusFrame>) {
            PutString(object, "type", kFramePeerStatus);
            PutBool(object, "online", f.online);
            PutNumber(object, "pending_count", static_cast<double>(f.pending_count));
        } else if constexpr (std::is_same_v<F, PongFrame>) {
            PutString(object, "type", kFramePong);
        } else {
            static_assert(kAlwaysFalse<F>, "unhandled server frame");
        }
    }, frame);
    return json::Print(object);
}

Result<ClientFrame, RelayFailure> RelayFrameCodec::DecodeClientFrame(const std::string_view text) {
    std::string type;
    auto parsed = ParseTyped(text, type);
    if (parsed.IsErr()) {
        return Result<ClientFrame, RelayFailure>::Err(std::move(parsed).UnwrapErr());
    }
    const Struct& object = parsed.Unwrap();

    if (type == kFrameHandshake) {
        HandshakeFrame handshake;
        const std::array<std::pair<std::string_view, std::string*>, 4> fields = {{
            {"device_id", &handshake.device_id},
            {"peer_id", &handshake.peer_id},
            {"token", &handshake.token},
            {"public_key", &handshake.public_key},
        }};
        for (const auto& [key, target] : fields) {
            auto field = GetString(object, key);
            if (field.IsErr()) {
                return Result<ClientFrame, RelayFailure>::Err(std::move(field).UnwrapErr());
            }
            *target = std::move(field).Unwrap();
        }
        return Result<ClientFrame, RelayFailure>::Ok(std::move(handshake));
    }

    if (type == kFrameMessage) {
        auto envelope = GetEnvelope(object);
        if (envelope.IsErr()) {
            return Result<ClientFrame, RelayFailure>::Err(std::move(envelope).UnwrapErr());
        }
        return Result<ClientFrame, RelayFailure>::Ok(
            OutboundMessageFrame{std::move(envelope).Unwrap()});
    }

    if (type == kFramePing) {
        return Result<ClientFrame, RelayFailure>::Ok(PingFrame{});
    }

    return Result<ClientFrame, RelayFailure>::Err(
        RelayFailure::MalformedMessage(std::format("Unknown client frame type '{}'", type)));
}

}  // namespace wynter::relay::protocol
