/**
 * @file relay_pairing_example.cpp
 * @brief Two devices pairing and exchanging a message through an in-memory relay
 */

#include "wynter/crypto/sodium_interop.hpp"
#include "wynter/identity/device_key_pair.hpp"
#include "wynter/protocol/relay_channel.hpp"
#include "wynter/protocol/relay_frame.hpp"
#include "wynter/core/logging.hpp"

#include <google/protobuf/struct.pb.h>

#include <deque>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>

using namespace wynter::relay;
using namespace wynter::relay::crypto;
using namespace wynter::relay::identity;
using namespace wynter::relay::protocol;

namespace {

// Collects frames a channel hands to its connection.
class QueueTransport final : public IRelayTransport {
public:
    Result<Unit, RelayFailure> Deliver(std::string_view frame_json) override {
        outbox.emplace_back(frame_json);
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    std::deque<std::string> outbox;
};

class PrintingHandler final : public IChannelEventHandler {
public:
    explicit PrintingHandler(std::string name) : name_(std::move(name)) {}

    void OnStateChanged(const ChannelState state) override {
        std::cout << "   [" << name_ << "] state: "
                  << (state == ChannelState::Active ? "active" : "unpaired") << std::endl;
    }
    void OnEnvelopeRejected(const RelayFailureType reason, const std::string& sender_id) override {
        std::cout << "   [" << name_ << "] rejected envelope from " << sender_id
                  << ": " << ToString(reason) << std::endl;
    }
    void OnPeerStatus(const bool online, const uint32_t pending_count) override {
        std::cout << "   [" << name_ << "] peer " << (online ? "online" : "offline")
                  << ", pending " << pending_count << std::endl;
    }
    void OnHandshakeResult(const bool success, const std::optional<std::string>& error) override {
        std::cout << "   [" << name_ << "] relay handshake "
                  << (success ? "accepted" : "refused: " + error.value_or("unknown")) << std::endl;
    }

private:
    std::string name_;
};

struct Device {
    std::string id;
    std::shared_ptr<QueueTransport> transport;
    std::unique_ptr<RelayChannel> channel;
};

Result<Device, RelayFailure> make_device(const std::string& id) {
    auto key_pair = DeviceKeyPair::Generate();
    if (key_pair.IsErr()) {
        return Result<Device, RelayFailure>::Err(std::move(key_pair).UnwrapErr());
    }
    auto transport = std::make_shared<QueueTransport>();
    ChannelOptions options;
    options.transport = transport;
    options.event_handler = std::make_shared<PrintingHandler>(id);
    auto channel = RelayChannel::Create(id, std::move(key_pair).Unwrap(), std::move(options));
    if (channel.IsErr()) {
        return Result<Device, RelayFailure>::Err(std::move(channel).UnwrapErr());
    }
    return Result<Device, RelayFailure>::Ok(Device{id, transport, std::move(channel).Unwrap()});
}

// Drains one device's outbox, answering as the relay would.
void pump(Device& from, Device& to) {
    while (!from.transport->outbox.empty()) {
        const std::string frame_json = std::move(from.transport->outbox.front());
        from.transport->outbox.pop_front();

        auto decoded = RelayFrameCodec::DecodeClientFrame(frame_json);
        if (decoded.IsErr()) {
            std::cerr << "   relay dropped frame: " << decoded.UnwrapErr().message << std::endl;
            continue;
        }

        std::visit([&](const auto& frame) {
            using F = std::decay_t<decltype(frame)>;
            std::optional<ServerFrame> reply;
            Device* target = &from;
            if constexpr (std::is_same_v<F, HandshakeFrame>) {
                reply = ServerFrame{HandshakeAckFrame{true, std::nullopt}};
            } else if constexpr (std::is_same_v<F, OutboundMessageFrame>) {
                reply = ServerFrame{InboundMessageFrame{frame.envelope, from.id, frame.envelope.timestamp()}};
                target = &to;
            } else {
                reply = ServerFrame{PongFrame{}};
            }
            auto encoded = RelayFrameCodec::EncodeServerFrame(*reply);
            if (encoded.IsErr()) {
                std::cerr << "   relay encode failed: " << encoded.UnwrapErr().message << std::endl;
                return;
            }
            if (auto handled = target->channel->HandleServerFrame(encoded.Unwrap()); handled.IsErr()) {
                std::cerr << "   " << target->id << " refused frame: "
                          << handled.UnwrapErr().message << std::endl;
            }
        }, decoded.Unwrap());
    }
}

}  // namespace

int main() {
    std::cout << "=== Wynter Relay - Pairing Example ===" << std::endl;
    std::cout << std::endl;

    logging::SetLevel(spdlog::level::warn);

    std::cout << "1. Initializing libsodium..." << std::endl;
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << std::endl;

    std::cout << "2. Creating devices..." << std::endl;
    auto laptop_result = make_device("laptop");
    auto phone_result = make_device("phone");
    if (laptop_result.IsErr() || phone_result.IsErr()) {
        std::cerr << "Failed to create devices" << std::endl;
        return 1;
    }
    Device laptop = std::move(laptop_result).Unwrap();
    Device phone = std::move(phone_result).Unwrap();
    std::cout << "   laptop public key: " << laptop.channel->ExportPublicKey() << std::endl;
    std::cout << "   phone public key:  " << phone.channel->ExportPublicKey() << std::endl;
    std::cout << std::endl;

    // The laptop shows a pairing code; the phone scans it and sends its own
    // key back over the pairing channel.
    std::cout << "3. Pairing..." << std::endl;
    if (auto paired = phone.channel->PairWithEncodedKey("laptop", laptop.channel->ExportPublicKey());
        paired.IsErr()) {
        std::cerr << "Phone pairing failed: " << paired.UnwrapErr().message << std::endl;
        return 1;
    }
    if (auto paired = laptop.channel->PairWithEncodedKey("phone", phone.channel->ExportPublicKey());
        paired.IsErr()) {
        std::cerr << "Laptop pairing failed: " << paired.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << std::endl;

    std::cout << "4. Connecting to the relay..." << std::endl;
    if (laptop.channel->SendHandshake("laptop-token").IsErr() ||
        phone.channel->SendHandshake("phone-token").IsErr()) {
        std::cerr << "Handshake failed" << std::endl;
        return 1;
    }
    pump(laptop, phone);
    pump(phone, laptop);
    std::cout << std::endl;

    std::cout << "5. Sending a message from phone to laptop..." << std::endl;
    laptop.channel->AddMessageHandler([](const google::protobuf::Value& message) {
        const auto& fields = message.struct_value().fields();
        const auto it = fields.find("text");
        std::cout << "   laptop received: "
                  << (it != fields.end() ? it->second.string_value() : "<no text>") << std::endl;
    });

    google::protobuf::Value message;
    (*message.mutable_struct_value()->mutable_fields())["text"].set_string_value("hello from the phone");
    auto sent = phone.channel->Send(message);
    if (sent.IsErr()) {
        std::cerr << "Send failed: " << sent.UnwrapErr().message << std::endl;
        return 1;
    }
    const EncryptedEnvelope envelope = sent.Unwrap();
    pump(phone, laptop);
    std::cout << std::endl;

    std::cout << "6. Replaying the same envelope..." << std::endl;
    if (auto replayed = laptop.channel->Dispatch(envelope); replayed.IsErr()) {
        std::cout << "   blocked: " << ToString(replayed.UnwrapErr().type) << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Example completed ===" << std::endl;
    return 0;
}
