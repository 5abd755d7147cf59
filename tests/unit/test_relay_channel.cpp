#include <catch2/catch_test_macros.hpp>
#include "wynter/protocol/relay_channel.hpp"
#include "wynter/protocol/relay_frame.hpp"
#include "wynter/protocol/envelope_wire.hpp"
#include "helpers/relay_test_harness.hpp"
#include <array>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace wynter::relay;
using namespace wynter::relay::protocol;
using namespace wynter::relay::test_helpers;
using wynter::relay::crypto::SodiumInterop;
using namespace std::chrono_literals;

TEST_CASE("RelayChannel - Creation", "[channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto key_pair = identity::DeviceKeyPair::Generate().Unwrap();

    SECTION("Empty local id is rejected") {
        auto result = RelayChannel::Create("", std::move(key_pair));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
    }

    SECTION("Invalid configuration is rejected") {
        ChannelOptions options;
        options.config = configuration::ChannelConfig::Default().WithReplayCacheCapacity(0);
        auto result = RelayChannel::Create("laptop", std::move(key_pair), std::move(options));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
    }

    SECTION("New channel starts unpaired") {
        auto device = MakeDevice("laptop");
        REQUIRE(device.channel->State() == ChannelState::Unpaired);
        REQUIRE_FALSE(device.channel->PeerDeviceId().has_value());
        REQUIRE(device.channel->ExportPublicKey().size() == kPublicKeyBase64Chars);
    }
}

TEST_CASE("RelayChannel - Pairing", "[channel][pairing]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto laptop = MakeDevice("laptop");
    auto phone = MakeDevice("phone");

    SECTION("Pairing activates the channel and notifies") {
        REQUIRE(laptop.channel->PairWithEncodedKey("phone", phone.channel->ExportPublicKey()).IsOk());
        REQUIRE(laptop.channel->State() == ChannelState::Active);
        REQUIRE(laptop.channel->PeerDeviceId() == std::optional<std::string>("phone"));
        REQUIRE(laptop.events->states == std::vector<ChannelState>{ChannelState::Active});
    }

    SECTION("Pairing with itself is rejected") {
        auto result = laptop.channel->PairWithEncodedKey("laptop", phone.channel->ExportPublicKey());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
        REQUIRE(laptop.channel->State() == ChannelState::Unpaired);
    }

    SECTION("Empty peer id is rejected") {
        REQUIRE(laptop.channel->PairWithEncodedKey("", phone.channel->ExportPublicKey()).IsErr());
    }

    SECTION("Malformed peer key is rejected") {
        auto result = laptop.channel->PairWithEncodedKey("phone", "not-a-key");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidKeyFormat);
        REQUIRE(laptop.channel->State() == ChannelState::Unpaired);
    }

    SECTION("Small-order peer key is rejected") {
        const std::array<uint8_t, 32> zero{};
        auto result = laptop.channel->Pair("phone", zero);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidKeyFormat);
    }

    SECTION("Unpair returns to unpaired and forgets the peer") {
        PairDevices(laptop, phone);
        laptop.channel->Unpair();
        REQUIRE(laptop.channel->State() == ChannelState::Unpaired);
        REQUIRE_FALSE(laptop.channel->PeerDeviceId().has_value());
        REQUIRE(laptop.events->states.back() == ChannelState::Unpaired);
        REQUIRE(laptop.channel->Seal(TextMessage("ping", "")).IsErr());
    }

    SECTION("Unpair on an unpaired channel does not notify") {
        laptop.channel->Unpair();
        REQUIRE(laptop.events->states.empty());
    }
}

TEST_CASE("RelayChannel - Pairing persistence", "[channel][pairing]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);
    PairDevices(laptop, phone);

    SECTION("Export requires an active pairing") {
        auto stranger = MakeDevice("tablet");
        auto record = stranger.channel->ExportPairing();
        REQUIRE(record.IsErr());
        REQUIRE(record.UnwrapErr().type == RelayFailureType::InvalidState);
    }

    SECTION("Restored pairing decrypts traffic from the peer") {
        auto record = laptop.channel->ExportPairing();
        REQUIRE(record.IsOk());
        REQUIRE(record.Unwrap().paired_at_unix() == 1'700'000'000);

        laptop.channel->Unpair();
        REQUIRE(laptop.channel->RestorePairing(record.Unwrap()).IsOk());
        REQUIRE(laptop.channel->State() == ChannelState::Active);

        auto envelope = phone.channel->Seal(TextMessage("chat", "after restore")).Unwrap();
        auto message = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(message.IsOk());
        REQUIRE(FieldOf(message.Unwrap(), "text") == "after restore");
    }

    SECTION("Record for another device is refused") {
        auto record = laptop.channel->ExportPairing().Unwrap();
        record.set_local_device_id("desktop");
        auto result = laptop.channel->RestorePairing(record);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
    }
}

TEST_CASE("RelayChannel - Messaging", "[channel][messaging]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);

    SECTION("Sealing requires a pairing") {
        auto result = phone.channel->Seal(TextMessage("ping", ""));
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidState);
    }

    SECTION("Receiving requires a pairing") {
        PairDevices(laptop, phone);
        auto envelope = phone.channel->Seal(TextMessage("ping", "")).Unwrap();
        laptop.channel->Unpair();
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidState);
    }

    SECTION("Sealed envelope is addressed to the peer") {
        PairDevices(laptop, phone);
        auto envelope = phone.channel->Seal(TextMessage("ping", "")).Unwrap();
        REQUIRE(envelope.sender_id() == "phone");
        REQUIRE(envelope.recipient_id() == "laptop");
        REQUIRE(envelope.timestamp() == 1'700'000'000);
    }

    SECTION("Peer decrypts what was sent") {
        PairDevices(laptop, phone);
        auto envelope = phone.channel->Seal(TextMessage("chat", "hello laptop")).Unwrap();
        auto message = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(message.IsOk());
        REQUIRE(FieldOf(message.Unwrap(), "type") == "chat");
        REQUIRE(FieldOf(message.Unwrap(), "text") == "hello laptop");
    }

    SECTION("Send hands a message frame to the transport") {
        PairDevices(laptop, phone);
        auto sent = phone.channel->Send(TextMessage("chat", "over the relay"));
        REQUIRE(sent.IsOk());
        auto frames = phone.transport->TakeFrames();
        REQUIRE(frames.size() == 1);
        auto decoded = RelayFrameCodec::DecodeClientFrame(frames.front());
        REQUIRE(decoded.IsOk());
        const auto* frame = std::get_if<OutboundMessageFrame>(&decoded.Unwrap());
        REQUIRE(frame != nullptr);
        REQUIRE(frame->envelope.nonce() == sent.Unwrap().nonce());
    }

    SECTION("Send reports transport failures") {
        PairDevices(laptop, phone);
        phone.transport->SetFailing(true);
        auto sent = phone.channel->Send(TextMessage("chat", "dropped"));
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == RelayFailureType::Transport);
    }

    SECTION("Send without a transport fails") {
        ChannelOptions options;
        auto bare = RelayChannel::Create(
            "tablet", identity::DeviceKeyPair::Generate().Unwrap(), std::move(options)).Unwrap();
        REQUIRE(bare->PairWithEncodedKey("phone", phone.channel->ExportPublicKey()).IsOk());
        auto sent = bare->Send(TextMessage("chat", "nowhere"));
        REQUIRE(sent.IsErr());
        REQUIRE(sent.UnwrapErr().type == RelayFailureType::Transport);
    }
}

TEST_CASE("RelayChannel - Inbound validation order", "[channel][validation]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);
    PairDevices(laptop, phone);
    auto envelope = phone.channel->Seal(TextMessage("chat", "hi")).Unwrap();

    SECTION("Wrong recipient is misrouted") {
        envelope.set_recipient_id("tablet");
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::MisroutedEnvelope);
        REQUIRE(laptop.events->rejections.size() == 1);
        REQUIRE(laptop.events->rejections.front().first == RelayFailureType::MisroutedEnvelope);
    }

    SECTION("Unknown sender is misrouted") {
        envelope.set_sender_id("tablet");
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::MisroutedEnvelope);
        REQUIRE(laptop.events->rejections.front().second == "tablet");
    }

    SECTION("Routing is checked before freshness") {
        envelope.set_recipient_id("tablet");
        envelope.set_timestamp(0);
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.UnwrapErr().type == RelayFailureType::MisroutedEnvelope);
    }

    SECTION("Freshness is checked before authentication") {
        envelope.set_timestamp(envelope.timestamp() + 3600);
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.UnwrapErr().type == RelayFailureType::StaleEnvelope);
    }

    SECTION("Edited timestamp inside the window still authenticates") {
        envelope.set_timestamp(envelope.timestamp() + 10);
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsOk());
    }

    SECTION("Edge of the skew window is accepted") {
        clock.Advance(300s);
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
    }

    SECTION("One second past the window is stale") {
        clock.Advance(301s);
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::StaleEnvelope);
    }

    SECTION("Envelopes from the future are stale too") {
        clock.Advance(-301s);
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.UnwrapErr().type == RelayFailureType::StaleEnvelope);
    }

    SECTION("Replay is detected after a successful open") {
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
        auto replayed = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(replayed.IsErr());
        REQUIRE(replayed.UnwrapErr().type == RelayFailureType::ReplayDetected);
    }

    SECTION("Replay with a refreshed timestamp is caught until the nonce expires") {
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());

        clock.Advance(300s);
        envelope.set_timestamp(envelope.timestamp() + 300);
        auto within = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(within.IsErr());
        REQUIRE(within.UnwrapErr().type == RelayFailureType::ReplayDetected);

        clock.Advance(301s);
        envelope.set_timestamp(envelope.timestamp() + 301);
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
    }

    SECTION("Forged envelope does not burn the nonce") {
        auto forged = envelope;
        auto ciphertext = forged.ciphertext();
        ciphertext[0] = ciphertext[0] == 'A' ? 'B' : 'A';
        forged.set_ciphertext(ciphertext);
        auto rejected = laptop.channel->OnEnvelope<google::protobuf::Value>(forged);
        REQUIRE(rejected.IsErr());
        REQUIRE(rejected.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
    }

    SECTION("Replay protection can be disabled") {
        auto lax = MakeDevice("tablet", &clock,
            configuration::ChannelConfig::Default().WithReplayProtection(false));
        REQUIRE(lax.channel->PairWithEncodedKey("phone", phone.channel->ExportPublicKey()).IsOk());
        REQUIRE(phone.channel->PairWithEncodedKey("tablet", lax.channel->ExportPublicKey()).IsOk());
        auto to_tablet = phone.channel->Seal(TextMessage("chat", "twice")).Unwrap();
        REQUIRE(lax.channel->OnEnvelope<google::protobuf::Value>(to_tablet).IsOk());
        REQUIRE(lax.channel->OnEnvelope<google::protobuf::Value>(to_tablet).IsOk());
    }
}

TEST_CASE("RelayChannel - Message handlers", "[channel][dispatch]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);
    PairDevices(laptop, phone);

    SECTION("Every handler sees the message") {
        std::vector<std::string> seen;
        laptop.channel->AddMessageHandler([&seen](const google::protobuf::Value& v) { seen.push_back("a:" + FieldOf(v, "text")); });
        laptop.channel->AddMessageHandler([&seen](const google::protobuf::Value& v) { seen.push_back("b:" + FieldOf(v, "text")); });
        auto envelope = phone.channel->Seal(TextMessage("chat", "x")).Unwrap();
        REQUIRE(laptop.channel->Dispatch(envelope).IsOk());
        REQUIRE(seen == std::vector<std::string>{"a:x", "b:x"});
    }

    SECTION("Removed handler is not called") {
        int calls = 0;
        const auto id = laptop.channel->AddMessageHandler([&calls](const google::protobuf::Value&) { ++calls; });
        REQUIRE(laptop.channel->RemoveMessageHandler(id));
        REQUIRE_FALSE(laptop.channel->RemoveMessageHandler(id));
        REQUIRE(laptop.channel->Dispatch(phone.channel->Seal(TextMessage("chat", "x")).Unwrap()).IsOk());
        REQUIRE(calls == 0);
    }

    SECTION("A throwing handler does not stop the others") {
        int calls = 0;
        laptop.channel->AddMessageHandler([](const google::protobuf::Value&) { throw std::runtime_error("boom"); });
        laptop.channel->AddMessageHandler([&calls](const google::protobuf::Value&) { ++calls; });
        REQUIRE(laptop.channel->Dispatch(phone.channel->Seal(TextMessage("chat", "x")).Unwrap()).IsOk());
        REQUIRE(calls == 1);
    }

    SECTION("A handler throwing a non-standard type does not stop the others") {
        int calls = 0;
        laptop.channel->AddMessageHandler([](const google::protobuf::Value&) { throw 42; });
        laptop.channel->AddMessageHandler([&calls](const google::protobuf::Value&) { ++calls; });
        REQUIRE(laptop.channel->Dispatch(phone.channel->Seal(TextMessage("chat", "x")).Unwrap()).IsOk());
        REQUIRE(calls == 1);
    }

    SECTION("Rejected envelopes reach no handler") {
        int calls = 0;
        laptop.channel->AddMessageHandler([&calls](const google::protobuf::Value&) { ++calls; });
        auto envelope = phone.channel->Seal(TextMessage("chat", "x")).Unwrap();
        envelope.set_recipient_id("tablet");
        REQUIRE(laptop.channel->Dispatch(envelope).IsErr());
        REQUIRE(calls == 0);
    }
}

TEST_CASE("RelayChannel - Relay session frames", "[channel][relay]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);

    SECTION("Handshake requires a pairing") {
        auto result = laptop.channel->SendHandshake("token");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidState);
    }

    SECTION("Handshake frame names both devices") {
        PairDevices(laptop, phone);
        REQUIRE(laptop.channel->SendHandshake("token-1").IsOk());
        auto frames = laptop.transport->TakeFrames();
        REQUIRE(frames.size() == 1);
        const auto decoded = RelayFrameCodec::DecodeClientFrame(frames.front()).Unwrap();
        const auto& handshake = std::get<HandshakeFrame>(decoded);
        REQUIRE(handshake.device_id == "laptop");
        REQUIRE(handshake.peer_id == "phone");
        REQUIRE(handshake.token == "token-1");
        REQUIRE(handshake.public_key == laptop.channel->ExportPublicKey());
    }

    SECTION("Handshake ack marks the relay session") {
        REQUIRE_FALSE(laptop.channel->IsRelayAuthenticated());
        REQUIRE(laptop.channel->HandleServerFrame(R"({"type":"handshake_ack","success":true})").IsOk());
        REQUIRE(laptop.channel->IsRelayAuthenticated());
        REQUIRE(laptop.events->handshakes.size() == 1);
        REQUIRE(laptop.events->handshakes.front().first);
    }

    SECTION("Refused handshake reports the error") {
        REQUIRE(laptop.channel->HandleServerFrame(
            R"({"type":"handshake_ack","success":false,"error":"expired token"})").IsOk());
        REQUIRE_FALSE(laptop.channel->IsRelayAuthenticated());
        REQUIRE(laptop.events->handshakes.front().second == std::optional<std::string>("expired token"));
    }

    SECTION("Peer status is tracked") {
        REQUIRE_FALSE(laptop.channel->IsPeerOnline().has_value());
        REQUIRE(laptop.channel->HandleServerFrame(
            R"({"type":"peer_status","online":true,"pending_count":2})").IsOk());
        REQUIRE(laptop.channel->IsPeerOnline() == std::optional<bool>(true));
        REQUIRE(laptop.events->peer_status.front() == std::make_pair(true, uint32_t{2}));
    }

    SECTION("Inbound message frames are dispatched") {
        PairDevices(laptop, phone);
        std::string received;
        laptop.channel->AddMessageHandler([&received](const google::protobuf::Value& v) { received = FieldOf(v, "text"); });
        auto envelope = phone.channel->Seal(TextMessage("chat", "via relay")).Unwrap();
        auto frame = RelayFrameCodec::EncodeServerFrame(InboundMessageFrame{envelope, "phone", 1'700'000'001}).Unwrap();
        REQUIRE(laptop.channel->HandleServerFrame(frame).IsOk());
        REQUIRE(received == "via relay");
    }

    SECTION("Garbage frames are malformed") {
        auto result = laptop.channel->HandleServerFrame("{");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::MalformedMessage);
    }

    SECTION("Ping sends a ping frame") {
        REQUIRE(laptop.channel->SendPing().IsOk());
        auto frames = laptop.transport->TakeFrames();
        REQUIRE(frames.size() == 1);
        REQUIRE(std::holds_alternative<PingFrame>(RelayFrameCodec::DecodeClientFrame(frames.front()).Unwrap()));
    }

    SECTION("Unpair drops the relay session") {
        PairDevices(laptop, phone);
        REQUIRE(laptop.channel->HandleServerFrame(R"({"type":"handshake_ack","success":true})").IsOk());
        laptop.channel->Unpair();
        REQUIRE_FALSE(laptop.channel->IsRelayAuthenticated());
    }
}
