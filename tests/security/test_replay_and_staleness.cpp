#include <catch2/catch_test_macros.hpp>
#include "wynter/protocol/relay_channel.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include "helpers/relay_test_harness.hpp"
#include <google/protobuf/struct.pb.h>
#include <vector>

using namespace wynter::relay;
using namespace wynter::relay::protocol;
using namespace wynter::relay::test_helpers;
using wynter::relay::crypto::SodiumInterop;
using namespace std::chrono_literals;

TEST_CASE("Replay Attacks - Captured envelope replayed later", "[security][replay]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);
    PairDevices(laptop, phone);

    auto captured = phone.channel->Seal(TextMessage("unlock", "door")).Unwrap();
    REQUIRE(laptop.channel->Dispatch(captured).IsOk());

    SECTION("Immediate replay") {
        REQUIRE(laptop.channel->Dispatch(captured).UnwrapErr().type == RelayFailureType::ReplayDetected);
    }

    SECTION("Replay inside the window") {
        clock.Advance(299s);
        REQUIRE(laptop.channel->Dispatch(captured).UnwrapErr().type == RelayFailureType::ReplayDetected);
    }

    SECTION("Replay after the window is stale") {
        clock.Advance(301s);
        REQUIRE(laptop.channel->Dispatch(captured).UnwrapErr().type == RelayFailureType::StaleEnvelope);
    }

    SECTION("Replay with a refreshed timestamp is still caught by the nonce") {
        clock.Advance(200s);
        captured.set_timestamp(captured.timestamp() + 200);
        REQUIRE(laptop.channel->Dispatch(captured).UnwrapErr().type == RelayFailureType::ReplayDetected);
    }

    SECTION("Every rejection is reported") {
        (void)laptop.channel->Dispatch(captured);
        (void)laptop.channel->Dispatch(captured);
        REQUIRE(laptop.events->rejections.size() == 2);
        REQUIRE(laptop.events->rejections[0].first == RelayFailureType::ReplayDetected);
        REQUIRE(laptop.events->rejections[0].second == "phone");
    }
}

TEST_CASE("Replay Attacks - Re-pairing clears the replay cache", "[security][replay]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock clock;
    auto laptop = MakeDevice("laptop", &clock);
    auto phone = MakeDevice("phone", &clock);
    PairDevices(laptop, phone);

    auto first = phone.channel->Seal(TextMessage("chat", "old key")).Unwrap();
    REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(first).IsOk());

    // Fresh identity for the phone means a fresh session key.
    auto phone2 = MakeDevice("phone", &clock);
    REQUIRE(laptop.channel->PairWithEncodedKey("phone", phone2.channel->ExportPublicKey()).IsOk());
    REQUIRE(phone2.channel->PairWithEncodedKey("laptop", laptop.channel->ExportPublicKey()).IsOk());

    SECTION("Envelopes under the old key no longer authenticate") {
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(first);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
    }

    SECTION("New session accepts traffic") {
        auto fresh = phone2.channel->Seal(TextMessage("chat", "new key")).Unwrap();
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(fresh).IsOk());
    }
}

TEST_CASE("Staleness - Clock skew boundaries", "[security][freshness]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    ManualClock sender_clock;
    ManualClock receiver_clock;
    auto laptop = MakeDevice("laptop", &receiver_clock, configuration::ChannelConfig::Strict());
    auto phone = MakeDevice("phone", &sender_clock);
    PairDevices(laptop, phone);

    SECTION("Sender clock 60 s fast is accepted by a strict receiver") {
        sender_clock.Advance(60s);
        auto envelope = phone.channel->Seal(TextMessage("chat", "x")).Unwrap();
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
    }

    SECTION("Sender clock 61 s slow is rejected by a strict receiver") {
        sender_clock.Advance(-61s);
        auto envelope = phone.channel->Seal(TextMessage("chat", "x")).Unwrap();
        auto result = laptop.channel->OnEnvelope<google::protobuf::Value>(envelope);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::StaleEnvelope);
    }

    SECTION("Stale envelopes are rejected without consuming their nonce") {
        receiver_clock.Advance(120s);
        auto envelope = phone.channel->Seal(TextMessage("chat", "x")).Unwrap();
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).UnwrapErr().type ==
                RelayFailureType::StaleEnvelope);
        receiver_clock.Advance(-120s);
        REQUIRE(laptop.channel->OnEnvelope<google::protobuf::Value>(envelope).IsOk());
    }
}
