#include <catch2/catch_test_macros.hpp>
#include "wynter/protocol/envelope_wire.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include <string>

using namespace wynter::relay;
using namespace wynter::relay::protocol;

namespace {
EncryptedEnvelope sample_envelope() {
    EncryptedEnvelope envelope;
    envelope.set_sender_id("phone");
    envelope.set_recipient_id("laptop");
    envelope.set_timestamp(1'700'000'000);
    envelope.set_nonce("AAECAwQFBgcICQoLDA0ODxAREhMUFRYX");
    envelope.set_ciphertext("3q2+7w==");
    return envelope;
}

const std::string kValidJson =
    R"({"sender_id":"phone","recipient_id":"laptop","timestamp":1700000000,)"
    R"("nonce":"AAECAwQFBgcICQoLDA0ODxAREhMUFRYX","ciphertext":"3q2+7w=="})";
}

TEST_CASE("EnvelopeWire - JSON encoding", "[protocol][wire]") {
    SECTION("Timestamp is written as a JSON integer") {
        auto json = EnvelopeWire::ToJson(sample_envelope());
        REQUIRE(json.IsOk());
        REQUIRE(json.Unwrap().find("1700000000") != std::string::npos);
        REQUIRE(json.Unwrap().find("1.7e") == std::string::npos);
        REQUIRE(json.Unwrap().find("\"sender_id\"") != std::string::npos);
    }

    SECTION("Decoding restores every field") {
        auto decoded = EnvelopeWire::FromJson(kValidJson);
        REQUIRE(decoded.IsOk());
        const auto& envelope = decoded.Unwrap();
        REQUIRE(envelope.sender_id() == "phone");
        REQUIRE(envelope.recipient_id() == "laptop");
        REQUIRE(envelope.timestamp() == 1'700'000'000);
        REQUIRE(envelope.nonce() == "AAECAwQFBgcICQoLDA0ODxAREhMUFRYX");
        REQUIRE(envelope.ciphertext() == "3q2+7w==");
    }

    SECTION("Encoded envelope decodes to the same fields") {
        auto json = EnvelopeWire::ToJson(sample_envelope()).Unwrap();
        auto decoded = EnvelopeWire::FromJson(json).Unwrap();
        REQUIRE(decoded.SerializeAsString() == sample_envelope().SerializeAsString());
    }

    SECTION("Negative timestamps cannot be encoded") {
        auto envelope = sample_envelope();
        envelope.set_timestamp(-1);
        auto json = EnvelopeWire::ToJson(envelope);
        REQUIRE(json.IsErr());
        REQUIRE(json.UnwrapErr().type == RelayFailureType::Encode);
    }
}

TEST_CASE("EnvelopeWire - Strict decoding", "[protocol][wire]") {
    auto expect_malformed = [](const std::string& json) {
        auto decoded = EnvelopeWire::FromJson(json);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == RelayFailureType::MalformedMessage);
    };

    SECTION("Not JSON") {
        expect_malformed("not json");
    }
    SECTION("JSON array") {
        expect_malformed("[1,2,3]");
    }
    SECTION("Missing field") {
        expect_malformed(R"({"sender_id":"phone","recipient_id":"laptop","timestamp":1,"nonce":"AA=="})");
    }
    SECTION("Extra field") {
        expect_malformed(
            R"({"sender_id":"phone","recipient_id":"laptop","timestamp":1,)"
            R"("nonce":"AA==","ciphertext":"AA==","extra":true})");
    }
    SECTION("Timestamp as a string") {
        expect_malformed(
            R"({"sender_id":"phone","recipient_id":"laptop","timestamp":"1",)"
            R"("nonce":"AA==","ciphertext":"AA=="})");
    }
    SECTION("Fractional timestamp") {
        expect_malformed(
            R"({"sender_id":"phone","recipient_id":"laptop","timestamp":1.5,)"
            R"("nonce":"AA==","ciphertext":"AA=="})");
    }
    SECTION("Negative timestamp") {
        expect_malformed(
            R"({"sender_id":"phone","recipient_id":"laptop","timestamp":-5,)"
            R"("nonce":"AA==","ciphertext":"AA=="})");
    }
    SECTION("Sender id as a number") {
        expect_malformed(
            R"({"sender_id":7,"recipient_id":"laptop","timestamp":1,)"
            R"("nonce":"AA==","ciphertext":"AA=="})");
    }
}

TEST_CASE("EnvelopeWire - Binary encoding", "[protocol][wire]") {
    SECTION("Protobuf bytes decode to the same envelope") {
        auto bytes = EnvelopeWire::ToBinary(sample_envelope());
        REQUIRE(bytes.IsOk());
        auto decoded = EnvelopeWire::FromBinary(bytes.Unwrap());
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap().sender_id() == "phone");
        REQUIRE(decoded.Unwrap().timestamp() == 1'700'000'000);
    }

    SECTION("Garbage bytes are malformed") {
        const std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0xff, 0x0f};
        auto decoded = EnvelopeWire::FromBinary(garbage);
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == RelayFailureType::MalformedMessage);
    }
}
