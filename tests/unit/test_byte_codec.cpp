#include <catch2/catch_test_macros.hpp>
#include "wynter/codec/byte_codec.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include <string>
#include <vector>
using namespace wynter::relay;
using namespace wynter::relay::codec;
using namespace wynter::relay::crypto;
namespace {
std::vector<uint8_t> bytes_of(const std::string& text) {
    return {text.begin(), text.end()};
}
}
TEST_CASE("ByteCodec - Base64", "[codec][base64]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("RFC 4648 vectors") {
        REQUIRE(ByteCodec::ToBase64(bytes_of("")).empty());
        REQUIRE(ByteCodec::ToBase64(bytes_of("f")) == "Zg==");
        REQUIRE(ByteCodec::ToBase64(bytes_of("fo")) == "Zm8=");
        REQUIRE(ByteCodec::ToBase64(bytes_of("foo")) == "Zm9v");
        REQUIRE(ByteCodec::ToBase64(bytes_of("foobar")) == "Zm9vYmFy");
    }
    SECTION("Decodes padded input") {
        auto decoded = ByteCodec::FromBase64("Zm9vYg==");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == bytes_of("foob"));
    }
    SECTION("Uses the standard alphabet") {
        const std::vector<uint8_t> data = {0xFB, 0xFF};
        REQUIRE(ByteCodec::ToBase64(data) == "+/8=");
    }
    SECTION("Rejects URL-safe alphabet") {
        auto decoded = ByteCodec::FromBase64("-_8=");
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == RelayFailureType::MalformedMessage);
    }
    SECTION("Rejects missing padding") {
        REQUIRE(ByteCodec::FromBase64("Zm9vYg").IsErr());
    }
    SECTION("Rejects characters outside the alphabet") {
        REQUIRE(ByteCodec::FromBase64("Zm9v!mFy").IsErr());
    }
    SECTION("Decoded length is computed from padding") {
        REQUIRE(ByteCodec::DecodedBase64Length("Zm9vYg==") == 4);
        REQUIRE(ByteCodec::DecodedBase64Length("Zm9vYmE=") == 5);
        REQUIRE(ByteCodec::DecodedBase64Length("Zm9vYmFy") == 6);
    }
}
TEST_CASE("ByteCodec - Hex", "[codec][hex]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Lowercase encoding") {
        const std::vector<uint8_t> data = {0x00, 0xAB, 0xFF};
        REQUIRE(ByteCodec::ToHex(data) == "00abff");
    }
    SECTION("Decoding accepts both cases") {
        REQUIRE(ByteCodec::FromHex("00ABff").Unwrap() == std::vector<uint8_t>{0x00, 0xAB, 0xFF});
    }
    SECTION("Odd length is rejected") {
        REQUIRE(ByteCodec::FromHex("abc").IsErr());
    }
}
TEST_CASE("ByteCodec - UTF-8 validation", "[codec][utf8]") {
    SECTION("ASCII and multibyte text are valid") {
        REQUIRE(ByteCodec::IsValidUtf8(bytes_of("{\"type\":\"ping\"}")));
        REQUIRE(ByteCodec::IsValidUtf8(bytes_of("caf\xC3\xA9 \xF0\x9F\x94\x92")));
    }
    SECTION("Truncated sequence is invalid") {
        REQUIRE_FALSE(ByteCodec::IsValidUtf8(bytes_of("\xC3")));
    }
    SECTION("Overlong encoding is invalid") {
        REQUIRE_FALSE(ByteCodec::IsValidUtf8(bytes_of("\xC0\xAF")));
    }
    SECTION("Surrogate code point is invalid") {
        REQUIRE_FALSE(ByteCodec::IsValidUtf8(bytes_of("\xED\xA0\x80")));
    }
    SECTION("Code point above U+10FFFF is invalid") {
        REQUIRE_FALSE(ByteCodec::IsValidUtf8(bytes_of("\xF4\x90\x80\x80")));
    }
}
