#include <catch2/catch_test_macros.hpp>
#include "wynter/crypto/xchacha20_poly1305.hpp"
#include "wynter/crypto/sodium_interop.hpp"
#include "wynter/codec/byte_codec.hpp"
#include "wynter/protocol/constants.hpp"
#include <numeric>
#include <string>
#include <vector>

using namespace wynter::relay;
using namespace wynter::relay::crypto;
using wynter::relay::codec::ByteCodec;

namespace {
std::vector<uint8_t> iota_bytes(const size_t count, const uint8_t start) {
    std::vector<uint8_t> out(count);
    std::iota(out.begin(), out.end(), start);
    return out;
}

std::vector<uint8_t> text_bytes(const std::string& text) {
    return {text.begin(), text.end()};
}
}

TEST_CASE("XChaCha20Poly1305 - Reference vector", "[crypto][aead]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    // draft-irtf-cfrg-xchacha-03 appendix A.3.1
    const auto key = iota_bytes(32, 0x80);
    const auto nonce = iota_bytes(24, 0x40);
    const auto ad = ByteCodec::FromHex("50515253c0c1c2c3c4c5c6c7").Unwrap();
    const auto plaintext = text_bytes(
        "Ladies and Gentlemen of the class of '99: If I could offer you only one tip "
        "for the future, sunscreen would be it.");
    const std::string expected =
        "bd6d179d3e83d43b9576579493c0e939572a1700252bfaccbed2902c21396cbb"
        "731c7f1b0b4aa6440bf3a82f4eda7e39ae64c6708c54c216cb96b72e1213b452"
        "2f8c9ba40db5d945b11b69b982c1bb9e3f3fac2bc369488f76b2383565d3fff9"
        "21f9664c97637da9768812f615c68b13b52e"
        "c0875924c1c7987947deafd8780acf49";

    auto sealed = XChaCha20Poly1305::Encrypt(key, nonce, plaintext, ad);
    REQUIRE(sealed.IsOk());
    REQUIRE(ByteCodec::ToHex(sealed.Unwrap()) == expected);

    auto opened = XChaCha20Poly1305::Decrypt(key, nonce, sealed.Unwrap(), ad);
    REQUIRE(opened.IsOk());
    REQUIRE(opened.Unwrap() == plaintext);
}

TEST_CASE("XChaCha20Poly1305 - Random nonce encryption", "[crypto][aead]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kXChaChaKeyBytes, 0x11);
    const auto plaintext = text_bytes("{\"type\":\"ping\"}");

    SECTION("Ciphertext carries a 16 byte tag") {
        auto sealed = XChaCha20Poly1305::Encrypt(key, plaintext);
        REQUIRE(sealed.IsOk());
        REQUIRE(sealed.Unwrap().ciphertext.size() == plaintext.size() + kPoly1305TagBytes);
    }

    SECTION("Fresh nonce per call") {
        auto first = XChaCha20Poly1305::Encrypt(key, plaintext).Unwrap();
        auto second = XChaCha20Poly1305::Encrypt(key, plaintext).Unwrap();
        REQUIRE(first.nonce != second.nonce);
        REQUIRE(first.ciphertext != second.ciphertext);
    }

    SECTION("Empty plaintext round trips") {
        auto sealed = XChaCha20Poly1305::Encrypt(key, std::vector<uint8_t>{}).Unwrap();
        REQUIRE(sealed.ciphertext.size() == kPoly1305TagBytes);
        auto opened = XChaCha20Poly1305::Decrypt(key, sealed.nonce, sealed.ciphertext);
        REQUIRE(opened.IsOk());
        REQUIRE(opened.Unwrap().empty());
    }
}

TEST_CASE("XChaCha20Poly1305 - Rejections", "[crypto][aead]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> key(kXChaChaKeyBytes, 0x22);
    const auto plaintext = text_bytes("payload");
    auto sealed = XChaCha20Poly1305::Encrypt(key, plaintext).Unwrap();

    SECTION("Wrong key") {
        const std::vector<uint8_t> other(kXChaChaKeyBytes, 0x23);
        auto result = XChaCha20Poly1305::Decrypt(other, sealed.nonce, sealed.ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
    }

    SECTION("Associated data mismatch") {
        const std::vector<uint8_t> ad = {0x01};
        auto result = XChaCha20Poly1305::Decrypt(key, sealed.nonce, sealed.ciphertext, ad);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
    }

    SECTION("Ciphertext shorter than the tag") {
        const std::vector<uint8_t> truncated(sealed.ciphertext.begin(), sealed.ciphertext.begin() + 15);
        auto result = XChaCha20Poly1305::Decrypt(key, sealed.nonce, truncated);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
    }

    SECTION("Nonce of the wrong length fails authentication") {
        const std::vector<uint8_t> short_nonce(12, 0x00);
        auto result = XChaCha20Poly1305::Decrypt(key, short_nonce, sealed.ciphertext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::AuthenticationFailed);
    }

    SECTION("Encrypting with a short key is invalid input") {
        const std::vector<uint8_t> short_key(16, 0x01);
        auto result = XChaCha20Poly1305::Encrypt(short_key, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
    }

    SECTION("Encrypting with a short nonce is invalid input") {
        const std::vector<uint8_t> short_nonce(12, 0x00);
        auto result = XChaCha20Poly1305::Encrypt(key, short_nonce, plaintext);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == RelayFailureType::InvalidInput);
    }
}
