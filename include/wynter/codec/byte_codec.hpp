#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace wynter::relay::codec {

/// Standard (RFC 4648, padded, non-URL-safe) base64 and lowercase hex, backed
/// by libsodium's constant-time codecs. Decode failures are MalformedMessage;
/// callers that import keys remap them to InvalidKeyFormat.
class ByteCodec {
public:
    [[nodiscard]] static std::string ToBase64(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure> FromBase64(std::string_view text);

    [[nodiscard]] static std::string ToHex(std::span<const uint8_t> data);

    [[nodiscard]] static Result<std::vector<uint8_t>, RelayFailure> FromHex(std::string_view text);

    /// Exact decoded length of a padded base64 string, or 0 if the length is
    /// not a multiple of four.
    [[nodiscard]] static size_t DecodedBase64Length(std::string_view text) noexcept;

    /// Well-formed UTF-8: no overlong forms, surrogates or code points past
    /// U+10FFFF.
    [[nodiscard]] static bool IsValidUtf8(std::span<const uint8_t> data) noexcept;

private:
    ByteCodec() = delete;
};
}
