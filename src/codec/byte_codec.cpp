#include "wynter/codec/byte_codec.hpp"
#include <sodium.h>
#include <format>
namespace wynter::relay::codec {
std::string ByteCodec::ToBase64(std::span<const uint8_t> data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    // encoded_len counts the terminating NUL.
    out.resize(encoded_len - 1);
    return out;
}
size_t ByteCodec::DecodedBase64Length(std::string_view text) noexcept {
    if (text.empty() || text.size() % 4 != 0) {
        return 0;
    }
    size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    return text.size() / 4 * 3 - padding;
}
Result<std::vector<uint8_t>, RelayFailure> ByteCodec::FromBase64(std::string_view text) {
    if (text.empty()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Ok({});
    }
    if (text.size() % 4 != 0) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Base64 length {} is not a multiple of 4", text.size())));
    }
    std::vector<uint8_t> out(text.size() / 4 * 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    const int rc = sodium_base642bin(out.data(), out.size(),
                                     text.data(), text.size(),
                                     nullptr, &bin_len, &end,
                                     sodium_base64_VARIANT_ORIGINAL);
    if (rc != 0 || end != text.data() + text.size()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Invalid base64 input"));
    }
    out.resize(bin_len);
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(out));
}
std::string ByteCodec::ToHex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.resize(data.size() * 2);
    return out;
}
Result<std::vector<uint8_t>, RelayFailure> ByteCodec::FromHex(std::string_view text) {
    if (text.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Hex length {} is odd", text.size())));
    }
    std::vector<uint8_t> out(text.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    const int rc = sodium_hex2bin(out.data(), out.size(),
                                  text.data(), text.size(),
                                  nullptr, &bin_len, &end);
    if (rc != 0 || end != text.data() + text.size() || bin_len != out.size()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Invalid hex input"));
    }
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(out));
}
bool ByteCodec::IsValidUtf8(std::span<const uint8_t> data) noexcept {
    size_t i = 0;
    while (i < data.size()) {
        const uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        size_t extra = 0;
        uint32_t code_point = 0;
        uint32_t min_code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
            min_code_point = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
            min_code_point = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
            min_code_point = 0x10000;
        } else {
            return false;
        }
        if (data.size() - i <= extra) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }
        if (code_point < min_code_point || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}
}
