#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/codec/byte_codec.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace wynter::relay::protocol {

/**
 * @brief Plaintext encoding for envelope payloads
 *
 * Specialise for a payload type to make it usable with EncryptMessage /
 * DecryptMessage. Encode produces the bytes that get encrypted; Decode gets
 * the authenticated plaintext and must reject anything it cannot parse with
 * MalformedMessage.
 *
 * Provided:
 * - any protobuf message, as compact UTF-8 JSON (proto field names). Use
 *   google::protobuf::Value or Struct for free-form JSON.
 * - std::vector<uint8_t>, passed through untouched.
 */
template<typename T, typename Enable = void>
struct PayloadCodec;

template<typename T>
struct PayloadCodec<T, std::enable_if_t<std::is_base_of_v<google::protobuf::Message, T>>> {
    static Result<std::vector<uint8_t>, RelayFailure> Encode(const T& message) {
        google::protobuf::util::JsonPrintOptions options;
        options.preserve_proto_field_names = true;

        std::string json;
        const auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
        if (!status.ok()) {
            return Result<std::vector<uint8_t>, RelayFailure>::Err(
                RelayFailure::Encode(
                    std::format("Failed to serialize payload: {}", status.ToString())));
        }
        return Result<std::vector<uint8_t>, RelayFailure>::Ok(
            std::vector<uint8_t>(json.begin(), json.end()));
    }

    static Result<T, RelayFailure> Decode(std::span<const uint8_t> bytes) {
        if (!codec::ByteCodec::IsValidUtf8(bytes)) {
            return Result<T, RelayFailure>::Err(
                RelayFailure::MalformedMessage("Payload is not valid UTF-8"));
        }

        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = false;

        T message;
        const std::string json(bytes.begin(), bytes.end());
        const auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
        if (!status.ok()) {
            return Result<T, RelayFailure>::Err(
                RelayFailure::MalformedMessage(
                    std::format("Payload is not valid JSON for {}: {}",
                        T::descriptor()->full_name(), status.ToString())));
        }
        return Result<T, RelayFailure>::Ok(std::move(message));
    }
};

template<>
struct PayloadCodec<std::vector<uint8_t>> {
    static Result<std::vector<uint8_t>, RelayFailure> Encode(const std::vector<uint8_t>& bytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Ok(bytes);
    }

    static Result<std::vector<uint8_t>, RelayFailure> Decode(std::span<const uint8_t> bytes) {
        return Result<std::vector<uint8_t>, RelayFailure>::Ok(
            std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }
};

}  // namespace wynter::relay::protocol
