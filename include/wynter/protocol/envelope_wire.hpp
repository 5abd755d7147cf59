#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/envelope.hpp"
#include <google/protobuf/struct.pb.h>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace wynter::relay::protocol {

/// Relay wire forms of EncryptedEnvelope.
///
/// JSON: exactly sender_id, recipient_id, timestamp (JSON integer), nonce,
/// ciphertext. Decoding is strict; a missing, extra or mistyped field, or a
/// negative or fractional timestamp, is MalformedMessage. Binary: the
/// protobuf encoding, for transports that carry bytes.
class EnvelopeWire {
public:
    static Result<std::string, RelayFailure> ToJson(const EncryptedEnvelope& envelope);
    static Result<EncryptedEnvelope, RelayFailure> FromJson(std::string_view json);

    static google::protobuf::Struct ToStruct(const EncryptedEnvelope& envelope);
    static Result<EncryptedEnvelope, RelayFailure> FromStruct(const google::protobuf::Struct& object);

    static Result<std::vector<uint8_t>, RelayFailure> ToBinary(const EncryptedEnvelope& envelope);
    static Result<EncryptedEnvelope, RelayFailure> FromBinary(std::span<const uint8_t> bytes);

    static constexpr size_t FIELD_COUNT = 5;
    // Largest integer a JSON number (IEEE double) carries exactly.
    static constexpr int64_t MAX_EXACT_TIMESTAMP = (int64_t{1} << 53);

private:
    EnvelopeWire() = delete;
};

/// JSON text <-> google.protobuf.Struct with the library's print/parse
/// options. Shared with the relay frame codec.
namespace json {
    Result<std::string, RelayFailure> Print(const google::protobuf::Struct& object);
    Result<google::protobuf::Struct, RelayFailure> Parse(std::string_view text);
}
}
