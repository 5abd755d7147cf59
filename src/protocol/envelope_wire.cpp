#include "wynter/protocol/envelope_wire.hpp"
#include <google/protobuf/util/json_util.h>
#include <array>
#include <cmath>
#include <format>

namespace wynter::relay::protocol {

namespace json {
    Result<std::string, RelayFailure> Print(const google::protobuf::Struct& object) {
        std::string out;
        const auto status = google::protobuf::util::MessageToJsonString(object, &out);
        if (!status.ok()) {
            return Result<std::string, RelayFailure>::Err(
                RelayFailure::Encode(std::format("Failed to print JSON: {}", status.ToString())));
        }
        return Result<std::string, RelayFailure>::Ok(std::move(out));
    }
    Result<google::protobuf::Struct, RelayFailure> Parse(const std::string_view text) {
        google::protobuf::Struct object;
        const std::string input(text);
        const auto status = google::protobuf::util::JsonStringToMessage(input, &object);
        if (!status.ok()) {
            return Result<google::protobuf::Struct, RelayFailure>::Err(
                RelayFailure::MalformedMessage(
                    std::format("Not a JSON object: {}", status.ToString())));
        }
        return Result<google::protobuf::Struct, RelayFailure>::Ok(std::move(object));
    }
}

namespace {
    using google::protobuf::Struct;
    using google::protobuf::Value;

    Value StringValue(const std::string& text) {
        Value value;
        value.set_string_value(text);
        return value;
    }

    Result<std::string, RelayFailure> RequireString(const Struct& object, const std::string& field) {
        const auto it = object.fields().find(field);
        if (it == object.fields().end()) {
            return Result<std::string, RelayFailure>::Err(
                RelayFailure::MalformedMessage(std::format("Envelope is missing '{}'", field)));
        }
        if (it->second.kind_case() != Value::kStringValue) {
            return Result<std::string, RelayFailure>::Err(
                RelayFailure::MalformedMessage(std::format("Envelope field '{}' must be a string", field)));
        }
        return Result<std::string, RelayFailure>::Ok(it->second.string_value());
    }

    Result<int64_t, RelayFailure> RequireTimestamp(const Struct& object) {
        const auto it = object.fields().find("timestamp");
        if (it == object.fields().end()) {
            return Result<int64_t, RelayFailure>::Err(
                RelayFailure::MalformedMessage("Envelope is missing 'timestamp'"));
        }
        if (it->second.kind_case() != Value::kNumberValue) {
            return Result<int64_t, RelayFailure>::Err(
                RelayFailure::MalformedMessage("Envelope field 'timestamp' must be a number"));
        }
        const double raw = it->second.number_value();
        if (!std::isfinite(raw) || std::trunc(raw) != raw || raw < 0.0 ||
            raw > static_cast<double>(EnvelopeWire::MAX_EXACT_TIMESTAMP)) {
            return Result<int64_t, RelayFailure>::Err(
                RelayFailure::MalformedMessage(
                    "Envelope timestamp must be a non-negative integer"));
        }
        return Result<int64_t, RelayFailure>::Ok(static_cast<int64_t>(raw));
    }
}

Struct EnvelopeWire::ToStruct(const EncryptedEnvelope& envelope) {
    Struct object;
    auto& fields = *object.mutable_fields();
    fields["sender_id"] = StringValue(envelope.sender_id());
    fields["recipient_id"] = StringValue(envelope.recipient_id());
    fields["timestamp"].set_number_value(static_cast<double>(envelope.timestamp()));
    fields["nonce"] = StringValue(envelope.nonce());
    fields["ciphertext"] = StringValue(envelope.ciphertext());
    return object;
}

Result<EncryptedEnvelope, RelayFailure> EnvelopeWire::FromStruct(const Struct& object) {
    if (object.fields().size() != FIELD_COUNT) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(
            RelayFailure::MalformedMessage(
                std::format("Envelope must have exactly {} fields, got {}",
                    FIELD_COUNT, object.fields().size())));
    }

    EncryptedEnvelope envelope;
    auto sender = RequireString(object, "sender_id");
    if (sender.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(sender).UnwrapErr());
    }
    auto recipient = RequireString(object, "recipient_id");
    if (recipient.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(recipient).UnwrapErr());
    }
    auto timestamp = RequireTimestamp(object);
    if (timestamp.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(timestamp).UnwrapErr());
    }
    auto nonce = RequireString(object, "nonce");
    if (nonce.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(nonce).UnwrapErr());
    }
    auto ciphertext = RequireString(object, "ciphertext");
    if (ciphertext.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(ciphertext).UnwrapErr());
    }

    envelope.set_sender_id(std::move(sender).Unwrap());
    envelope.set_recipient_id(std::move(recipient).Unwrap());
    envelope.set_timestamp(timestamp.Unwrap());
    envelope.set_nonce(std::move(nonce).Unwrap());
    envelope.set_ciphertext(std::move(ciphertext).Unwrap());
    return Result<EncryptedEnvelope, RelayFailure>::Ok(std::move(envelope));
}

Result<std::string, RelayFailure> EnvelopeWire::ToJson(const EncryptedEnvelope& envelope) {
    if (envelope.timestamp() < 0 || envelope.timestamp() > MAX_EXACT_TIMESTAMP) {
        return Result<std::string, RelayFailure>::Err(
            RelayFailure::Encode(
                std::format("Timestamp {} cannot be carried as a JSON integer", envelope.timestamp())));
    }
    return json::Print(ToStruct(envelope));
}

Result<EncryptedEnvelope, RelayFailure> EnvelopeWire::FromJson(const std::string_view text) {
    auto parsed = json::Parse(text);
    if (parsed.IsErr()) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(std::move(parsed).UnwrapErr());
    }
    return FromStruct(parsed.Unwrap());
}

Result<std::vector<uint8_t>, RelayFailure> EnvelopeWire::ToBinary(const EncryptedEnvelope& envelope) {
    std::vector<uint8_t> bytes(envelope.ByteSizeLong());
    if (!envelope.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::Encode("Failed to serialize envelope"));
    }
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(bytes));
}

Result<EncryptedEnvelope, RelayFailure> EnvelopeWire::FromBinary(std::span<const uint8_t> bytes) {
    EncryptedEnvelope envelope;
    if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Failed to parse binary envelope"));
    }
    if (envelope.timestamp() < 0) {
        return Result<EncryptedEnvelope, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Envelope timestamp must be non-negative"));
    }
    return Result<EncryptedEnvelope, RelayFailure>::Ok(std::move(envelope));
}
}
