#include "wynter/models/pairing_record.hpp"
#include "wynter/protocol/constants.hpp"

#include <format>

namespace wynter::relay::models {

Result<Unit, RelayFailure> PairingRecordCodec::Validate(const PairingRecord& record) {
    if (record.local_device_id().empty() || record.peer_device_id().empty()) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Pairing record is missing a device id"));
    }
    if (record.peer_public_key().size() != kX25519PublicKeyBytes) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::InvalidKeyFormat(
                std::format("Pairing record peer key must be {} bytes, got {}",
                    kX25519PublicKeyBytes, record.peer_public_key().size())));
    }
    if (record.paired_at_unix() < 0) {
        return Result<Unit, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Pairing record timestamp must be non-negative"));
    }
    return Result<Unit, RelayFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, RelayFailure> PairingRecordCodec::Serialize(const PairingRecord& record) {
    if (auto valid = Validate(record); valid.IsErr()) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::Encode(valid.UnwrapErr().message));
    }
    std::vector<uint8_t> bytes(record.ByteSizeLong());
    if (!record.SerializeToArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<std::vector<uint8_t>, RelayFailure>::Err(
            RelayFailure::Encode("Failed to serialize pairing record"));
    }
    return Result<std::vector<uint8_t>, RelayFailure>::Ok(std::move(bytes));
}

Result<PairingRecord, RelayFailure> PairingRecordCodec::Parse(std::span<const uint8_t> bytes) {
    PairingRecord record;
    if (!record.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<PairingRecord, RelayFailure>::Err(
            RelayFailure::MalformedMessage("Failed to parse pairing record"));
    }
    if (auto valid = Validate(record); valid.IsErr()) {
        return Result<PairingRecord, RelayFailure>::Err(std::move(valid).UnwrapErr());
    }
    return Result<PairingRecord, RelayFailure>::Ok(std::move(record));
}

}  // namespace wynter::relay::models
