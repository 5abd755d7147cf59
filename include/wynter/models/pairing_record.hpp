#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"

#include "relay/envelope.pb.h"

#include <cstdint>
#include <span>
#include <vector>

namespace wynter::relay::models {

using PairingRecord = proto::relay::PairingRecord;

/// Binary form of a PairingRecord for the key-storage collaborator.
/// Parse rejects records with empty ids or a peer key that is not 32 bytes.
class PairingRecordCodec {
public:
    static Result<std::vector<uint8_t>, RelayFailure> Serialize(const PairingRecord& record);
    static Result<PairingRecord, RelayFailure> Parse(std::span<const uint8_t> bytes);
    static Result<Unit, RelayFailure> Validate(const PairingRecord& record);

private:
    PairingRecordCodec() = delete;
};

}  // namespace wynter::relay::models
