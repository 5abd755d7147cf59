#pragma once
#include "wynter/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <string>
namespace wynter::relay {
enum class ChannelState : uint8_t {
    Unpaired = 0,
    Active = 1
};
class IChannelEventHandler {
public:
    virtual ~IChannelEventHandler() = default;
    virtual void OnStateChanged(ChannelState state) = 0;
    /// Dropped inbound envelope. Carries routing ids only, never contents.
    virtual void OnEnvelopeRejected(RelayFailureType reason, const std::string& sender_id) = 0;
    virtual void OnPeerStatus(bool online, uint32_t pending_count) = 0;
    virtual void OnHandshakeResult(bool success, const std::optional<std::string>& error) = 0;
};
}
