#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include <string_view>
namespace wynter::relay {
class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;
    /// Hand one encoded relay frame to the connection. Return a Transport
    /// failure if the frame could not be queued.
    virtual Result<Unit, RelayFailure> Deliver(std::string_view frame_json) = 0;
};
}
