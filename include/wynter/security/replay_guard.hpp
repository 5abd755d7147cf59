#pragma once
#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <unordered_set>
namespace wynter::relay::security {

/// Remembers nonces of accepted envelopes for a bounded time and count.
///
/// Entries older than the retention period are purged on each insert. When
/// the cache is full the oldest entry is evicted first.
class ReplayGuard {
public:
    using Clock = std::chrono::system_clock;

    ReplayGuard(size_t capacity, std::chrono::seconds retention);
    ReplayGuard(const ReplayGuard&) = delete;
    ReplayGuard& operator=(const ReplayGuard&) = delete;
    ReplayGuard(ReplayGuard&&) = delete;
    ReplayGuard& operator=(ReplayGuard&&) = delete;
    ~ReplayGuard() = default;

    /// ReplayDetected if the nonce is already tracked; otherwise records it.
    Result<Unit, RelayFailure> CheckAndRecord(
        std::span<const uint8_t> nonce,
        Clock::time_point now);

    [[nodiscard]] bool Contains(std::span<const uint8_t> nonce) const;
    [[nodiscard]] size_t TrackedCount() const;
    void Reset();

private:
    struct Entry {
        std::string nonce;
        Clock::time_point recorded_at;
    };

    void PurgeExpired(Clock::time_point now);

    size_t capacity_;
    std::chrono::seconds retention_;
    mutable std::mutex lock_;
    std::unordered_set<std::string> seen_;
    std::deque<Entry> order_;
};
}
