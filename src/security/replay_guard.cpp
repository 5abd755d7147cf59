#include "wynter/security/replay_guard.hpp"

namespace wynter::relay::security {
    namespace {
        std::string ToKey(std::span<const uint8_t> nonce) {
            return std::string(reinterpret_cast<const char*>(nonce.data()), nonce.size());
        }
    }

    ReplayGuard::ReplayGuard(const size_t capacity, const std::chrono::seconds retention)
        : capacity_(capacity)
          , retention_(retention) {
    }

    Result<Unit, RelayFailure> ReplayGuard::CheckAndRecord(
        std::span<const uint8_t> nonce,
        const Clock::time_point now) {
        std::lock_guard guard(lock_);
        PurgeExpired(now);
        std::string key = ToKey(nonce);
        if (seen_.contains(key)) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::ReplayDetected("Nonce already accepted"));
        }
        while (capacity_ > 0 && order_.size() >= capacity_) {
            seen_.erase(order_.front().nonce);
            order_.pop_front();
        }
        seen_.insert(key);
        order_.push_back(Entry{std::move(key), now});
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    void ReplayGuard::PurgeExpired(const Clock::time_point now) {
        // Entries arrive in insertion order; a clock stepping backwards only
        // delays their expiry.
        while (!order_.empty() && now - order_.front().recorded_at > retention_) {
            seen_.erase(order_.front().nonce);
            order_.pop_front();
        }
    }

    bool ReplayGuard::Contains(std::span<const uint8_t> nonce) const {
        std::lock_guard guard(lock_);
        return seen_.contains(ToKey(nonce));
    }

    size_t ReplayGuard::TrackedCount() const {
        std::lock_guard guard(lock_);
        return seen_.size();
    }

    void ReplayGuard::Reset() {
        std::lock_guard guard(lock_);
        seen_.clear();
        order_.clear();
    }
}
