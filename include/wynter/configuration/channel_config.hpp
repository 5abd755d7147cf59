#pragma once

#include "wynter/core/result.hpp"
#include "wynter/core/failures.hpp"
#include "wynter/protocol/constants.hpp"

#include <chrono>
#include <cstddef>
#include <format>

namespace wynter::relay::configuration {

/// Receive-side policy for a RelayChannel
///
/// Immutable value type. Start from a preset and adjust with the With...
/// builders, each of which returns a modified copy.
///
/// @example
/// ```cpp
/// // Phone with an unreliable clock
/// auto config = ChannelConfig::Lenient();
///
/// // Default window, larger replay cache for a busy desktop
/// auto config = ChannelConfig::Default().WithReplayCacheCapacity(16384);
/// ```
class ChannelConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// 5 minute freshness window, replay cache of 4096 nonces.
    [[nodiscard]] static constexpr ChannelConfig Default() noexcept {
        return ChannelConfig(kDefaultMaxClockSkew, true, kDefaultReplayCacheCapacity);
    }

    /// 1 minute window, for devices with network time.
    [[nodiscard]] static constexpr ChannelConfig Strict() noexcept {
        return ChannelConfig(kStrictMaxClockSkew, true, kDefaultReplayCacheCapacity);
    }

    /// 15 minute window, for devices whose clocks drift.
    [[nodiscard]] static constexpr ChannelConfig Lenient() noexcept {
        return ChannelConfig(kLenientMaxClockSkew, true, kDefaultReplayCacheCapacity);
    }

    // =========================================================================
    // Builders
    // =========================================================================

    [[nodiscard]] constexpr ChannelConfig WithMaxClockSkew(const std::chrono::seconds skew) const noexcept {
        return ChannelConfig(skew, replay_protection_, replay_cache_capacity_);
    }

    [[nodiscard]] constexpr ChannelConfig WithReplayProtection(const bool enabled) const noexcept {
        return ChannelConfig(max_clock_skew_, enabled, replay_cache_capacity_);
    }

    [[nodiscard]] constexpr ChannelConfig WithReplayCacheCapacity(const size_t capacity) const noexcept {
        return ChannelConfig(max_clock_skew_, replay_protection_, capacity);
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// Largest accepted |envelope timestamp - local time|.
    [[nodiscard]] constexpr std::chrono::seconds MaxClockSkew() const noexcept {
        return max_clock_skew_;
    }

    [[nodiscard]] constexpr bool IsReplayProtectionEnabled() const noexcept {
        return replay_protection_;
    }

    [[nodiscard]] constexpr size_t ReplayCacheCapacity() const noexcept {
        return replay_cache_capacity_;
    }

    /// How long an accepted nonce must be remembered. A replayed envelope
    /// carries the original timestamp, so it goes stale at most two windows
    /// after first acceptance.
    [[nodiscard]] constexpr std::chrono::seconds NonceRetention() const noexcept {
        return max_clock_skew_ * 2;
    }

    [[nodiscard]] Result<Unit, RelayFailure> Validate() const {
        if (max_clock_skew_ <= std::chrono::seconds::zero() ||
            max_clock_skew_ > kMaxConfigurableClockSkew) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput(
                    std::format("Max clock skew must be in (0, {}] seconds, got {}",
                        kMaxConfigurableClockSkew.count(), max_clock_skew_.count())));
        }
        if (replay_cache_capacity_ == 0) {
            return Result<Unit, RelayFailure>::Err(
                RelayFailure::InvalidInput("Replay cache capacity must be non-zero"));
        }
        return Result<Unit, RelayFailure>::Ok(unit);
    }

    [[nodiscard]] constexpr bool operator==(const ChannelConfig& other) const noexcept {
        return max_clock_skew_ == other.max_clock_skew_ &&
               replay_protection_ == other.replay_protection_ &&
               replay_cache_capacity_ == other.replay_cache_capacity_;
    }

    [[nodiscard]] constexpr bool operator!=(const ChannelConfig& other) const noexcept {
        return !(*this == other);
    }

private:
    constexpr ChannelConfig(
        const std::chrono::seconds max_clock_skew,
        const bool replay_protection,
        const size_t replay_cache_capacity) noexcept
        : max_clock_skew_(max_clock_skew)
        , replay_protection_(replay_protection)
        , replay_cache_capacity_(replay_cache_capacity) {}

    std::chrono::seconds max_clock_skew_;
    bool replay_protection_;
    size_t replay_cache_capacity_;
};

}  // namespace wynter::relay::configuration
