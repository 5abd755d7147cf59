#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace wynter::relay::logging {

inline constexpr std::string_view kLoggerName = "wynter.relay";

/**
 * @brief Shared library logger
 *
 * Created on first use with a stderr color sink. If the host application has
 * already registered a logger under kLoggerName, that one is reused so the
 * host controls sinks and formatting.
 *
 * Never pass key material, nonces or plaintext to this logger.
 */
std::shared_ptr<spdlog::logger> Logger();

void SetLevel(spdlog::level::level_enum level);

}  // namespace wynter::relay::logging
