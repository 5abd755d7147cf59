#include "wynter/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace wynter::relay::logging {

std::shared_ptr<spdlog::logger> Logger() {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(init_flag, [] {
        const std::string name(kLoggerName);
        logger = spdlog::get(name);
        if (!logger) {
            logger = spdlog::stderr_color_mt(name);
            logger->set_level(spdlog::level::info);
        }
    });
    return logger;
}

void SetLevel(const spdlog::level::level_enum level) {
    Logger()->set_level(level);
}

}  // namespace wynter::relay::logging
