#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace topicbus {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
};

/**
 * Shared "topicbus" logger, created on first use with a colored stdout sink.
 */
std::shared_ptr<spdlog::logger> get_logger();

void configure_logging(const LogConfig& config);

} // namespace topicbus
