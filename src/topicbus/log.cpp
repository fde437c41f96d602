#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace topicbus {

namespace {

constexpr const char* kLoggerName = "topicbus";

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger> create_logger(const LogConfig& config) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern(config.pattern);

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_level(config.level);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> get_logger() {
    std::lock_guard<std::mutex> lock(logger_mutex());

    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = create_logger(LogConfig{});
    }
    return logger;
}

void configure_logging(const LogConfig& config) {
    auto logger = get_logger();
    logger->set_level(config.level);
    logger->set_pattern(config.pattern);
}

} // namespace topicbus
