#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace topicbus {

/**
 * Thread-safe per-topic collector for handler outcomes and latency.
 *
 * Counts one event per handler invocation (and per denied publish). Latency is
 * an exponential moving average that only successful invocations feed.
 */
class TopicMetrics {
public:
    struct Stats {
        uint64_t events_processed = 0;
        uint64_t errors = 0;
        std::optional<double> last_processed;  // epoch seconds
        double latency_avg = 0.0;              // nanoseconds
        double error_rate = 0.0;
    };

    static constexpr double kSmoothing = 0.2;

    TopicMetrics() = default;

    void record_success(std::chrono::nanoseconds latency);

    void record_failure();

    Stats get_stats() const;

    void reset();

private:
    void stamp_last_processed();

    std::atomic<uint64_t> events_processed_{0};
    std::atomic<uint64_t> errors_{0};

    mutable std::mutex mutex_;
    double latency_avg_{0.0};
    std::optional<double> last_processed_;
};

/// Snapshot returned by Topic::get_metrics().
struct TopicStats {
    std::string full_id;
    size_t handler_count = 0;
    TopicMetrics::Stats stats;
};

/**
 * Utility functions for metrics formatting
 */
namespace metrics_utils {
    std::string format_stats(const TopicStats& stats);
    std::string format_duration(std::chrono::nanoseconds duration);
}

} // namespace topicbus
