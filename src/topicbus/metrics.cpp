#include "metrics.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace topicbus {

void TopicMetrics::record_success(std::chrono::nanoseconds latency) {
    events_processed_.fetch_add(1);

    std::lock_guard<std::mutex> lock(mutex_);
    latency_avg_ = kSmoothing * static_cast<double>(latency.count())
                 + (1.0 - kSmoothing) * latency_avg_;
    stamp_last_processed();
}

void TopicMetrics::record_failure() {
    events_processed_.fetch_add(1);
    errors_.fetch_add(1);

    std::lock_guard<std::mutex> lock(mutex_);
    stamp_last_processed();
}

TopicMetrics::Stats TopicMetrics::get_stats() const {
    Stats stats;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.events_processed = events_processed_.load();
        stats.errors = errors_.load();
        stats.latency_avg = latency_avg_;
        stats.last_processed = last_processed_;
    }

    stats.error_rate = static_cast<double>(stats.errors)
                     / static_cast<double>(std::max<uint64_t>(1, stats.events_processed));
    return stats;
}

void TopicMetrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_processed_.store(0);
    errors_.store(0);
    latency_avg_ = 0.0;
    last_processed_.reset();
}

void TopicMetrics::stamp_last_processed() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    last_processed_ = std::chrono::duration<double>(now).count();
}

namespace metrics_utils {

std::string format_stats(const TopicStats& stats) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << stats.full_id
        << " handlers=" << stats.handler_count
        << " processed=" << stats.stats.events_processed
        << " errors=" << stats.stats.errors
        << " error_rate=" << stats.stats.error_rate
        << " latency_avg=" << format_duration(std::chrono::nanoseconds(static_cast<int64_t>(stats.stats.latency_avg)));
    return oss.str();
}

std::string format_duration(std::chrono::nanoseconds duration) {
    auto ns = duration.count();
    if (ns < 1000) {
        return std::to_string(ns) + "ns";
    } else if (ns < 1000000) {
        return std::to_string(ns / 1000) + "us";
    } else if (ns < 1000000000) {
        return std::to_string(ns / 1000000) + "ms";
    } else {
        return std::to_string(ns / 1000000000) + "s";
    }
}

} // namespace metrics_utils
} // namespace topicbus
