#include <catch2/catch.hpp>
#include "metrics.hpp"
#include <thread>
#include <vector>

using namespace topicbus;
using namespace std::chrono_literals;

TEST_CASE("TopicMetrics: starts empty", "[metrics]") {
    TopicMetrics metrics;
    auto stats = metrics.get_stats();

    REQUIRE(stats.events_processed == 0);
    REQUIRE(stats.errors == 0);
    REQUIRE(stats.latency_avg == 0.0);
    REQUIRE(stats.error_rate == 0.0);
    REQUIRE_FALSE(stats.last_processed.has_value());
}

TEST_CASE("TopicMetrics: latency is an exponential moving average", "[metrics]") {
    TopicMetrics metrics;

    metrics.record_success(1000ns);
    REQUIRE(metrics.get_stats().latency_avg == Approx(200.0));

    metrics.record_success(1000ns);
    REQUIRE(metrics.get_stats().latency_avg == Approx(0.2 * 1000.0 + 0.8 * 200.0));
}

TEST_CASE("TopicMetrics: failures do not move the latency average", "[metrics]") {
    TopicMetrics metrics;
    metrics.record_success(500ns);
    double before = metrics.get_stats().latency_avg;

    metrics.record_failure();

    auto stats = metrics.get_stats();
    REQUIRE(stats.latency_avg == before);
    REQUIRE(stats.events_processed == 2);
    REQUIRE(stats.errors == 1);
    REQUIRE(stats.error_rate == Approx(0.5));
    REQUIRE(stats.last_processed.has_value());
}

TEST_CASE("TopicMetrics: reset clears everything", "[metrics]") {
    TopicMetrics metrics;
    metrics.record_success(10ns);
    metrics.record_failure();

    metrics.reset();

    auto stats = metrics.get_stats();
    REQUIRE(stats.events_processed == 0);
    REQUIRE(stats.errors == 0);
    REQUIRE(stats.latency_avg == 0.0);
    REQUIRE_FALSE(stats.last_processed.has_value());
}

TEST_CASE("TopicMetrics: concurrent recording keeps exact counts", "[metrics]") {
    TopicMetrics metrics;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&metrics]() {
            for (int i = 0; i < 1000; ++i) {
                if (i % 10 == 0) {
                    metrics.record_failure();
                } else {
                    metrics.record_success(100ns);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = metrics.get_stats();
    REQUIRE(stats.events_processed == 4000);
    REQUIRE(stats.errors == 400);
}

TEST_CASE("metrics_utils: format_duration picks a unit", "[metrics]") {
    REQUIRE(metrics_utils::format_duration(999ns) == "999ns");
    REQUIRE(metrics_utils::format_duration(1500ns) == "1us");
    REQUIRE(metrics_utils::format_duration(2ms) == "2ms");
    REQUIRE(metrics_utils::format_duration(3s) == "3s");
}

TEST_CASE("metrics_utils: format_stats includes id and counters", "[metrics]") {
    TopicStats stats;
    stats.full_id = "filters@1.0.0";
    stats.handler_count = 2;
    stats.stats.events_processed = 10;
    stats.stats.errors = 1;

    auto text = metrics_utils::format_stats(stats);

    REQUIRE(text.find("filters@1.0.0") != std::string::npos);
    REQUIRE(text.find("handlers=2") != std::string::npos);
    REQUIRE(text.find("processed=10") != std::string::npos);
    REQUIRE(text.find("errors=1") != std::string::npos);
}
