#include "topicbus/broker.hpp"
#include "topicbus/errors.hpp"
#include "topicbus/event.hpp"
#include "topicbus/log.hpp"
#include "topicbus/metrics.hpp"
#include <any>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace topicbus;

// Stands in for a widget callback: a month filter that publishes selections.
void producer_thread(Broker& bus, int tid, int msg_count) {
    for (int i = 0; i < msg_count; ++i) {
        Message msg("month_filter_" + std::to_string(tid), i, "validate_selection");
        msg.message_type = "months_changed";
        try {
            bus.publish("filters", msg);
        } catch (const TopicProcessingError& e) {
            std::cerr << "Producer " << tid << " stopped: " << e.what() << std::endl;
            return;
        }
    }
}

int main(int argc, char* argv[]) {
    int num_producers = 4;
    int messages_per_producer = 1000;
    int num_workers = 4;
    ErrorStrategy strategy = ErrorStrategy::Warn;
    bool debug = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--debug") {
            debug = true;
        }
        else if (arg == "--producers" && i + 1 < argc) {
            num_producers = std::atoi(argv[++i]);
        }
        else if (arg == "--messages" && i + 1 < argc) {
            messages_per_producer = std::atoi(argv[++i]);
        }
        else if (arg == "--workers" && i + 1 < argc) {
            num_workers = std::atoi(argv[++i]);
        }
        else if (arg == "--strategy" && i + 1 < argc) {
            try {
                strategy = parse_error_strategy(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Error: " << e.what() << std::endl;
                return 1;
            }
        }
    }

    std::cout << "Starting topic bus demo:" << std::endl;
    std::cout << "  Producers: " << num_producers << std::endl;
    std::cout << "  Messages per producer: " << messages_per_producer << std::endl;
    std::cout << "  Worker threads: " << num_workers << std::endl;
    std::cout << "  Error strategy: " << to_string(strategy) << std::endl;
    std::cout << std::endl;

    LogConfig log_config;
    log_config.level = debug ? spdlog::level::debug : spdlog::level::info;
    configure_logging(log_config);

    try {
        BrokerConfig config;
        config.name = "dashboard_broker";
        config.worker_threads = num_workers;
        config.debug = debug;

        std::atomic<int> custom_failures{0};
        std::atomic<int> notified{0};
        std::atomic<int> audited{0};

        Broker bus(config);

        TopicConfig filters_config;
        filters_config.id = "filters";
        filters_config.error_strategy = strategy;
        filters_config.error_handler = [&custom_failures](std::exception_ptr, const std::any&) {
            custom_failures.fetch_add(1);
        };
        filters_config.blacklist = {"month_filter_3"};
        filters_config.max_dead_letters = 50;
        filters_config.debug = debug;
        auto filters = bus.create_topic(filters_config);

        TopicConfig notifications_config;
        notifications_config.id = "notifications";
        notifications_config.error_strategy = ErrorStrategy::Warn;
        notifications_config.whitelist = {"notifications@1.0.0.show_toast"};
        auto notifications = bus.create_topic(notifications_config);

        notifications->register_handler("show_toast", [&notified](const std::any&) {
            notified.fetch_add(1);
        });
        auto show_toast = notifications->sender_for("show_toast");

        RegisterOptions validate_options;
        validate_options.aliases = {"validate"};
        validate_options.priority = 100;
        validate_options.transactional = true;

        // every seventh selection is rejected by validation
        filters->register_handler("validate_selection", [&show_toast](const std::any& data) {
            int value = std::any_cast<int>(data);
            if (value % 7 == 0) {
                throw std::runtime_error("selection " + std::to_string(value) + " is out of range");
            }
            if (value % 100 == 0) {
                show_toast(value);
            }
        }, validate_options);

        RegisterOptions audit_options;
        audit_options.priority = 1;
        audit_options.generic = true;
        audit_options.async = true;
        filters->register_handler("audit_log", [&audited](const std::any&) {
            audited.fetch_add(1);
        }, audit_options);

        auto& refresh = filters->add_event("refresh", EventOptions{10, std::string("reload"), false});
        refresh.handler("reload_chart", [](const std::any&) {});

        std::cout << "Bus ready. Starting producer threads..." << std::endl;

        std::vector<std::thread> producers;
        auto start_time = std::chrono::steady_clock::now();

        for (int i = 0; i < num_producers; ++i) {
            producers.emplace_back(producer_thread, std::ref(bus), i, messages_per_producer);
        }

        for (auto& producer : producers) {
            producer.join();
        }

        refresh.fire("refresh_button", 0);

        bus.drain();

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        std::cout << "All messages delivered in " << duration.count() << " ms" << std::endl;
        std::cout << "METRICS: " << metrics_utils::format_stats(filters->get_metrics()) << std::endl;
        std::cout << "METRICS: " << metrics_utils::format_stats(notifications->get_metrics()) << std::endl;
        std::cout << "  Dead letters: " << filters->get_dead_letters().size() << std::endl;
        std::cout << "  Audited: " << audited.load() << std::endl;
        std::cout << "  Notified: " << notified.load() << std::endl;
        std::cout << "  Custom failures: " << custom_failures.load() << std::endl;

    } catch (const TopicProcessingError& e) {
        std::cerr << "Delivery aborted: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
