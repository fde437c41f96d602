#pragma once

#include <any>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace topicbus {

/**
 * One occurrence to deliver through a topic.
 *
 * Only `sender` is mandatory; it is validated when the message reaches a topic,
 * not on construction. `priority` is carried for producers but not used for
 * delivery ordering (handler priority decides).
 */
struct Message {
    std::string sender;
    std::any data;
    std::optional<std::string> destination;
    std::optional<std::string> message_type;
    std::optional<double> timestamp;
    std::optional<int> priority;
    std::map<std::string, std::string> metadata;

    Message() = default;

    Message(std::string sender, std::any data)
        : sender(std::move(sender)), data(std::move(data)) {}

    Message(std::string sender, std::any data, std::string destination)
        : sender(std::move(sender))
        , data(std::move(data))
        , destination(std::move(destination)) {}
};

enum class ErrorStrategy {
    Raise,   // rethrow to the publisher and stop the delivery run
    Warn,    // log and continue
    Ignore,  // continue silently
    Custom   // hand the failure to the configured error handler
};

std::string to_string(ErrorStrategy strategy);

// Accepts "raise", "warn", "ignore" and "custom" in any case.
ErrorStrategy parse_error_strategy(const std::string& text);

using Handler = std::function<void(const std::any&)>;

using ErrorHandler = std::function<void(std::exception_ptr, const std::any&)>;

struct RegisterOptions {
    std::vector<std::string> aliases;
    int priority = 0;
    bool generic = false;
    bool async = false;
    bool transactional = false;
};

struct EventOptions {
    int priority = 1;
    std::optional<std::string> alias;
    bool allow_broadcast = false;
};

struct TopicConfig {
    std::string id;
    std::string version = "1.0.0";

    ErrorStrategy error_strategy = ErrorStrategy::Raise;
    ErrorHandler error_handler;

    std::vector<std::string> blacklist;
    std::vector<std::string> whitelist;

    size_t max_dead_letters = 100;

    bool debug = false;
};

struct BrokerConfig {
    std::string name = "broker";

    int worker_threads = 4;

    bool debug = false;
};

/// Public view of a registration, without the callable.
struct HandlerInfo {
    std::string name;
    int priority = 0;
    std::vector<std::string> aliases;
    bool generic = false;
};

/// Routing metadata recorded per handler name in a topic's side table.
struct RoutingInfo {
    std::string topic_id;
    int priority = 0;
    std::vector<std::string> aliases;
    bool transactional = false;
};

} // namespace topicbus
