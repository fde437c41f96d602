#pragma once

#include "types.hpp"
#include "metrics.hpp"
#include "dead_letters.hpp"
#include <boost/asio/thread_pool.hpp>
#include <spdlog/logger.h>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace topicbus {

class Broker;
class NamedEvent;

/**
 * Topic is a named, versioned channel that dispatches messages to its handlers.
 *
 * Delivery:
 * - Handlers are kept sorted by priority (descending); equal priorities run in
 *   registration order.
 * - A handler runs when it is generic, or when the message destination equals
 *   its name or one of its aliases.
 * - Synchronous handlers run inline on the publishing thread. Asynchronous
 *   handlers are posted to a Boost.Asio thread_pool and not awaited; drain()
 *   waits for them.
 *
 * Failures (denied senders, throwing handlers) go through one error path: they
 * are stored in a bounded dead letter buffer, counted in the metrics and then
 * handled per ErrorStrategy.
 *
 * Handlers are invoked with no topic lock held, so they may publish again.
 */
class Topic {
public:
    explicit Topic(const TopicConfig& config,
                   Broker* broker = nullptr,
                   std::shared_ptr<boost::asio::thread_pool> worker_pool = nullptr);
    ~Topic();

    Topic(const Topic&) = delete;
    Topic& operator=(const Topic&) = delete;

    /// Registers `handler` under `name` and returns it unchanged.
    /// Throws std::invalid_argument if the name is already taken on this topic.
    template <typename F>
    F register_handler(const std::string& name, F handler, const RegisterOptions& options) {
        add_registration(name, Handler(handler), options);
        return handler;
    }

    template <typename F>
    F register_handler(const std::string& name, F handler) {
        return register_handler(name, std::move(handler), RegisterOptions{});
    }

    void add_to_blacklist(const std::string& sender_id);
    void remove_from_blacklist(const std::string& sender_id);
    void add_to_whitelist(const std::string& sender_id);
    void remove_from_whitelist(const std::string& sender_id);

    bool is_sender_allowed(const std::string& sender_id) const;

    /// Validates and authorizes the message, then delivers it.
    /// Throws MessageValidationError for an empty sender, and TopicProcessingError
    /// under ErrorStrategy::Raise.
    void publish_event(const Message& message);

    /// Delivers the message to the matching handlers, bypassing sender checks.
    void handle_event(const Message& message);

    /// Closure that publishes through the bound broker on behalf of a registered handler.
    std::function<Message(std::any)> sender_for(const std::string& handler_name);

    NamedEvent& add_event(const std::string& name, const EventOptions& options = EventOptions{});
    NamedEvent* event(const std::string& name);

    /// Blocks until every asynchronous handler posted by this topic has finished.
    void drain();

    TopicStats get_metrics() const;
    std::vector<DeadLetter> get_dead_letters() const;
    std::vector<HandlerInfo> active_handlers() const;
    std::optional<HandlerInfo> get_handler(const std::string& name) const;
    std::optional<RoutingInfo> routing_info(const std::string& name) const;

    const std::string& id() const { return id_; }
    const std::string& version() const { return version_; }
    const std::string& full_id() const { return full_id_; }
    ErrorStrategy error_strategy() const { return error_strategy_; }
    Broker* broker() const;

    // Called by Broker when the topic is created or subscribed.
    void attach(Broker* broker, std::shared_ptr<boost::asio::thread_pool> worker_pool);
    void detach(const Broker* broker);

private:
    struct Registration {
        std::string name;
        std::vector<std::string> aliases;
        int priority = 0;
        bool generic = false;
        bool is_async = false;
        bool transactional = false;
        Handler handler;

        bool accepts(const std::optional<std::string>& destination) const;
        HandlerInfo info() const;
    };

    using RegistrationPtr = std::shared_ptr<const Registration>;

    void add_registration(const std::string& name, Handler handler, const RegisterOptions& options);

    std::exception_ptr invoke(const Registration& registration, const std::any& data);
    void dispatch_async(RegistrationPtr registration, const std::any& data);
    void run_async(const Registration& registration, const std::any& data);

    void handle_error(std::exception_ptr error, const std::any& data);
    void default_error_handler(std::exception_ptr error);

    void update_metrics(bool success, std::chrono::nanoseconds latency = std::chrono::nanoseconds{0});

    std::shared_ptr<boost::asio::thread_pool> ensure_worker_pool();

    std::string id_;
    std::string version_;
    std::string full_id_;

    ErrorStrategy error_strategy_;
    ErrorHandler error_handler_;
    bool debug_;

    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    std::vector<RegistrationPtr> handlers_;
    std::unordered_map<std::string, RoutingInfo> routing_;
    std::unordered_set<std::string> blacklist_;
    std::unordered_set<std::string> whitelist_;
    std::map<std::string, std::unique_ptr<NamedEvent>> events_;
    Broker* broker_;
    std::shared_ptr<boost::asio::thread_pool> worker_pool_;

    TopicMetrics metrics_;
    DeadLetterBuffer dead_letters_;

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    size_t inflight_{0};
};

} // namespace topicbus
