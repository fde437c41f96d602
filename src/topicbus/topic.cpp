#include "topic.hpp"
#include "broker.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "log.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <stdexcept>

namespace topicbus {

bool Topic::Registration::accepts(const std::optional<std::string>& destination) const {
    if (generic) {
        return true;
    }
    if (!destination) {
        return false;
    }
    return *destination == name
        || std::find(aliases.begin(), aliases.end(), *destination) != aliases.end();
}

HandlerInfo Topic::Registration::info() const {
    return HandlerInfo{name, priority, aliases, generic};
}

Topic::Topic(const TopicConfig& config, Broker* broker, std::shared_ptr<boost::asio::thread_pool> worker_pool)
    : id_(config.id)
    , version_(config.version)
    , full_id_(config.id + "@" + config.version)
    , error_strategy_(config.error_strategy)
    , error_handler_(config.error_handler)
    , debug_(config.debug)
    , logger_(get_logger())
    , blacklist_(config.blacklist.begin(), config.blacklist.end())
    , whitelist_(config.whitelist.begin(), config.whitelist.end())
    , broker_(broker)
    , worker_pool_(std::move(worker_pool))
    , dead_letters_(config.max_dead_letters) {
    if (id_.empty()) {
        throw std::invalid_argument("Topic id must not be empty");
    }

    if (debug_) {
        logger_->set_level(spdlog::level::debug);
        logger_->debug("Topic initialized: {}", full_id_);
    }
}

Topic::~Topic() {
    drain();
}

void Topic::add_registration(const std::string& name, Handler handler, const RegisterOptions& options) {
    if (name.empty()) {
        throw std::invalid_argument("Handler name must not be empty in topic " + full_id_);
    }
    if (!handler) {
        throw std::invalid_argument("Handler '" + name + "' has no callable in topic " + full_id_);
    }

    auto registration = std::make_shared<Registration>();
    registration->name = name;
    registration->aliases = options.aliases;
    registration->priority = options.priority;
    registration->generic = options.generic;
    registration->is_async = options.async;
    registration->transactional = options.transactional;
    registration->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mutex_);

    if (routing_.count(name) != 0) {
        throw std::invalid_argument("Handler '" + name + "' already exists in topic " + full_id_);
    }

    // upper_bound keeps equal priorities in registration order
    auto position = std::upper_bound(handlers_.begin(), handlers_.end(), options.priority,
        [](int priority, const RegistrationPtr& existing) { return priority > existing->priority; });
    handlers_.insert(position, registration);

    routing_[name] = RoutingInfo{full_id_, options.priority, options.aliases, options.transactional};

    if (debug_) {
        logger_->debug("Registering handler '{}' for {} (priority={}, generic={}, async={}, transactional={})",
                       name, full_id_, options.priority, options.generic, options.async, options.transactional);
    }
}

void Topic::add_to_blacklist(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blacklist_.insert(sender_id).second && debug_) {
        logger_->debug("Added '{}' to blacklist of {}", sender_id, full_id_);
    }
}

void Topic::remove_from_blacklist(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blacklist_.erase(sender_id) != 0 && debug_) {
        logger_->debug("Removed '{}' from blacklist of {}", sender_id, full_id_);
    }
}

void Topic::add_to_whitelist(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (whitelist_.insert(sender_id).second && debug_) {
        logger_->debug("Added '{}' to whitelist of {}", sender_id, full_id_);
    }
}

void Topic::remove_from_whitelist(const std::string& sender_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (whitelist_.erase(sender_id) != 0 && debug_) {
        logger_->debug("Removed '{}' from whitelist of {}", sender_id, full_id_);
    }
}

bool Topic::is_sender_allowed(const std::string& sender_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blacklist_.count(sender_id) != 0) {
        return false;
    }
    if (!whitelist_.empty()) {
        return whitelist_.count(sender_id) != 0;
    }
    return true;
}

void Topic::publish_event(const Message& message) {
    if (message.sender.empty()) {
        throw MessageValidationError("Message published to topic '" + full_id_ + "' has no sender");
    }

    if (!is_sender_allowed(message.sender)) {
        update_metrics(false);
        handle_error(std::make_exception_ptr(SenderDenied(message.sender, full_id_)), message.data);
        return;
    }

    if (debug_) {
        logger_->debug("Event published to {} by '{}' (destination={})",
                       full_id_, message.sender, message.destination.value_or("<none>"));
    }

    handle_event(message);
}

void Topic::handle_event(const Message& message) {
    std::vector<RegistrationPtr> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }

    for (const auto& registration : handlers) {
        if (!registration->accepts(message.destination)) {
            continue;
        }

        if (registration->is_async) {
            dispatch_async(registration, message.data);
            continue;
        }

        auto failure = invoke(*registration, message.data);
        if (failure) {
            // throws under ErrorStrategy::Raise, which ends this delivery run
            handle_error(failure, message.data);
        }
    }
}

std::exception_ptr Topic::invoke(const Registration& registration, const std::any& data) {
    auto start = std::chrono::steady_clock::now();
    try {
        registration.handler(data);
    } catch (...) {
        update_metrics(false);
        return std::make_exception_ptr(HandlerExecutionError(registration.name, std::current_exception()));
    }
    update_metrics(true, std::chrono::duration_cast<std::chrono::nanoseconds>(
                             std::chrono::steady_clock::now() - start));
    return nullptr;
}

void Topic::dispatch_async(RegistrationPtr registration, const std::any& data) {
    auto pool = ensure_worker_pool();
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        ++inflight_;
    }

    boost::asio::post(*pool, [this, registration, data]() {
        run_async(*registration, data);

        std::lock_guard<std::mutex> lock(inflight_mutex_);
        --inflight_;
        inflight_cv_.notify_all();
    });
}

void Topic::run_async(const Registration& registration, const std::any& data) {
    auto failure = invoke(registration, data);
    if (!failure) {
        return;
    }

    try {
        handle_error(failure, data);
    } catch (const TopicProcessingError& e) {
        // the publisher has already returned; nobody is left to rethrow to
        logger_->error("Async handler '{}' failed: {}", registration.name, e.what());
    }
}

void Topic::handle_error(std::exception_ptr error, const std::any& data) {
    if (!dead_letters_.try_push(DeadLetter{error, data, describe(error)}) && debug_) {
        logger_->debug("Dead letter buffer of {} is full, dropping failure", full_id_);
    }

    if (error_strategy_ == ErrorStrategy::Custom && error_handler_) {
        try {
            error_handler_(error, data);
        } catch (...) {
            CustomHandlerFailure failure(full_id_, std::current_exception());
            logger_->critical("{}", failure.what());
        }
        return;
    }

    default_error_handler(error);
}

void Topic::default_error_handler(std::exception_ptr error) {
    switch (error_strategy_) {
        case ErrorStrategy::Raise:
            throw TopicProcessingError(full_id_, error);
        case ErrorStrategy::Warn:
            logger_->warn("Non-critical error in topic '{}': {}", full_id_, describe(error));
            break;
        case ErrorStrategy::Ignore:
        case ErrorStrategy::Custom:
            break;
    }
}

void Topic::update_metrics(bool success, std::chrono::nanoseconds latency) {
    if (success) {
        metrics_.record_success(latency);
    } else {
        metrics_.record_failure();
    }
}

std::function<Message(std::any)> Topic::sender_for(const std::string& handler_name) {
    bool generic = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(handlers_.begin(), handlers_.end(),
            [&](const RegistrationPtr& registration) { return registration->name == handler_name; });
        if (it == handlers_.end()) {
            throw std::invalid_argument("Handler '" + handler_name + "' is not registered in topic " + full_id_);
        }
        generic = (*it)->generic;
    }

    return [this, handler_name, generic](std::any data) {
        Message message(full_id_ + "." + handler_name, std::move(data), handler_name);
        message.message_type = generic ? std::string("generic") : handler_name;

        Broker* target = broker();
        if (target == nullptr) {
            handle_error(std::make_exception_ptr(NoBrokerError(full_id_)), std::any{});
            return Message("system", std::any{});
        }

        target->publish(id_, message);
        if (debug_) {
            logger_->debug("Message sent to {} from handler '{}'", id_, handler_name);
        }
        return message;
    };
}

NamedEvent& Topic::add_event(const std::string& name, const EventOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.count(name) != 0) {
        throw std::invalid_argument("Event '" + name + "' already exists in topic " + full_id_);
    }
    auto& slot = events_[name];
    slot = std::make_unique<NamedEvent>(name, *this, options);
    return *slot;
}

NamedEvent* Topic::event(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = events_.find(name);
    return it == events_.end() ? nullptr : it->second.get();
}

void Topic::drain() {
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this] { return inflight_ == 0; });
}

TopicStats Topic::get_metrics() const {
    TopicStats stats;
    stats.full_id = full_id_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.handler_count = handlers_.size();
    }
    stats.stats = metrics_.get_stats();
    return stats;
}

std::vector<DeadLetter> Topic::get_dead_letters() const {
    return dead_letters_.snapshot();
}

std::vector<HandlerInfo> Topic::active_handlers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HandlerInfo> handlers;
    handlers.reserve(handlers_.size());
    for (const auto& registration : handlers_) {
        handlers.push_back(registration->info());
    }
    return handlers;
}

std::optional<HandlerInfo> Topic::get_handler(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& registration : handlers_) {
        const auto& aliases = registration->aliases;
        if (registration->name == name || std::find(aliases.begin(), aliases.end(), name) != aliases.end()) {
            return registration->info();
        }
    }
    return std::nullopt;
}

std::optional<RoutingInfo> Topic::routing_info(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routing_.find(name);
    if (it == routing_.end()) {
        return std::nullopt;
    }
    return it->second;
}

Broker* Topic::broker() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broker_;
}

void Topic::attach(Broker* broker, std::shared_ptr<boost::asio::thread_pool> worker_pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    broker_ = broker;
    if (!worker_pool_) {
        worker_pool_ = std::move(worker_pool);
    }
}

void Topic::detach(const Broker* broker) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broker_ == broker) {
        broker_ = nullptr;
    }
}

std::shared_ptr<boost::asio::thread_pool> Topic::ensure_worker_pool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!worker_pool_) {
        worker_pool_ = std::make_shared<boost::asio::thread_pool>(1);
    }
    return worker_pool_;
}

} // namespace topicbus
