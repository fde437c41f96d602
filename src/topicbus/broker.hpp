#pragma once

#include "types.hpp"
#include "topic.hpp"
#include <boost/asio/thread_pool.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace topicbus {

/**
 * Broker is the registry that owns an application's topics and routes
 * publishes to them by topic id.
 *
 * Architecture:
 * - One Broker is constructed by the application entry point and passed to
 *   the code that publishes or registers handlers.
 * - All topics bound to the broker share one Boost.Asio thread_pool for their
 *   asynchronous handlers.
 * - Unknown topic ids fail fast with TopicNotFound.
 */
class Broker {
public:
    explicit Broker(const BrokerConfig& config = BrokerConfig{});
    ~Broker();

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    std::shared_ptr<Topic> create_topic(const TopicConfig& config);

    // Registers an externally built topic; an existing topic with the same id is replaced.
    void subscribe(std::shared_ptr<Topic> topic);

    void publish(const std::string& topic_id, const Message& message);

    std::shared_ptr<Topic> get_topic(const std::string& topic_id) const;

    bool has_topic(const std::string& topic_id) const;

    std::vector<std::string> topic_ids() const;

    void drain();

    const std::string& name() const { return config_.name; }

private:
    void register_topic(std::shared_ptr<Topic> topic);

    BrokerConfig config_;
    std::shared_ptr<boost::asio::thread_pool> worker_pool_;

    mutable std::mutex topics_mutex_;
    std::map<std::string, std::shared_ptr<Topic>> topics_;
};

} // namespace topicbus
