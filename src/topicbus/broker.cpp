#include "broker.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <stdexcept>

namespace topicbus {

Broker::Broker(const BrokerConfig& config)
    : config_(config)
    , worker_pool_(std::make_shared<boost::asio::thread_pool>(std::max(1, config.worker_threads))) {
    if (config_.debug) {
        get_logger()->set_level(spdlog::level::debug);
        get_logger()->debug("Broker '{}' started with {} worker threads",
                            config_.name, std::max(1, config_.worker_threads));
    }
}

Broker::~Broker() {
    std::map<std::string, std::shared_ptr<Topic>> topics;
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        topics.swap(topics_);
    }

    for (auto& entry : topics) {
        entry.second->drain();
        entry.second->detach(this);
    }
}

std::shared_ptr<Topic> Broker::create_topic(const TopicConfig& config) {
    auto topic = std::make_shared<Topic>(config, this, worker_pool_);
    register_topic(topic);
    return topic;
}

void Broker::subscribe(std::shared_ptr<Topic> topic) {
    if (!topic) {
        throw std::invalid_argument("Cannot subscribe a null topic to broker '" + config_.name + "'");
    }
    topic->attach(this, worker_pool_);
    register_topic(std::move(topic));
}

void Broker::publish(const std::string& topic_id, const Message& message) {
    auto topic = get_topic(topic_id);
    if (!topic) {
        throw TopicNotFound(topic_id);
    }

    if (config_.debug) {
        get_logger()->debug("Broker '{}' publishing to '{}' from '{}'", config_.name, topic_id, message.sender);
    }

    topic->publish_event(message);
}

std::shared_ptr<Topic> Broker::get_topic(const std::string& topic_id) const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    auto it = topics_.find(topic_id);
    return it == topics_.end() ? nullptr : it->second;
}

bool Broker::has_topic(const std::string& topic_id) const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    return topics_.count(topic_id) != 0;
}

std::vector<std::string> Broker::topic_ids() const {
    std::lock_guard<std::mutex> lock(topics_mutex_);
    std::vector<std::string> ids;
    ids.reserve(topics_.size());
    for (const auto& entry : topics_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void Broker::drain() {
    std::vector<std::shared_ptr<Topic>> topics;
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        for (const auto& entry : topics_) {
            topics.push_back(entry.second);
        }
    }

    for (auto& topic : topics) {
        topic->drain();
    }
}

void Broker::register_topic(std::shared_ptr<Topic> topic) {
    std::shared_ptr<Topic> replaced;
    {
        std::lock_guard<std::mutex> lock(topics_mutex_);
        auto& slot = topics_[topic->id()];
        if (slot && slot != topic) {
            replaced = slot;
        }
        slot = std::move(topic);
    }

    if (replaced) {
        get_logger()->warn("Broker '{}' replaced topic '{}'", config_.name, replaced->full_id());
        replaced->detach(this);
    }
}

} // namespace topicbus
