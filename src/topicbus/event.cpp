#include "event.hpp"
#include <chrono>

namespace topicbus {

Event::Event(std::string name, Topic& topic, const EventOptions& options)
    : name_(std::move(name))
    , topic_(topic)
    , priority_(options.priority)
    , alias_(options.alias)
    , allow_broadcast_(options.allow_broadcast) {
}

void Event::deliver(const Message& message) {
    topic_.publish_event(message);
}

std::vector<std::string> Event::routing_names() const {
    std::vector<std::string> names{name_};
    if (alias_ && *alias_ != name_) {
        names.push_back(*alias_);
    }
    return names;
}

void NamedEvent::trigger(Message message) {
    if (!message.destination && !allow_broadcast()) {
        message.destination = alias().value_or(name());
    }
    if (!message.message_type) {
        message.message_type = name();
    }
    if (!message.timestamp) {
        auto now = std::chrono::system_clock::now().time_since_epoch();
        message.timestamp = std::chrono::duration<double>(now).count();
    }
    deliver(message);
}

void NamedEvent::fire(const std::string& sender, std::any data) {
    trigger(Message(sender, std::move(data)));
}

} // namespace topicbus
