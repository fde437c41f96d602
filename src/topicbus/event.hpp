#pragma once

#include "types.hpp"
#include "topic.hpp"
#include <optional>
#include <string>
#include <vector>

namespace topicbus {

/**
 * A named occurrence bound to one topic.
 *
 * Events only assemble messages; all delivery semantics live in Topic.
 * Handlers registered through an event get the event name and alias as
 * aliases, so the event's triggers reach them.
 */
class Event {
public:
    Event(std::string name, Topic& topic, const EventOptions& options = EventOptions{});
    virtual ~Event() = default;

    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    virtual void trigger(Message message) = 0;

    template <typename F>
    F handler(const std::string& handler_name, F fn, bool async = false) {
        RegisterOptions options;
        options.aliases = routing_names();
        options.priority = priority_;
        options.async = async;
        return topic_.register_handler(handler_name, std::move(fn), options);
    }

    const std::string& name() const { return name_; }
    Topic& topic() const { return topic_; }
    int priority() const { return priority_; }
    const std::optional<std::string>& alias() const { return alias_; }
    bool allow_broadcast() const { return allow_broadcast_; }

protected:
    void deliver(const Message& message);

    std::vector<std::string> routing_names() const;

private:
    std::string name_;
    Topic& topic_;
    int priority_;
    std::optional<std::string> alias_;
    bool allow_broadcast_;
};

/**
 * Event addressed to its own handlers.
 *
 * trigger() fills in what the caller left out: destination (alias, else name),
 * message_type (event name) and timestamp (now). A broadcast-enabled event
 * leaves a missing destination empty, which reaches generic handlers only.
 */
class NamedEvent : public Event {
public:
    using Event::Event;

    void trigger(Message message) override;

    void fire(const std::string& sender, std::any data);
};

} // namespace topicbus
