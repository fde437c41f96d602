#include <catch2/catch.hpp>
#include "event.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

using namespace topicbus;

namespace {

TopicConfig filters_config() {
    TopicConfig config;
    config.id = "filters";
    config.error_strategy = ErrorStrategy::Raise;
    return config;
}

} // namespace

TEST_CASE("Event: add_event exposes the configured attributes", "[event]") {
    Topic topic(filters_config());
    EventOptions options;
    options.priority = 100;
    options.alias = "months";

    auto& event = topic.add_event("months_changed", options);

    REQUIRE(event.name() == "months_changed");
    REQUIRE(&event.topic() == &topic);
    REQUIRE(event.priority() == 100);
    REQUIRE(event.alias() == std::optional<std::string>("months"));
    REQUIRE_FALSE(event.allow_broadcast());
    REQUIRE(topic.event("months_changed") == &event);
    REQUIRE(topic.event("missing") == nullptr);
}

TEST_CASE("Event: duplicate event names are rejected", "[event]") {
    Topic topic(filters_config());
    topic.add_event("months_changed");
    REQUIRE_THROWS_AS(topic.add_event("months_changed"), std::invalid_argument);
}

TEST_CASE("Event: handlers registered through an event receive its triggers", "[event]") {
    Topic topic(filters_config());
    EventOptions options;
    options.priority = 100;
    auto& event = topic.add_event("months_changed", options);

    std::vector<std::string> months;
    event.handler("validate_selection", [&](const std::any& data) {
        months = std::any_cast<std::vector<std::string>>(data);
    });

    event.fire("month_filter", std::vector<std::string>{"Jan", "Feb"});

    REQUIRE(months == std::vector<std::string>{"Jan", "Feb"});

    auto info = topic.get_handler("validate_selection");
    REQUIRE(info.has_value());
    REQUIRE(info->priority == 100);
    REQUIRE(info->aliases == std::vector<std::string>{"months_changed"});
}

TEST_CASE("Event: trigger targets the alias and fills type and timestamp", "[event]") {
    Topic topic(filters_config());
    EventOptions options;
    options.alias = "refresh";
    auto& event = topic.add_event("data_refresh", options);

    int aliased_calls = 0;
    int other_calls = 0;
    RegisterOptions aliased;
    aliased.aliases = {"refresh"};
    topic.register_handler("reload_chart", [&](const std::any&) { aliased_calls++; }, aliased);
    topic.register_handler("unrelated", [&](const std::any&) { other_calls++; });

    event.trigger(Message("refresh_button", 0));

    REQUIRE(aliased_calls == 1);
    REQUIRE(other_calls == 0);
}

TEST_CASE("Event: an explicit destination is kept", "[event]") {
    Topic topic(filters_config());
    auto& event = topic.add_event("months_changed");
    int direct = 0;
    int by_event = 0;
    topic.register_handler("direct", [&](const std::any&) { direct++; });
    event.handler("by_event", [&](const std::any&) { by_event++; });

    event.trigger(Message("s", 1, "direct"));

    REQUIRE(direct == 1);
    REQUIRE(by_event == 0);
}

TEST_CASE("Event: broadcast events without destination reach generic handlers only", "[event]") {
    Topic topic(filters_config());
    EventOptions options;
    options.allow_broadcast = true;
    auto& event = topic.add_event("reset_all", options);

    int generic_calls = 0;
    int by_event = 0;
    RegisterOptions generic;
    generic.generic = true;
    topic.register_handler("everyone", [&](const std::any&) { generic_calls++; }, generic);
    event.handler("by_event", [&](const std::any&) { by_event++; });

    event.fire("reset_button", 0);

    REQUIRE(generic_calls == 1);
    REQUIRE(by_event == 0);
}

TEST_CASE("Event: triggers go through the topic's security policy", "[event]") {
    Topic topic(filters_config());
    topic.add_to_blacklist("intruder");
    auto& event = topic.add_event("months_changed");
    int calls = 0;
    event.handler("validate_selection", [&](const std::any&) { calls++; });

    REQUIRE_THROWS_AS(event.fire("intruder", 1), TopicProcessingError);
    REQUIRE(calls == 0);
}
