//
// Created by Giuseppe Francione on 14/10/26.
//

#include <gtest/gtest.h>

#include "../libtaglog/include/event_bus.hpp"
#include "../libtaglog/include/events.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using taglog::ErrorLoggedEvent;
using taglog::EventBus;
using taglog::LoggedEvent;

TEST(EventBusTest, HandlersRunInRegistrationOrder) {
    EventBus bus;
    std::vector<std::string> calls;
    bus.subscribe<LoggedEvent>([&](const LoggedEvent& e) { calls.push_back("a:" + e.text); });
    bus.subscribe<LoggedEvent>([&](const LoggedEvent& e) { calls.push_back("b:" + e.text); });

    bus.publish(LoggedEvent{"hi"});
    EXPECT_EQ(calls, (std::vector<std::string>{"a:hi", "b:hi"}));
}

TEST(EventBusTest, EventTypesAreIndependent) {
    EventBus bus;
    int logged = 0;
    int errors = 0;
    bus.subscribe<LoggedEvent>([&](const LoggedEvent&) { ++logged; });
    bus.subscribe<ErrorLoggedEvent>([&](const ErrorLoggedEvent&) { ++errors; });

    bus.publish(ErrorLoggedEvent{"boom"});
    EXPECT_EQ(logged, 0);
    EXPECT_EQ(errors, 1);
}

TEST(EventBusTest, UnsubscribeStopsDelivery) {
    EventBus bus;
    int count = 0;
    const auto id = bus.subscribe<LoggedEvent>([&](const LoggedEvent&) { ++count; });
    bus.publish(LoggedEvent{"one"});

    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    bus.publish(LoggedEvent{"two"});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<LoggedEvent>(), 0u);
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;
    std::vector<std::string> failures;
    bus.set_error_handler([&](const std::exception& e) { failures.emplace_back(e.what()); });

    int reached = 0;
    bus.subscribe<LoggedEvent>([](const LoggedEvent&) { throw std::runtime_error("listener down"); });
    bus.subscribe<LoggedEvent>([&](const LoggedEvent&) { ++reached; });

    bus.publish(LoggedEvent{"x"});
    EXPECT_EQ(reached, 1);
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0], "listener down");
}

TEST(EventBusTest, HandlerMaySubscribeDuringPublish) {
    EventBus bus;
    int late = 0;
    bus.subscribe<LoggedEvent>([&](const LoggedEvent&) {
        bus.subscribe<LoggedEvent>([&](const LoggedEvent&) { ++late; });
    });

    bus.publish(LoggedEvent{"first"});
    EXPECT_EQ(late, 0);
    EXPECT_EQ(bus.subscriber_count<LoggedEvent>(), 2u);

    bus.publish(LoggedEvent{"second"});
    EXPECT_EQ(late, 1);
}
