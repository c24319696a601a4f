#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <thread>
#include "publisher.hpp"
#include "test_util.hpp"

namespace {
events::BusOptions quiet_options() {
    events::BusOptions options;
    options.heartbeat_tick = std::chrono::hours(1);
    return options;
}
}

TEST(Publisher, TopicAndPayloadShape) {
    auto event = events::make_event("data_received", "SN1", {{"t", 21.5}});
    event.timestamp = events::Clock::time_point(std::chrono::milliseconds(1714564800250LL));

    EXPECT_EQ(publisher::make_topic("lab", event), "lab/SN1/data_received");
    auto payload = publisher::make_payload(event);
    EXPECT_EQ(payload["type"], "data_received");
    EXPECT_EQ(payload["device_id"], "SN1");
    EXPECT_EQ(payload["timestamp"], "2024-05-01T12:00:00.250Z");
    EXPECT_DOUBLE_EQ(payload["data"]["t"].get<double>(), 21.5);
}

TEST(Publisher, PublishesOnlyConfiguredTypes) {
    events::EventBus bus(quiet_options());
    publisher::EventPublisher pub("fieldlink", {"device_connected", "device_timeout"});
    pub.start(bus);
    EXPECT_TRUE(pub.is_running());

    bus.emit(events::make_event("device_connected", "SN1", {{"ip", "10.0.0.5"}}));
    bus.emit(events::make_event("data_received", "SN1"));
    bus.emit(events::make_event("device_timeout", "SN2"));

    auto messages = pub.published();
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].topic, "fieldlink/SN1/device_connected");
    EXPECT_EQ(messages[0].payload["data"]["ip"], "10.0.0.5");
    EXPECT_EQ(messages[1].topic, "fieldlink/SN2/device_timeout");
}

TEST(Publisher, StopUnsubscribes) {
    events::EventBus bus(quiet_options());
    publisher::EventPublisher pub("root", {"x"});
    pub.start(bus);
    pub.start(bus);
    EXPECT_EQ(bus.subscriber_count("x"), 1u);

    pub.stop();
    EXPECT_FALSE(pub.is_running());
    EXPECT_EQ(bus.subscriber_count("x"), 0u);
    bus.emit(events::make_event("x", "d"));
    EXPECT_EQ(pub.published_count(), 0u);
}

TEST(Publisher, DestroyedWhileBusIsDelivering) {
    events::EventBus bus(quiet_options());
    std::atomic<bool> slow_started{false};
    std::atomic<int> slow_calls{0};
    // Registered first, so the bus is inside this call when the publisher goes away
    bus.subscribe(events::WILDCARD, "slow", [&](const events::DeviceEvent&) {
        slow_started = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ++slow_calls;
    });

    auto pub = std::make_unique<publisher::EventPublisher>("root", std::vector<std::string>{"x"});
    pub->start(bus);
    bus.start();

    bus.emit_nowait(events::make_event("x", "d"));
    ASSERT_TRUE(testutil::wait_for([&]() { return slow_started.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    pub.reset();

    bus.emit_nowait(events::make_event("x", "d"));
    bus.stop();
    EXPECT_EQ(slow_calls.load(), 2);
    EXPECT_EQ(bus.subscriber_count("x"), 0u);
}

TEST(Publisher, StopWaitsForPublishInProgress) {
    events::EventBus bus(quiet_options());
    publisher::EventPublisher pub("root", {"x"});
    pub.start(bus);
    bus.start();

    for (int i = 0; i < 200; ++i) {
        bus.emit_nowait(events::make_event("x", "d", {{"i", i}}));
    }
    pub.stop();
    std::size_t at_stop = pub.published_count();

    bus.stop();
    EXPECT_EQ(pub.published_count(), at_stop);
}
