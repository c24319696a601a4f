#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>
#include "events.hpp"

namespace publisher {

struct Message {
    std::string topic;
    nlohmann::json payload;
};

// Topic for an event: <topic_root>/<device_id>/<type>
std::string make_topic(const std::string& topic_root, const events::DeviceEvent& event);

// {type, timestamp, device_id, data} with an ISO-8601 UTC timestamp
nlohmann::json make_payload(const events::DeviceEvent& event);

// Republishes selected bus events as topic/payload messages. Messages are
// kept in memory; nothing is sent to a broker.
class EventPublisher {
public:
    EventPublisher(std::string topic_root, std::vector<std::string> event_types);
    ~EventPublisher();

    EventPublisher(const EventPublisher&) = delete;
    EventPublisher& operator=(const EventPublisher&) = delete;

    // Subscribes to every configured type. Calling it twice is a no-op.
    void start(events::EventBus& bus);
    void stop();
    bool is_running() const;

    std::vector<Message> published() const;
    std::size_t published_count() const;

private:
    void publish(const events::DeviceEvent& event);

    std::string topic_root_;
    std::vector<std::string> event_types_;

    mutable std::mutex mutex_;
    events::EventBus* bus_ = nullptr;
    std::vector<events::SubscriptionId> subscriptions_;
    std::vector<Message> outbox_;
};

} // namespace publisher
