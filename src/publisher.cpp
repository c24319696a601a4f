#include "publisher.hpp"
#include "timeutil.hpp"
#include "log.hpp"

namespace publisher {

std::string make_topic(const std::string& topic_root, const events::DeviceEvent& event) {
    return topic_root + "/" + event.device_id + "/" + event.type;
}

nlohmann::json make_payload(const events::DeviceEvent& event) {
    return nlohmann::json{
        {"type", event.type},
        {"timestamp", timeutil::format_time(event.timestamp)},
        {"device_id", event.device_id},
        {"data", event.data}
    };
}

EventPublisher::EventPublisher(std::string topic_root, std::vector<std::string> event_types)
    : topic_root_(std::move(topic_root)), event_types_(std::move(event_types)) {}

EventPublisher::~EventPublisher() {
    stop();
}

void EventPublisher::start(events::EventBus& bus) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bus_) {
        return;
    }
    bus_ = &bus;
    for (const auto& type : event_types_) {
        subscriptions_.push_back(bus.subscribe(type, "publisher:" + type,
                                               [this](const events::DeviceEvent& e) { publish(e); }));
    }
    logging::info("Event publisher subscribed to " + std::to_string(event_types_.size()) +
                  " event types under '" + topic_root_ + "'");
}

void EventPublisher::stop() {
    events::EventBus* bus = nullptr;
    std::vector<events::SubscriptionId> subscriptions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!bus_) {
            return;
        }
        bus = bus_;
        bus_ = nullptr;
        subscriptions.swap(subscriptions_);
    }

    // unsubscribe() waits for a running publish(), which needs mutex_
    for (auto id : subscriptions) {
        if (!bus->unsubscribe(id)) {
            logging::debug("Publisher subscription " + std::to_string(id) + " already gone");
        }
    }
    logging::info("Event publisher stopped");
}

bool EventPublisher::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bus_ != nullptr;
}

std::vector<Message> EventPublisher::published() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_;
}

std::size_t EventPublisher::published_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outbox_.size();
}

void EventPublisher::publish(const events::DeviceEvent& event) {
    Message message{make_topic(topic_root_, event), make_payload(event)};
    logging::debug("Publish " + message.topic + " " + message.payload.dump());

    std::lock_guard<std::mutex> lock(mutex_);
    outbox_.push_back(std::move(message));
}

} // namespace publisher
