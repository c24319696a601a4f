#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <cstdint>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

namespace events {

using Clock = std::chrono::system_clock;

// Immutable fact about a device. Subscribers only ever see const references.
struct DeviceEvent {
    std::string type;
    Clock::time_point timestamp;
    nlohmann::json data;
    std::string device_id;
};

DeviceEvent make_event(std::string type, std::string device_id,
                       nlohmann::json data = nlohmann::json::object());

namespace event_type {
constexpr const char* DEVICE_CONNECTED = "device_connected";
constexpr const char* DATA_RECEIVED = "data_received";
constexpr const char* TRANSFER_PROGRESS = "transfer_progress";
constexpr const char* TRANSFER_COMPLETE = "transfer_complete";
constexpr const char* TRANSFER_INCOMPLETE = "transfer_incomplete";
constexpr const char* DEVICE_TIMEOUT = "device_timeout";
constexpr const char* DEVICE_EVICTED = "device_evicted";
} // namespace event_type

// Subscribing to this type receives every event
constexpr const char* WILDCARD = "*";

using Callback = std::function<void(const DeviceEvent&)>;

// Counts the callbacks running for one subscription. Once closed, enter()
// refuses new calls and close() returns only after the running ones finish.
// A thread that closes the gate from inside its own callback does not wait
// for itself.
class DeliveryGate {
public:
    bool enter();
    void leave();
    void close();
    bool is_open() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    bool open_ = true;
    std::vector<std::thread::id> inside_;
};

class Subscriber {
public:
    virtual ~Subscriber() = default;
    // May throw; the bus logs the failure and keeps delivering to others.
    virtual void deliver(const DeviceEvent& event) = 0;
    virtual const std::string& name() const = 0;
    // Called on unsubscribe. Work handed off elsewhere must not run after it returns.
    virtual void close() {}
};

// Runs the callback on whatever context dispatches the event.
// Meant for quick, non-blocking handlers.
class InlineSubscriber : public Subscriber {
public:
    InlineSubscriber(std::string name, Callback callback);
    void deliver(const DeviceEvent& event) override;
    const std::string& name() const override { return name_; }

private:
    std::string name_;
    Callback callback_;
};

// Hands every event to a worker pool, serialized through a strand so the
// callback still sees events one at a time and in emission order.
// Meant for handlers that block (disk, network, slow consumers).
class PooledSubscriber : public Subscriber {
public:
    PooledSubscriber(std::string name, Callback callback,
                     boost::asio::thread_pool::executor_type executor);
    void deliver(const DeviceEvent& event) override;
    const std::string& name() const override { return name_; }
    // Drops events still queued on the strand and waits for the running one
    void close() override;

private:
    std::string name_;
    Callback callback_;
    boost::asio::strand<boost::asio::thread_pool::executor_type> strand_;
    std::shared_ptr<DeliveryGate> gate_;
};

enum class Delivery {
    INLINE,
    POOLED
};

using SubscriptionId = uint64_t;

struct BusOptions {
    std::chrono::milliseconds heartbeat_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds heartbeat_tick{std::chrono::seconds(1)};
    // Consecutive timeout reports before a device is dropped; 0 keeps reporting forever
    unsigned evict_after = 0;
    unsigned workers = 2;
};

class EventBus {
public:
    explicit EventBus(BusOptions options = BusOptions{});
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Starts the coordinating thread and the heartbeat sweep. Events queued
    // with emit_nowait() before start() are delivered once it runs.
    void start();
    // Drains queued events, stops the sweep and waits for pooled handlers.
    // A stopped bus cannot be restarted.
    void stop();
    bool is_running() const { return running_; }

    SubscriptionId subscribe(const std::string& event_type, std::shared_ptr<Subscriber> subscriber);
    SubscriptionId subscribe(const std::string& event_type, std::string name, Callback callback,
                             Delivery delivery = Delivery::INLINE);
    // No callback for `id` runs once this returns, except the one calling it.
    // Must not be called while holding a lock the callback takes.
    bool unsubscribe(SubscriptionId id);
    std::size_t subscriber_count(const std::string& event_type) const;

    // Delivers on the calling thread.
    void emit(const DeviceEvent& event);

    // Queues the event for the coordinating thread. Safe from any thread,
    // never blocks on subscribers.
    void emit_nowait(DeviceEvent event);

    void register_heartbeat(const std::string& device_id);
    void register_heartbeat(const std::string& device_id, Clock::time_point at);
    std::optional<Clock::time_point> last_heartbeat(const std::string& device_id) const;
    std::size_t heartbeat_count() const;

    // One pass of the liveness check. Emits device_timeout for every device
    // silent for longer than the timeout. Returns how many timed out.
    std::size_t sweep(Clock::time_point now);


private:
    struct Entry {
        SubscriptionId id = 0;
        std::string event_type;
        std::shared_ptr<Subscriber> subscriber;
        std::shared_ptr<DeliveryGate> gate;
    };

    struct Heartbeat {
        Clock::time_point last_seen;
        unsigned misses = 0;
    };

    void schedule_sweep();

    BusOptions options_;

    boost::asio::io_context io_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::steady_timer timer_;
    boost::asio::thread_pool pool_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};

    mutable std::mutex subscribers_mutex_;
    std::vector<Entry> subscribers_;
    SubscriptionId next_id_ = 1;

    mutable std::mutex heartbeat_mutex_;
    std::map<std::string, Heartbeat> heartbeats_;
};

} // namespace events
