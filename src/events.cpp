#include "events.hpp"
#include "log.hpp"
#include "timeutil.hpp"
#include <algorithm>
#include <stdexcept>

namespace events {

DeviceEvent make_event(std::string type, std::string device_id, nlohmann::json data) {
    return DeviceEvent{std::move(type), Clock::now(), std::move(data), std::move(device_id)};
}

// ─── DeliveryGate ───────────────────────────────────────────────────────────

bool DeliveryGate::enter() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
        return false;
    }
    inside_.push_back(std::this_thread::get_id());
    return true;
}

void DeliveryGate::leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(inside_.begin(), inside_.end(), std::this_thread::get_id());
    if (it != inside_.end()) {
        inside_.erase(it);
    }
    idle_cv_.notify_all();
}

void DeliveryGate::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    open_ = false;
    const auto self = std::this_thread::get_id();
    idle_cv_.wait(lock, [this, self]() {
        return std::all_of(inside_.begin(), inside_.end(),
                           [self](const std::thread::id& id) { return id == self; });
    });
}

bool DeliveryGate::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

namespace {

// Pairs enter() with leave() across exceptions
class GatePass {
public:
    explicit GatePass(DeliveryGate& gate) : gate_(gate), entered_(gate.enter()) {}
    ~GatePass() {
        if (entered_) {
            gate_.leave();
        }
    }
    GatePass(const GatePass&) = delete;
    GatePass& operator=(const GatePass&) = delete;

    explicit operator bool() const { return entered_; }

private:
    DeliveryGate& gate_;
    bool entered_;
};

} // namespace

// ─── Subscribers ────────────────────────────────────────────────────────────

InlineSubscriber::InlineSubscriber(std::string name, Callback callback)
    : name_(std::move(name)), callback_(std::move(callback)) {
    if (!callback_) {
        throw std::invalid_argument("InlineSubscriber '" + name_ + "' needs a callback");
    }
}

void InlineSubscriber::deliver(const DeviceEvent& event) {
    callback_(event);
}

PooledSubscriber::PooledSubscriber(std::string name, Callback callback,
                                   boost::asio::thread_pool::executor_type executor)
    : name_(std::move(name)),
      callback_(std::move(callback)),
      strand_(boost::asio::make_strand(executor)),
      gate_(std::make_shared<DeliveryGate>()) {
    if (!callback_) {
        throw std::invalid_argument("PooledSubscriber '" + name_ + "' needs a callback");
    }
}

void PooledSubscriber::deliver(const DeviceEvent& event) {
    // Failures happen on a worker thread, after deliver() has returned
    boost::asio::post(strand_, [callback = callback_, name = name_, gate = gate_, event]() {
        GatePass pass(*gate);
        if (!pass) {
            return;
        }
        try {
            callback(event);
        } catch (std::exception& e) {
            logging::error("Subscriber '" + name + "' failed on " + event.type + ": " + e.what());
        }
    });
}

void PooledSubscriber::close() {
    gate_->close();
}

// ─── EventBus ───────────────────────────────────────────────────────────────

EventBus::EventBus(BusOptions options)
    : options_(options),
      timer_(io_),
      pool_(std::max(1u, options.workers)) {}

EventBus::~EventBus() {
    stop();
}

void EventBus::start() {
    if (stopped_) {
        throw std::logic_error("EventBus cannot be restarted after stop()");
    }
    if (running_.exchange(true)) {
        return;
    }

    work_.emplace(boost::asio::make_work_guard(io_));
    // The timer is only ever touched from the coordinating thread
    boost::asio::post(io_, [this]() { schedule_sweep(); });

    thread_ = std::thread([this]() {
        try {
            io_.run();
        } catch (std::exception& e) {
            logging::error(std::string("Event bus loop terminated: ") + e.what());
        }
    });
    logging::info("Event bus started");
}

void EventBus::stop() {
    if (!running_.exchange(false)) {
        // Never started, or already stopped: only pooled handlers can be pending
        stopped_ = true;
        pool_.join();
        return;
    }
    stopped_ = true;

    // Queued events ahead of this handler still get delivered
    boost::asio::post(io_, [this]() {
        timer_.cancel();
        work_.reset();
    });
    if (thread_.joinable()) {
        thread_.join();
    }
    pool_.join();
    logging::info("Event bus stopped");
}

SubscriptionId EventBus::subscribe(const std::string& event_type, std::shared_ptr<Subscriber> subscriber) {
    if (!subscriber) {
        throw std::invalid_argument("subscribe: null subscriber for '" + event_type + "'");
    }
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    SubscriptionId id = next_id_++;
    subscribers_.push_back(Entry{id, event_type, std::move(subscriber), std::make_shared<DeliveryGate>()});
    return id;
}

SubscriptionId EventBus::subscribe(const std::string& event_type, std::string name, Callback callback,
                                   Delivery delivery) {
    std::shared_ptr<Subscriber> subscriber;
    if (delivery == Delivery::POOLED) {
        subscriber = std::make_shared<PooledSubscriber>(std::move(name), std::move(callback), pool_.get_executor());
    } else {
        subscriber = std::make_shared<InlineSubscriber>(std::move(name), std::move(callback));
    }
    return subscribe(event_type, std::move(subscriber));
}

bool EventBus::unsubscribe(SubscriptionId id) {
    Entry removed;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [id](const Entry& e) { return e.id == id; });
        if (it == subscribers_.end()) {
            return false;
        }
        removed = std::move(*it);
        subscribers_.erase(it);
    }

    // An emit() that copied this entry before the erase may be about to call it
    removed.gate->close();
    removed.subscriber->close();
    return true;
}

std::size_t EventBus::subscriber_count(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(),
                                                  [&](const Entry& e) { return e.event_type == event_type; }));
}

void EventBus::emit(const DeviceEvent& event) {
    std::vector<Entry> targets;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& entry : subscribers_) {
            if (entry.event_type == event.type || entry.event_type == WILDCARD) {
                targets.push_back(entry);
            }
        }
    }

    // No bus lock held here: a callback may subscribe, unsubscribe or emit
    for (const auto& target : targets) {
        GatePass pass(*target.gate);
        if (!pass) {
            continue; // unsubscribed since the copy
        }
        try {
            target.subscriber->deliver(event);
        } catch (std::exception& e) {
            logging::error("Subscriber '" + target.subscriber->name() + "' failed on " + event.type + ": " + e.what());
        }
    }
}

void EventBus::emit_nowait(DeviceEvent event) {
    if (stopped_) {
        logging::warn("Event bus stopped, dropping " + event.type + " for " + logging::quote(event.device_id));
        return;
    }
    boost::asio::post(io_, [this, event = std::move(event)]() {
        emit(event);
    });
}

void EventBus::register_heartbeat(const std::string& device_id) {
    register_heartbeat(device_id, Clock::now());
}

void EventBus::register_heartbeat(const std::string& device_id, Clock::time_point at) {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    Heartbeat& hb = heartbeats_[device_id];
    hb.last_seen = at;
    hb.misses = 0;
}

std::optional<Clock::time_point> EventBus::last_heartbeat(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    auto it = heartbeats_.find(device_id);
    if (it == heartbeats_.end()) {
        return std::nullopt;
    }
    return it->second.last_seen;
}

std::size_t EventBus::heartbeat_count() const {
    std::lock_guard<std::mutex> lock(heartbeat_mutex_);
    return heartbeats_.size();
}

std::size_t EventBus::sweep(Clock::time_point now) {
    std::vector<DeviceEvent> pending;
    std::size_t timed_out = 0;
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        for (auto it = heartbeats_.begin(); it != heartbeats_.end();) {
            auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - it->second.last_seen);
            if (silent <= options_.heartbeat_timeout) {
                ++it;
                continue;
            }

            ++timed_out;
            ++it->second.misses;
            pending.push_back(DeviceEvent{event_type::DEVICE_TIMEOUT, now,
                nlohmann::json{
                    {"last_seen", timeutil::format_time(it->second.last_seen)},
                    {"silent_ms", silent.count()},
                    {"consecutive", it->second.misses}
                },
                it->first});

            if (options_.evict_after > 0 && it->second.misses >= options_.evict_after) {
                pending.push_back(DeviceEvent{event_type::DEVICE_EVICTED, now,
                    nlohmann::json{
                        {"last_seen", timeutil::format_time(it->second.last_seen)},
                        {"consecutive", it->second.misses}
                    },
                    it->first});
                it = heartbeats_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& event : pending) {
        if (event.type == event_type::DEVICE_TIMEOUT) {
            logging::warn("Heartbeat timeout for " + logging::quote(event.device_id) + " (last seen " +
                          event.data.at("last_seen").get<std::string>() + ")");
        } else {
            logging::info("Dropping " + logging::quote(event.device_id) + " from heartbeat table");
        }
        emit(event);
    }
    return timed_out;
}

void EventBus::schedule_sweep() {
    timer_.expires_after(options_.heartbeat_tick);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_) {
            return;
        }
        sweep(Clock::now());
        schedule_sweep();
    });
}

} // namespace events
