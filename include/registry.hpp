#pragma once

#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <optional>
#include <nlohmann/json.hpp>

namespace registry {

using Clock = std::chrono::system_clock;

struct DeviceRecord {
    std::string ip;
    std::string device_type;
    Clock::time_point last_seen; // millisecond precision
};

bool operator==(const DeviceRecord& a, const DeviceRecord& b);

// last_seen is stored as epoch seconds, the format older snapshots used
void to_json(nlohmann::json& j, const DeviceRecord& record);
void from_json(const nlohmann::json& j, DeviceRecord& record);

// Known devices keyed by serial, mirrored to a JSON snapshot file.
// All members are safe to call from any connection thread.
class DeviceRegistry {
public:
    explicit DeviceRegistry(std::string snapshot_path);

    DeviceRecord upsert(const std::string& serial, const std::string& ip,
                        const std::string& device_type, Clock::time_point now);

    std::map<std::string, DeviceRecord> snapshot() const;
    std::optional<DeviceRecord> find(const std::string& serial) const;
    std::size_t size() const;

    // Writes the whole map. Failures are logged and reported, never thrown.
    bool persist() const;

    // Replaces the in-memory map with the snapshot on disk. A missing or
    // corrupt file leaves the registry empty. Returns the number of devices.
    std::size_t load();

private:
    std::string path_;
    mutable std::mutex mutex_;
    mutable std::mutex persist_mutex_; // orders snapshot writes
    std::map<std::string, DeviceRecord> devices_;
};

struct TelemetryRecord {
    Clock::time_point timestamp;
    nlohmann::json payload;
};

void to_json(nlohmann::json& j, const TelemetryRecord& record);
void from_json(const nlohmann::json& j, TelemetryRecord& record);

// Latest telemetry payload per serial. Same persistence rules as DeviceRegistry.
class TelemetryStore {
public:
    explicit TelemetryStore(std::string snapshot_path);

    void record(const std::string& serial, const nlohmann::json& payload, Clock::time_point now);
    std::optional<TelemetryRecord> latest(const std::string& serial) const;
    std::map<std::string, TelemetryRecord> snapshot() const;

    bool persist() const;
    std::size_t load();

private:
    std::string path_;
    mutable std::mutex mutex_;
    mutable std::mutex persist_mutex_;
    std::map<std::string, TelemetryRecord> latest_;
};

} // namespace registry
