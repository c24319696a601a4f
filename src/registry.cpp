#include "registry.hpp"
#include "log.hpp"
#include "timeutil.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cmath>

namespace registry {

namespace {

Clock::time_point truncate_ms(Clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
}

// Write to a sibling temp file and rename it over the target so readers never
// see a half-written snapshot.
bool write_snapshot(const std::string& path, const nlohmann::json& j) {
    try {
        std::filesystem::path target(path);
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) {
                logging::warn("Could not open " + tmp + " for writing");
                return false;
            }
            out << j.dump(2) << "\n";
            out.flush();
            if (!out) {
                logging::warn("Could not write snapshot " + tmp);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, target, ec);
        if (ec) {
            logging::warn("Could not replace snapshot " + path + ": " + ec.message());
            return false;
        }
        return true;
    } catch (std::exception& e) {
        logging::warn("Could not save " + path + ": " + e.what());
        return false;
    }
}

std::optional<nlohmann::json> read_snapshot(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        logging::warn("Could not open snapshot " + path);
        return std::nullopt;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            logging::warn("Snapshot " + path + " is not a JSON object, ignoring it");
            return std::nullopt;
        }
        return j;
    } catch (nlohmann::json::parse_error& e) {
        logging::warn("Snapshot " + path + " is corrupt, ignoring it: " + e.what());
        return std::nullopt;
    }
}

} // namespace

bool operator==(const DeviceRecord& a, const DeviceRecord& b) {
    return a.ip == b.ip && a.device_type == b.device_type && a.last_seen == b.last_seen;
}

void to_json(nlohmann::json& j, const DeviceRecord& record) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(record.last_seen.time_since_epoch()).count();
    j = nlohmann::json{
        {"ip", record.ip},
        {"device_type", record.device_type},
        {"last_seen", static_cast<double>(ms) / 1000.0}
    };
}

void from_json(const nlohmann::json& j, DeviceRecord& record) {
    record.ip = j.at("ip").get<std::string>();
    record.device_type = j.value("device_type", std::string("UNKNOWN"));
    double seconds = j.at("last_seen").get<double>();
    auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    record.last_seen = Clock::time_point(std::chrono::milliseconds(ms));
}

void to_json(nlohmann::json& j, const TelemetryRecord& record) {
    j = nlohmann::json{
        {"timestamp", timeutil::format_time(record.timestamp)},
        {"payload", record.payload}
    };
}

void from_json(const nlohmann::json& j, TelemetryRecord& record) {
    record.timestamp = timeutil::parse_time(j.at("timestamp").get<std::string>());
    record.payload = j.value("payload", nlohmann::json::object());
}

// ─── DeviceRegistry ─────────────────────────────────────────────────────────

DeviceRegistry::DeviceRegistry(std::string snapshot_path)
    : path_(std::move(snapshot_path)) {}

DeviceRecord DeviceRegistry::upsert(const std::string& serial, const std::string& ip,
                                    const std::string& device_type, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceRecord& record = devices_[serial];
    record.ip = ip;
    record.device_type = device_type;
    // Clock skew must not move a device backwards
    auto seen = truncate_ms(now);
    if (seen > record.last_seen) {
        record.last_seen = seen;
    }
    return record;
}

std::map<std::string, DeviceRecord> DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_;
}

std::optional<DeviceRecord> DeviceRegistry::find(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(serial);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

bool DeviceRegistry::persist() const {
    std::lock_guard<std::mutex> write_lock(persist_mutex_);
    nlohmann::json j = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [serial, record] : devices_) {
            j[serial] = record;
        }
    }
    return write_snapshot(path_, j);
}

std::size_t DeviceRegistry::load() {
    std::map<std::string, DeviceRecord> loaded;
    if (auto j = read_snapshot(path_)) {
        for (auto it = j->begin(); it != j->end(); ++it) {
            try {
                loaded[it.key()] = it.value().get<DeviceRecord>();
            } catch (std::exception& e) {
                logging::warn("Skipping malformed device entry " + logging::quote(it.key()) + ": " + e.what());
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(loaded);
    return devices_.size();
}

// ─── TelemetryStore ─────────────────────────────────────────────────────────

TelemetryStore::TelemetryStore(std::string snapshot_path)
    : path_(std::move(snapshot_path)) {}

void TelemetryStore::record(const std::string& serial, const nlohmann::json& payload, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_[serial] = TelemetryRecord{truncate_ms(now), payload};
}

std::optional<TelemetryRecord> TelemetryStore::latest(const std::string& serial) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find(serial);
    if (it == latest_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, TelemetryRecord> TelemetryStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

bool TelemetryStore::persist() const {
    std::lock_guard<std::mutex> write_lock(persist_mutex_);
    nlohmann::json j = nlohmann::json::object();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [serial, record] : latest_) {
            j[serial] = record;
        }
    }
    return write_snapshot(path_, j);
}

std::size_t TelemetryStore::load() {
    std::map<std::string, TelemetryRecord> loaded;
    if (auto j = read_snapshot(path_)) {
        for (auto it = j->begin(); it != j->end(); ++it) {
            try {
                loaded[it.key()] = it.value().get<TelemetryRecord>();
            } catch (std::exception& e) {
                logging::warn("Skipping malformed telemetry entry " + logging::quote(it.key()) + ": " + e.what());
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = std::move(loaded);
    return latest_.size();
}

} // namespace registry
