#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short port = 5000;

    std::string dest_dir = "received_files";
    std::string registry_path = "iot_devices.json";
    std::string telemetry_path = "sensor_data.json";

    std::size_t chunk_size = 4096;
    std::size_t max_header_bytes = 64 * 1024;
    unsigned read_timeout_seconds = 30; // 0 disables

    unsigned heartbeat_timeout_seconds = 10;
    unsigned heartbeat_tick_ms = 1000;
    unsigned heartbeat_evict_after = 0; // 0 = report forever
    unsigned event_workers = 2;

    std::string topic_root = "fieldlink";
    std::vector<std::string> publish_events = {
        "device_connected", "data_received", "transfer_complete", "device_timeout"
    };

    std::string log_level = "info";
};

// Every key is optional. Throws std::invalid_argument naming the offending
// key when a value has the wrong type or is out of range.
ServerConfig from_json(const nlohmann::json& j);

// Throws std::runtime_error if the file cannot be read or is not JSON.
ServerConfig load_config(const std::string& path);

nlohmann::json to_json(const ServerConfig& cfg);

} // namespace config
