#include "config.hpp"
#include "log.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace config {

namespace {

template <typename T>
T unsigned_field(const nlohmann::json& j, const char* key, T fallback, T min_value = 0) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be an integer");
    }
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        if (value < static_cast<uint64_t>(min_value) ||
            value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            throw std::invalid_argument(std::string("config: '") + key + "' is out of range");
        }
        return static_cast<T>(value);
    }
    // Signed and negative
    throw std::invalid_argument(std::string("config: '") + key + "' must not be negative");
}

std::string string_field(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

} // namespace

ServerConfig from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config: top level must be a JSON object");
    }

    ServerConfig cfg;
    cfg.host = string_field(j, "host", cfg.host);
    cfg.port = unsigned_field<unsigned short>(j, "port", cfg.port);
    cfg.dest_dir = string_field(j, "dest_dir", cfg.dest_dir);
    cfg.registry_path = string_field(j, "registry_path", cfg.registry_path);
    cfg.telemetry_path = string_field(j, "telemetry_path", cfg.telemetry_path);
    cfg.chunk_size = unsigned_field<std::size_t>(j, "chunk_size", cfg.chunk_size, 1);
    cfg.max_header_bytes = unsigned_field<std::size_t>(j, "max_header_bytes", cfg.max_header_bytes, 1);
    cfg.read_timeout_seconds = unsigned_field<unsigned>(j, "read_timeout_seconds", cfg.read_timeout_seconds);
    cfg.heartbeat_timeout_seconds = unsigned_field<unsigned>(j, "heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds);
    cfg.heartbeat_tick_ms = unsigned_field<unsigned>(j, "heartbeat_tick_ms", cfg.heartbeat_tick_ms, 1);
    cfg.heartbeat_evict_after = unsigned_field<unsigned>(j, "heartbeat_evict_after", cfg.heartbeat_evict_after);
    cfg.event_workers = unsigned_field<unsigned>(j, "event_workers", cfg.event_workers, 1);
    cfg.topic_root = string_field(j, "topic_root", cfg.topic_root);
    cfg.log_level = string_field(j, "log_level", cfg.log_level);

    auto events = j.find("publish_events");
    if (events != j.end() && !events->is_null()) {
        if (!events->is_array()) {
            throw std::invalid_argument("config: 'publish_events' must be an array of strings");
        }
        cfg.publish_events.clear();
        for (const auto& e : *events) {
            if (!e.is_string()) {
                throw std::invalid_argument("config: 'publish_events' must be an array of strings");
            }
            cfg.publish_events.push_back(e.get<std::string>());
        }
    }

    // Validates the name; throws std::invalid_argument
    logging::parse_level(cfg.log_level);
    return cfg;
}

ServerConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (nlohmann::json::parse_error& e) {
        throw std::runtime_error("Config file " + path + " is not valid JSON: " + e.what());
    }
    return from_json(j);
}

nlohmann::json to_json(const ServerConfig& cfg) {
    return nlohmann::json{
        {"host", cfg.host},
        {"port", cfg.port},
        {"dest_dir", cfg.dest_dir},
        {"registry_path", cfg.registry_path},
        {"telemetry_path", cfg.telemetry_path},
        {"chunk_size", cfg.chunk_size},
        {"max_header_bytes", cfg.max_header_bytes},
        {"read_timeout_seconds", cfg.read_timeout_seconds},
        {"heartbeat_timeout_seconds", cfg.heartbeat_timeout_seconds},
        {"heartbeat_tick_ms", cfg.heartbeat_tick_ms},
        {"heartbeat_evict_after", cfg.heartbeat_evict_after},
        {"event_workers", cfg.event_workers},
        {"topic_root", cfg.topic_root},
        {"publish_events", cfg.publish_events},
        {"log_level", cfg.log_level}
    };
}

} // namespace config
