#include "log.hpp"
#include "timeutil.hpp"
#include <iostream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace logging {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::INFO)};
std::mutex g_write_mutex;

const char* level_tag(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO: return "INFO ";
        case Level::WARN: return "WARN ";
        case Level::ERROR: return "ERROR";
    }
    return "?????";
}

} // namespace

Level parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

void set_level(Level level) {
    g_level = static_cast<int>(level);
}

Level level() {
    return static_cast<Level>(g_level.load());
}

void init(Level fallback) {
    if (const char* env = std::getenv("FIELDLINK_LOG_LEVEL")) {
        try {
            set_level(parse_level(env));
            return;
        } catch (std::exception& e) {
            std::cerr << "Ignoring FIELDLINK_LOG_LEVEL: " << e.what() << "\n";
        }
    }
    set_level(fallback);
}

void write(Level lvl, const std::string& message) {
    if (static_cast<int>(lvl) < g_level.load()) {
        return;
    }
    std::string line = timeutil::format_time(std::chrono::system_clock::now()) + " [" + level_tag(lvl) + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(g_write_mutex);
    if (lvl >= Level::WARN) {
        std::cerr << line << std::flush;
    } else {
        std::cout << line << std::flush;
    }
}

std::string quote(const std::string& text) {
    return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace logging
