#pragma once

#include <string>

namespace logging {

enum class Level {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Parses "debug", "info", "warn"/"warning", "error" (any case).
// Throws std::invalid_argument on anything else.
Level parse_level(const std::string& name);

void set_level(Level level);
Level level();

// Applies FIELDLINK_LOG_LEVEL if it is set, otherwise `fallback`.
void init(Level fallback);

void write(Level level, const std::string& message);

// Renders peer-supplied text as a JSON string literal, so control characters
// and stray bytes cannot break a log line apart.
std::string quote(const std::string& text);

inline void debug(const std::string& message) { write(Level::DEBUG, message); }
inline void info(const std::string& message) { write(Level::INFO, message); }
inline void warn(const std::string& message) { write(Level::WARN, message); }
inline void error(const std::string& message) { write(Level::ERROR, message); }

} // namespace logging
