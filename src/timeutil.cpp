#include "timeutil.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <cctype>
#include <ctime>

namespace timeutil {

std::string format_time(std::chrono::system_clock::time_point tp) {
    auto ms_total = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    auto secs = static_cast<std::time_t>(ms_total / 1000);
    auto ms = ms_total % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

std::chrono::system_clock::time_point parse_time(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("not an ISO-8601 timestamp: " + text);
    }

    int ms = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        if (digits.empty()) {
            throw std::invalid_argument("empty fraction in timestamp: " + text);
        }
        digits = (digits + "000").substr(0, 3);
        ms = std::stoi(digits);
    }

    std::time_t secs = timegm(&tm);
    return std::chrono::system_clock::from_time_t(secs) + std::chrono::milliseconds(ms);
}

} // namespace timeutil
