#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        tt -= 1;
    }

    std::tm tm{};
    gmtime_r(&tt, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return ss.str();
}

std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string) {
    std::tm tm = {};
    std::stringstream ss(iso_string);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    // Handle fractional seconds (milliseconds precision)
    int millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits.push_back(static_cast<char>(ss.get()));
        }
        digits.resize(3, '0');
        millis = std::stoi(digits.substr(0, 3));
    }

    // Timestamps are always UTC; timegm avoids the local-time shift of mktime
    auto time = std::chrono::system_clock::from_time_t(timegm(&tm));
    time += std::chrono::milliseconds(millis);
    return time;
}

double clamp_value(double value, double lo, double hi) {
    return std::max(lo, std::min(hi, value));
}
