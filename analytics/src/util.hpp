#pragma once

#include <string>
#include <chrono>
#include <optional>

// Format a time_point to an ISO8601 UTC string, e.g. 2024-01-15T09:30:00.000Z
std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// Parse an ISO8601 UTC string; empty when the text is not a timestamp
std::optional<std::chrono::system_clock::time_point> parse_iso8601(const std::string& iso_string);

// Clamp into [lo, hi]
double clamp_value(double value, double lo, double hi);
