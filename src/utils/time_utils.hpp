#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <cstdint>
#include <ctime>

namespace TimeUtils {

constexpr long long MILLISECONDS_PER_SECOND = 1000;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* ISO_8601_WITHOUT_Z = "%Y-%m-%dT%H:%M:%S";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

std::string get_current_human_readable_time();

// Accepts "2024-01-31T12:00:00Z", offsets are dropped. Throws std::runtime_error if unparseable.
std::int64_t parse_iso_time_to_epoch_milliseconds(const std::string& timestamp);

std::string convert_epoch_milliseconds_to_iso(std::int64_t epoch_milliseconds);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
