#include "time_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

namespace {

// Parses the designator after the seconds field: "", "Z", "+HH:MM", "-HHMM", optionally preceded by fractional seconds
long long parse_utc_offset_seconds(const std::string& timestamp) {
    size_t position = 19;
    if (position < timestamp.size() && timestamp[position] == '.') {
        ++position;
        while (position < timestamp.size() && std::isdigit(static_cast<unsigned char>(timestamp[position]))) {
            ++position;
        }
    }

    std::string designator = timestamp.substr(position);
    if (designator.empty() || designator == "Z") {
        return 0;
    }

    if (designator[0] != '+' && designator[0] != '-') {
        throw std::runtime_error("Invalid ISO 8601 timezone designator: " + timestamp);
    }
    std::string digits = designator.substr(1);
    if (digits.size() == 5 && digits[2] == ':') {
        digits.erase(2, 1);
    }
    if (digits.size() != 4 || !std::all_of(digits.begin(), digits.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        })) {
        throw std::runtime_error("Invalid ISO 8601 timezone designator: " + timestamp);
    }

    int hours = std::stoi(digits.substr(0, 2));
    int minutes = std::stoi(digits.substr(2, 2));
    if (hours > 23 || minutes > 59) {
        throw std::runtime_error("Invalid ISO 8601 timezone designator: " + timestamp);
    }
    long long offset_seconds = hours * 3600LL + minutes * 60LL;
    return designator[0] == '-' ? -offset_seconds : offset_seconds;
}

} // namespace

std::int64_t parse_iso_time_to_epoch_milliseconds(const std::string& timestamp) {
    if (timestamp.size() < 19) {
        throw std::runtime_error("Timestamp too short for ISO 8601: " + timestamp);
    }

    long long offset_seconds = parse_utc_offset_seconds(timestamp);

    // Fractional seconds are not significant for heartbeats
    std::tm parsed_time = {};
    std::istringstream ss(timestamp.substr(0, 19));
    ss >> std::get_time(&parsed_time, ISO_8601_WITHOUT_Z);
    if (ss.fail()) {
        throw std::runtime_error("Invalid ISO 8601 timestamp: " + timestamp);
    }

    std::time_t epoch_seconds = timegm(&parsed_time);
    return (static_cast<std::int64_t>(epoch_seconds) - offset_seconds) * MILLISECONDS_PER_SECOND;
}

std::string convert_epoch_milliseconds_to_iso(std::int64_t epoch_milliseconds) {
    std::time_t timestamp_seconds = static_cast<std::time_t>(epoch_milliseconds / MILLISECONDS_PER_SECOND);

    struct tm timeinfo;
    gmtime_r(&timestamp_seconds, &timeinfo);

    std::stringstream ss;
    ss << std::put_time(&timeinfo, ISO_8601_WITH_Z);
    return ss.str();
}

} // namespace TimeUtils
