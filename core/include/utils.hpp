#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Format a Timestamp as ISO 8601 UTC, e.g. 2024-03-01T00:00:00Z
    std::string timestampToString(const Timestamp& ts);

    // Parse ISO 8601 with a 'Z' or +HH:MM/-HH:MM offset, or a plain YYYY-MM-DD date (midnight UTC)
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Whole days between two timestamps (used for calendar holding periods in logs)
    long long daysBetween(const Timestamp& from, const Timestamp& to);

} // namespace utils
} // namespace core
