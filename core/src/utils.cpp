#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow
#include <cctype>     // For std::isdigit
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // Plain dates are taken as midnight UTC
        if (iso_string.size() == 10) {
            ss >> std::get_time(&tm, "%Y-%m-%d");
            if (ss.fail()) {
                throw std::runtime_error("Failed to parse date: " + iso_string);
            }
            #ifdef _WIN32
                time_t date_tt = _mkgmtime(&tm);
            #else
                time_t date_tt = timegm(&tm);
            #endif
            if (date_tt == (time_t)-1) {
                throw std::runtime_error("Failed to convert parsed date to UTC epoch seconds: " + iso_string);
            }
            return std::chrono::system_clock::from_time_t(date_tt);
        }

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Manually parse optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            int digit_count = 0;
            while (std::isdigit(ss.peek()) && digit_count < 9) { // Limit precision to nanoseconds
                digits += static_cast<char>(ss.get());
                digit_count++;
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Manually parse timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration = std::chrono::seconds(0);
        char sign_or_z = 0;

        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                     throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        } else {
             throw std::runtime_error("Timestamp missing or invalid timezone offset/indicator: " + iso_string);
        }

        // 4. Convert tm to time_t, interpreting the fields as UTC
        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
             throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::duration<double>(fractional_seconds));

        // Local wall time minus its offset gives UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);

        std::tm time_tm;
        #ifdef _WIN32
            gmtime_s(&time_tm, &tt);
        #elif defined(__unix__) || defined(__APPLE__)
            gmtime_r(&tt, &time_tm);
        #else
            std::tm* temp_tm = std::gmtime(&tt);
            if (temp_tm) {
                time_tm = *temp_tm;
            } else {
                throw std::runtime_error("Failed to get gmtime representation for timestamp.");
            }
        #endif

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    long long daysBetween(const Timestamp& from, const Timestamp& to) {
        return std::chrono::duration_cast<std::chrono::hours>(to - from).count() / 24;
    }

} // namespace utils
} // namespace core
