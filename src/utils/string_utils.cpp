/**
 * @file string_utils.cpp
 * @brief Implementation of string and formatting helpers
 *
 * Timestamps are always rendered and parsed in UTC; acquired images come
 * from appliances in arbitrary time zones and reports must be comparable.
 *
 * @date 2025
 */

#include "nsioc/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>

namespace nsioc {
namespace utils {

namespace {

using TimePoint = std::chrono::system_clock::time_point;

// Epoch seconds that survive conversion to the clock's native resolution
std::optional<TimePoint> FromEpochSeconds(long long seconds) {
    constexpr auto kMax = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::max()).count();
    constexpr auto kMin = std::chrono::duration_cast<std::chrono::seconds>(TimePoint::duration::min()).count();
    if (seconds >= kMax || seconds <= kMin) {
        return std::nullopt;
    }
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(seconds)));
}

} // anonymous namespace

// ============================================================================
// BASIC STRING MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream iss(str);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];
    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) {
        return true;
    }
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    return it != haystack.end();
}

// ============================================================================
// DISPLAY HELPERS
// ============================================================================

std::string StringUtils::Sanitize(const std::string& str) {
    std::string result;
    result.reserve(str.length());

    for (char c : str) {
        if (std::isprint(static_cast<unsigned char>(c))) {
            result += c;
        } else {
            result += '.';
        }
    }

    return result;
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

std::string StringUtils::FormatOctalMode(std::uint32_t mode) {
    std::ostringstream oss;
    oss << std::oct << std::setw(4) << std::setfill('0') << (mode & 07777);
    return oss.str();
}

// ============================================================================
// TIMESTAMPS
// ============================================================================

std::string StringUtils::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> StringUtils::ParseTimestamp(const std::string& text) {
    auto trimmed = Trim(text);

    static const std::regex epoch_regex(R"(^\d{1,12}$)");
    if (std::regex_match(trimmed, epoch_regex)) {
        return FromEpochSeconds(std::stoll(trimmed));
    }

    static const std::regex iso_regex(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2}):(\d{2})Z?)?$)");
    std::smatch match;
    if (!std::regex_match(trimmed, match, iso_regex)) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = std::stoi(match[1].str()) - 1900;
    tm.tm_mon = std::stoi(match[2].str()) - 1;
    tm.tm_mday = std::stoi(match[3].str());
    if (match[4].matched) {
        tm.tm_hour = std::stoi(match[4].str());
        tm.tm_min = std::stoi(match[5].str());
        tm.tm_sec = std::stoi(match[6].str());
    }
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    return FromEpochSeconds(static_cast<long long>(timegm(&tm)));
}

std::string StringUtils::FormatDuration(std::chrono::seconds duration) {
    auto total = duration.count();
    if (total < 0) {
        total = -total;
    }

    const long long days = total / 86400;
    const long long hours = (total % 86400) / 3600;
    const long long minutes = (total % 3600) / 60;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << (days == 1 ? " day" : " days");
        if (hours > 0) {
            oss << " " << hours << (hours == 1 ? " hour" : " hours");
        }
    } else if (hours > 0) {
        oss << hours << (hours == 1 ? " hour" : " hours");
        if (minutes > 0) {
            oss << " " << minutes << (minutes == 1 ? " minute" : " minutes");
        }
    } else if (minutes > 0) {
        oss << minutes << (minutes == 1 ? " minute" : " minutes");
    } else {
        oss << total << (total == 1 ? " second" : " seconds");
    }
    return oss.str();
}

} // namespace utils
} // namespace nsioc
