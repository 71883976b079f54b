#include "kasa/common/TimeFormat.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace kasa::common {

namespace {

std::time_t toUtcTimeT(std::tm tm) {
#if defined(_WIN32)
    return _mkgmtime(&tm);
#else
    return timegm(&tm);
#endif
}

[[noreturn]] void throwMalformed(const std::string& iso) {
    throw std::runtime_error("Failed to parse ISO8601 timestamp: " + iso);
}

bool allDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

// Accepts "", "Z", "+HH", "+HHMM" and "+HH:MM" (either sign).
std::chrono::minutes utcOffset(const std::string& suffix, const std::string& iso) {
    if (suffix.empty() || suffix == "Z" || suffix == "z") {
        return std::chrono::minutes(0);
    }
    const char sign = suffix.front();
    if (sign != '+' && sign != '-') {
        throwMalformed(iso);
    }
    std::string digits = suffix.substr(1);
    if (digits.size() == 5 && digits[2] == ':') {
        digits.erase(2, 1);
    }
    if ((digits.size() != 2 && digits.size() != 4) || !allDigits(digits)) {
        throwMalformed(iso);
    }
    const int hours = std::stoi(digits.substr(0, 2));
    const int minutes = digits.size() == 4 ? std::stoi(digits.substr(2, 2)) : 0;
    if (hours > 23 || minutes > 59) {
        throwMalformed(iso);
    }
    const auto offset = std::chrono::hours(hours) + std::chrono::minutes(minutes);
    return sign == '-' ? -offset : offset;
}

}  // namespace

std::string timePointToIso(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::chrono::system_clock::time_point isoToTimePoint(const std::string& iso) {
    std::tm tm{};
    std::istringstream iss(iso);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throwMalformed(iso);
    }

    std::string rest;
    std::getline(iss, rest);
    std::size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        const std::size_t fractionStart = ++pos;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos])) != 0) {
            ++pos;
        }
        if (pos == fractionStart) {
            throwMalformed(iso);
        }
    }
    const auto offset = utcOffset(rest.substr(pos), iso);

    auto timeT = toUtcTimeT(tm);
    return std::chrono::system_clock::from_time_t(timeT) - offset;
}

std::string localTimestamp(std::chrono::system_clock::time_point tp) {
    auto tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace kasa::common
