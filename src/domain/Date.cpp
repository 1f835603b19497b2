#include "domain/Date.hpp"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace domain {
namespace {

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

Date fromTm(const std::tm& tm) {
    return Date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
}

std::optional<Date> parseWithFormat(std::string_view text, const char* format, std::size_t expectedLength) {
    if (text.size() != expectedLength) {
        return std::nullopt;
    }
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch)) && ch != '-') {
            return std::nullopt;
        }
    }

    std::tm tm{};
    std::istringstream input{std::string{text}};
    input >> std::get_time(&tm, format);
    if (input.fail()) {
        return std::nullopt;
    }

    // Round-trip through timegm to reject dates like 2020-02-31.
    const int year = tm.tm_year;
    const int month = tm.tm_mon;
    const int day = tm.tm_mday;
    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    const auto normalized = safeGmtime(raw);
    if (normalized.tm_year != year || normalized.tm_mon != month || normalized.tm_mday != day) {
        return std::nullopt;
    }
    return fromTm(normalized);
}

}  // namespace

std::optional<Date> Date::fromIso(std::string_view text) {
    return parseWithFormat(text, "%Y-%m-%d", 10);
}

std::optional<Date> Date::fromCompact(std::string_view text) {
    if (text.size() != 8) {
        return std::nullopt;
    }
    std::string iso;
    iso.reserve(10);
    iso.append(text.substr(0, 4)).append("-").append(text.substr(4, 2)).append("-").append(text.substr(6, 2));
    return fromIso(iso);
}

Date Date::today() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fromTm(safeGmtime(now));
}

std::string Date::toIso() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::string Date::toCompact() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d%02d%02d", year, month, day);
    return buffer;
}

Date Date::addDays(int days) const {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day + days;
    tm.tm_hour = 12;
    tm.tm_isdst = 0;
    return fromTm(safeGmtime(timegm_compat(&tm)));
}

}  // namespace domain
