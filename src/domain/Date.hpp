#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace domain {

// Civil UTC date. Archive directories are named after these.
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    static std::optional<Date> fromIso(std::string_view text);      // YYYY-MM-DD
    static std::optional<Date> fromCompact(std::string_view text);  // YYYYMMDD
    static Date today();

    std::string toIso() const;
    std::string toCompact() const;
    Date addDays(int days) const;
};

inline bool operator==(const Date& lhs, const Date& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

inline bool operator!=(const Date& lhs, const Date& rhs) { return !(lhs == rhs); }

inline bool operator<(const Date& lhs, const Date& rhs) {
    if (lhs.year != rhs.year) {
        return lhs.year < rhs.year;
    }
    if (lhs.month != rhs.month) {
        return lhs.month < rhs.month;
    }
    return lhs.day < rhs.day;
}

inline bool operator>(const Date& lhs, const Date& rhs) { return rhs < lhs; }
inline bool operator<=(const Date& lhs, const Date& rhs) { return !(rhs < lhs); }
inline bool operator>=(const Date& lhs, const Date& rhs) { return !(lhs < rhs); }

inline std::ostream& operator<<(std::ostream& out, const Date& date) { return out << date.toIso(); }

}  // namespace domain
