#pragma once

#include <optional>
#include <string>

namespace gridlab {

// Calendar date (proleptic Gregorian), daily resolution
struct Date {
    int year;
    int month;
    int day;

    Date() : year(1970), month(1), day(1) {}
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Days since 1970-01-01
    long long toDays() const;
    static Date fromDays(long long days);

    // 0 = Monday ... 6 = Sunday
    int weekday() const;
    bool isWeekday() const { return weekday() < 5; }
    bool sameMonth(const Date& other) const {
        return year == other.year && month == other.month;
    }

    Date addDays(long long n) const { return fromDays(toDays() + n); }

    // YYYY-MM-DD
    std::string toString() const;
    static std::optional<Date> parse(const std::string& text);

    bool isValid() const;

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

} // namespace gridlab
