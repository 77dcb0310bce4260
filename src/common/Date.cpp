#include "common/Date.h"

#include <cctype>
#include <cstdio>

namespace gridlab {

namespace {
// Howard Hinnant's days_from_civil / civil_from_days
long long daysFromCivil(int y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2) {
        const bool leap = (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
        return leap ? 29 : 28;
    }
    return kDays[m - 1];
}
}

long long Date::toDays() const {
    return daysFromCivil(year, month, day);
}

Date Date::fromDays(long long z) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long y = static_cast<long long>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d));
}

int Date::weekday() const {
    // 1970-01-01 was a Thursday (3 with Monday = 0)
    const long long days = toDays();
    const long long wd = (days % 7 + 7 + 3) % 7;
    return static_cast<int>(wd);
}

std::string Date::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::optional<Date> Date::parse(const std::string& text) {
    // Accepts YYYY-MM-DD, YYYY/MM/DD and YYYYMMDD
    std::string digits;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (c != '-' && c != '/' && !std::isspace(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }
    if (digits.size() != 8) {
        return std::nullopt;
    }

    Date date(std::stoi(digits.substr(0, 4)),
              std::stoi(digits.substr(4, 2)),
              std::stoi(digits.substr(6, 2)));
    if (!date.isValid()) {
        return std::nullopt;
    }
    return date;
}

bool Date::isValid() const {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= daysInMonth(year, month);
}

} // namespace gridlab
