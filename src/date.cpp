#include "study_planner/date.h"
#include "study_planner/errors.h"
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace study_planner {

namespace {

// Howard Hinnant's civil calendar conversions
long days_from_civil(int y, int m, int d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long>(doe) - 719468;
}

void civil_from_days(long z, int& y, int& m, int& d) {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(static_cast<long>(yoe) + era * 400 + (m <= 2));
}

bool is_leap(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int parse_digits(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

const char* const kWeekdays[] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"
};

} // namespace

Date::Date(int year, int month, int day) : year_(year), month_(month), day_(day) {
    if (!is_valid(year, month, day)) {
        throw InvalidDateError("Invalid date: " + std::to_string(year) + "-" +
                               std::to_string(month) + "-" + std::to_string(day));
    }
}

bool Date::is_valid(int year, int month, int day) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    int limit = days_in_month[month - 1];
    if (month == 2 && is_leap(year)) {
        limit = 29;
    }
    return day <= limit;
}

Date Date::parse(const std::string& text) {
    bool well_formed = text.size() == 10 && text[4] == '-' && text[7] == '-';
    for (size_t i = 0; well_formed && i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        well_formed = std::isdigit(static_cast<unsigned char>(text[i])) != 0;
    }
    if (!well_formed) {
        throw InvalidDateError("Invalid date '" + text + "', use YYYY-MM-DD format");
    }

    int year = parse_digits(text, 0, 4);
    int month = parse_digits(text, 5, 2);
    int day = parse_digits(text, 8, 2);
    if (!is_valid(year, month, day)) {
        throw InvalidDateError("Invalid date '" + text + "'");
    }
    return Date(year, month, day);
}

Date Date::today() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    return Date(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
}

long Date::days_since_epoch() const {
    return days_from_civil(year_, month_, day_);
}

Date Date::from_days_since_epoch(long days) {
    int y, m, d;
    civil_from_days(days, y, m, d);
    return Date(y, m, d);
}

Date Date::add_days(long days) const {
    return from_days_since_epoch(days_since_epoch() + days);
}

long Date::days_until(const Date& other) const {
    return other.days_since_epoch() - days_since_epoch();
}

std::string Date::weekday_name() const {
    // 1970-01-01 was a Thursday
    long index = (days_since_epoch() + 3) % 7;
    if (index < 0) index += 7;
    return kWeekdays[index];
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year_, month_, day_);
    return buffer;
}

} // namespace study_planner
