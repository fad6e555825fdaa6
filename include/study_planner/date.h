#pragma once

#include <string>

namespace study_planner {

// Plain proleptic Gregorian calendar date, no time zone.
class Date {
public:
    Date() = default;
    Date(int year, int month, int day);

    // Strict "YYYY-MM-DD". Throws InvalidDateError.
    static Date parse(const std::string& text);
    static Date today();
    static bool is_valid(int year, int month, int day);

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }

    // Days since 1970-01-01
    long days_since_epoch() const;
    static Date from_days_since_epoch(long days);

    Date add_days(long days) const;
    long days_until(const Date& other) const;

    // "Monday" .. "Sunday"
    std::string weekday_name() const;
    std::string to_string() const;

    bool operator==(const Date& other) const { return days_since_epoch() == other.days_since_epoch(); }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const { return days_since_epoch() < other.days_since_epoch(); }
    bool operator<=(const Date& other) const { return !(other < *this); }

private:
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;
};

} // namespace study_planner
