#include "study_planner/types.h"
#include <cmath>
#include <cstdio>

namespace study_planner {

std::string format_clock(int minute_of_day) {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d", minute_of_day / 60, minute_of_day % 60);
    return buffer;
}

double round_to(double value, int decimals) {
    double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

std::string Session::start_time() const {
    return format_clock(start_minute);
}

std::string Session::end_time() const {
    return format_clock(start_minute + duration_minutes());
}

int Session::duration_minutes() const {
    return static_cast<int>(std::lround(duration_hours * 60.0));
}

} // namespace study_planner
