#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace study_planner {

// A structural unit detected inside a source document. Pages are 1-based.
struct Section {
    std::string title;
    int page;
};

struct OutlineEntry {
    int level;          // 1 = top level
    std::string title;
    int page;           // 1-based, 0 when the entry does not resolve to a page
};

struct Topic {
    std::string id;
    std::string subject;
    std::string title;
    int start_page;
    int end_page;
    double estimated_hours;
    double complexity;
};

struct Document {
    std::string id;
    std::string filename;
    std::string subject;
    int total_pages;
    std::vector<std::string> topic_ids;
};

struct LearnerProfile {
    double max_daily_deep_hours = 6.0;
    double max_session_time = 1.5;
    std::vector<std::string> peak_windows = {"17:00"};
    std::map<std::string, double> subject_confidence;
};

struct Exam {
    std::string subject;
    std::string exam_date;
};

struct Session {
    std::string topic_id;
    std::string subject;
    std::string title;
    int start_minute;       // minutes since midnight
    double duration_hours;
    double complexity;

    std::string start_time() const;
    std::string end_time() const;
    int duration_minutes() const;
};

struct Day {
    std::string date;
    std::string weekday;
    std::vector<Session> sessions;
    double total_hours = 0.0;
};

struct ScheduleSummary {
    double total_study_hours = 0.0;
    int study_days = 0;
    std::map<std::string, double> hours_per_subject;
    int topics_scheduled = 0;
    int total_topics = 0;

    // Scaling inputs, kept so callers can reconstruct the working budget
    double scale_factor = 1.0;
    double total_demand_hours = 0.0;
    double total_capacity_hours = 0.0;
    double total_working_hours = 0.0;
    std::string policy;
};

struct Schedule {
    std::string id;
    std::string start_date;
    std::string end_date;
    std::vector<Day> days;
    ScheduleSummary summary;
};

// Allocation-time copy of a Topic, counted in whole minutes
struct WorkingTopic {
    const Topic* topic;
    int total_minutes;
    int remaining_minutes;

    double total_hours() const { return total_minutes / 60.0; }
    double remaining_hours() const { return remaining_minutes / 60.0; }
};

// "HH:MM" for a minute-of-day value
std::string format_clock(int minute_of_day);

// Rounds half away from zero to the given number of decimals
double round_to(double value, int decimals);

} // namespace study_planner
