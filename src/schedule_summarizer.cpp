#include "study_planner/schedule_summarizer.h"
#include <cmath>
#include <map>

namespace study_planner {

namespace {

int minutes_of(double hours) {
    return static_cast<int>(std::lround(hours * 60.0));
}

} // namespace

ScheduleSummary ScheduleSummarizer::summarize(const std::vector<Day>& days) {
    ScheduleSummary summary;
    std::map<std::string, int> subject_minutes;
    int total_minutes = 0;

    // Sums are taken in minutes so exported minutes and hours reconcile exactly
    for (const auto& day : days) {
        total_minutes += minutes_of(day.total_hours);
        for (const auto& session : day.sessions) {
            subject_minutes[session.subject] += session.duration_minutes();
        }
    }

    for (const auto& [subject, minutes] : subject_minutes) {
        summary.hours_per_subject[subject] = minutes / 60.0;
    }
    summary.total_study_hours = total_minutes / 60.0;
    summary.study_days = static_cast<int>(days.size());
    return summary;
}

ScheduleSummary ScheduleSummarizer::summarize(const std::vector<Day>& days,
                                              const std::vector<WorkingTopic>& working,
                                              size_t total_topics) {
    ScheduleSummary summary = summarize(days);
    int working_minutes = 0;

    for (const auto& item : working) {
        working_minutes += item.total_minutes;
        // more than 0.1h consumed
        if (item.total_minutes - item.remaining_minutes > 6) {
            summary.topics_scheduled++;
        }
    }

    summary.total_topics = static_cast<int>(total_topics);
    summary.total_working_hours = working_minutes / 60.0;
    return summary;
}

} // namespace study_planner
