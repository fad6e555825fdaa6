#include "study_planner/json_serializer.h"
#include <stdexcept>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace study_planner {

nlohmann::json JsonSerializer::topic_to_json(const Topic& topic) {
    return {
        {"topic_id", topic.id},
        {"subject", topic.subject},
        {"title", topic.title},
        {"page_range", {topic.start_page, topic.end_page}},
        {"estimated_hours", topic.estimated_hours},
        {"complexity", topic.complexity}
    };
}

nlohmann::json JsonSerializer::document_to_json(const Document& document) {
    return {
        {"doc_id", document.id},
        {"filename", document.filename},
        {"subject", document.subject},
        {"total_pages", document.total_pages},
        {"topics", document.topic_ids}
    };
}

nlohmann::json JsonSerializer::session_to_json(const Session& session) {
    return {
        {"topic_id", session.topic_id},
        {"subject", session.subject},
        {"title", session.title},
        {"start_time", session.start_time()},
        {"duration_hours", session.duration_hours},
        {"complexity", session.complexity}
    };
}

nlohmann::json JsonSerializer::day_to_json(const Day& day) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& session : day.sessions) {
        sessions.push_back(session_to_json(session));
    }
    return {
        {"date", day.date},
        {"day_of_week", day.weekday},
        {"sessions", sessions},
        {"total_hours", day.total_hours}
    };
}

nlohmann::json JsonSerializer::summary_to_json(const ScheduleSummary& summary) {
    return {
        {"total_study_hours", summary.total_study_hours},
        {"study_days", summary.study_days},
        {"hours_per_subject", summary.hours_per_subject},
        {"topics_scheduled", summary.topics_scheduled},
        {"total_topics", summary.total_topics},
        {"scale_factor", summary.scale_factor},
        {"total_demand_hours", summary.total_demand_hours},
        {"total_capacity_hours", summary.total_capacity_hours},
        {"total_working_hours", summary.total_working_hours},
        {"policy", summary.policy}
    };
}

nlohmann::json JsonSerializer::schedule_to_json(const Schedule& schedule) {
    nlohmann::json days = nlohmann::json::array();
    for (const auto& day : schedule.days) {
        days.push_back(day_to_json(day));
    }
    return {
        {"schedule_id", schedule.id},
        {"start_date", schedule.start_date},
        {"end_date", schedule.end_date},
        {"days", days},
        {"summary", summary_to_json(schedule.summary)}
    };
}

nlohmann::json JsonSerializer::exam_to_json(const Exam& exam) {
    return {
        {"subject", exam.subject},
        {"exam_date", exam.exam_date}
    };
}

nlohmann::json JsonSerializer::profile_to_json(const LearnerProfile& profile) {
    return {
        {"session_profile", {
            {"max_daily_deep_hours", profile.max_daily_deep_hours},
            {"max_session_time", profile.max_session_time}
        }},
        {"chronotype", {
            {"peak_windows", profile.peak_windows}
        }},
        {"subject_confidence", profile.subject_confidence}
    };
}

LearnerProfile JsonSerializer::profile_from_json(const nlohmann::json& json) {
    LearnerProfile profile;
    if (!json.is_object()) {
        return profile;
    }

    const nlohmann::json& session = json.contains("session_profile") ? json["session_profile"] : json;
    profile.max_daily_deep_hours = session.value("max_daily_deep_hours", profile.max_daily_deep_hours);
    profile.max_session_time = session.value("max_session_time", profile.max_session_time);

    const nlohmann::json& chronotype = json.contains("chronotype") ? json["chronotype"] : json;
    if (chronotype.contains("peak_windows")) {
        profile.peak_windows = chronotype["peak_windows"].get<std::vector<std::string>>();
    }

    if (json.contains("subject_confidence")) {
        for (const auto& [subject, confidence] : json["subject_confidence"].items()) {
            profile.subject_confidence[subject] = std::max(0.0, std::min(1.0, confidence.get<double>()));
        }
    }

    return profile;
}

LearnerProfile JsonSerializer::load_profile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open profile: " + path);
    }
    return profile_from_json(nlohmann::json::parse(file));
}

std::vector<std::string> JsonSerializer::topic_preview(const std::vector<Topic>& topics, size_t max_items) {
    std::vector<std::string> preview;
    for (size_t i = 0; i < topics.size() && i < max_items; ++i) {
        std::ostringstream line;
        line << topics[i].title << " (" << topics[i].estimated_hours << "h)";
        preview.push_back(line.str());
    }
    return preview;
}

} // namespace study_planner
