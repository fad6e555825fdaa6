#pragma once

#include "study_planner/types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace study_planner {

// nlohmann/json views of the data model used in operation results.
class JsonSerializer {
public:
    static nlohmann::json topic_to_json(const Topic& topic);
    static nlohmann::json document_to_json(const Document& document);
    static nlohmann::json session_to_json(const Session& session);
    static nlohmann::json day_to_json(const Day& day);
    static nlohmann::json summary_to_json(const ScheduleSummary& summary);
    static nlohmann::json schedule_to_json(const Schedule& schedule);
    static nlohmann::json exam_to_json(const Exam& exam);

    static nlohmann::json profile_to_json(const LearnerProfile& profile);

    // Accepts both the flat form and {"session_profile": {...},
    // "chronotype": {...}}; missing keys keep their defaults
    static LearnerProfile profile_from_json(const nlohmann::json& json);
    static LearnerProfile load_profile(const std::string& path);

    // "Title (2.5h)" lines for the first max_items topics
    static std::vector<std::string> topic_preview(const std::vector<Topic>& topics, size_t max_items = 15);
};

} // namespace study_planner
