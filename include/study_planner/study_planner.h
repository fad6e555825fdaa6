#pragma once

#include "study_planner/allocator.h"
#include "study_planner/document_loader.h"
#include "study_planner/planner_session.h"
#include "study_planner/schedule_exporter.h"
#include "study_planner/structure_extractor.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace study_planner {

struct PlannerOptions {
    LoadOptions load;
    SegmenterOptions segmenter;
    AllocatorOptions allocator;
};

// Collaborator-facing operations. Every call returns a result object with
// "status" set to "success" or "error"; failures leave the session intact.
class StudyPlanner {
public:
    explicit StudyPlanner(const PlannerOptions& options = PlannerOptions{});

    // Loads a PDF (uploaded blob or path), segments it and appends Topics
    nlohmann::json segment_and_weight(PlannerSession& session,
                                      const std::string& file_path,
                                      const std::string& subject);

    nlohmann::json segment_and_weight(PlannerSession& session,
                                      const PageSource& document,
                                      const std::string& subject);

    nlohmann::json upload_file(PlannerSession& session,
                               const std::string& filename,
                               std::vector<unsigned char> data);

    nlohmann::json reset_topics(PlannerSession& session);
    nlohmann::json list_topics(const PlannerSession& session) const;

    nlohmann::json allocate(PlannerSession& session,
                            const std::string& start_date,
                            const std::string& end_date) const;

    nlohmann::json export_schedule(const PlannerSession& session, const std::string& format) const;

    nlohmann::json add_or_update_exam(PlannerSession& session,
                                      const std::string& subject,
                                      const std::string& exam_date);

    nlohmann::json set_profile(PlannerSession& session, const LearnerProfile& profile);
    nlohmann::json get_profile(const PlannerSession& session) const;
    nlohmann::json update_subject_confidence(PlannerSession& session,
                                             const std::string& subject,
                                             double confidence);

    const PlannerOptions& options() const { return options_; }

    static nlohmann::json error_result(const std::string& kind, const std::string& message);

private:
    PlannerOptions options_;
    DocumentLoader loader_;
};

} // namespace study_planner
