#include "study_planner/study_planner.h"
#include "study_planner/date.h"
#include "study_planner/errors.h"
#include "study_planner/json_serializer.h"
#include "study_planner/topic_factory.h"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <map>
#include <numeric>
#include <stdexcept>

namespace study_planner {

namespace {

double sum_hours(const std::vector<Topic>& topics) {
    return std::accumulate(topics.begin(), topics.end(), 0.0,
                           [](double sum, const Topic& t) { return sum + t.estimated_hours; });
}

std::string format_hours(double hours) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", hours);
    return buffer;
}

} // namespace

StudyPlanner::StudyPlanner(const PlannerOptions& options)
    : options_(options), loader_(options.load) {}

nlohmann::json StudyPlanner::error_result(const std::string& kind, const std::string& message) {
    return {
        {"status", "error"},
        {"error", kind},
        {"message", message}
    };
}

nlohmann::json StudyPlanner::segment_and_weight(PlannerSession& session,
                                                const std::string& file_path,
                                                const std::string& subject) {
    try {
        LoadedDocument document = loader_.load(file_path, session.uploaded_files);
        return segment_and_weight(session, document, subject);
    } catch (const PlannerError& e) {
        std::cerr << "[StudyPlanner::segment_and_weight] " << e.kind() << ": " << e.what() << std::endl;
        return error_result(e.kind(), e.what());
    }
}

nlohmann::json StudyPlanner::segment_and_weight(PlannerSession& session,
                                                const PageSource& document,
                                                const std::string& subject) {
    const std::string filename = document.filename();
    if (!DocumentLoader::is_supported(filename)) {
        UnsupportedFileError error(filename);
        return error_result(error.kind(), error.what());
    }

    const int total_pages = document.page_count();
    DocumentStructureExtractor extractor(options_.segmenter);
    DocumentStructure structure = extractor.extract(document);
    std::vector<std::string> samples = extractor.sample_sections(document, structure.sections);

    TopicFactory factory(options_.segmenter);
    std::vector<Topic> topics = factory.create_topics(structure.sections, samples, subject, filename, total_pages);

    Document record;
    record.id = TopicFactory::document_fingerprint(filename, total_pages);
    record.filename = filename;
    record.subject = subject;
    record.total_pages = total_pages;
    for (const auto& topic : topics) {
        record.topic_ids.push_back(topic.id);
    }

    double total_hours = sum_hours(topics);
    if (options_.load.verbose) {
        std::cout << "[StudyPlanner::segment_and_weight] " << filename << ": "
                  << DocumentStructureExtractor::tier_name(structure.tier) << ", "
                  << topics.size() << " topics, " << format_hours(total_hours) << "h" << std::endl;
    }
    nlohmann::json result = {
        {"status", "success"},
        {"subject", subject},
        {"filename", filename},
        {"doc_id", record.id},
        {"pages", total_pages},
        {"structure", DocumentStructureExtractor::tier_name(structure.tier)},
        {"topics_created", topics.size()},
        {"total_hours", round_to(total_hours, 1)},
        {"topics", JsonSerializer::topic_preview(topics)},
        {"message", "Found " + std::to_string(topics.size()) + " topics requiring " +
                    format_hours(total_hours) + " hours total"}
    };

    session.topics.insert(session.topics.end(), topics.begin(), topics.end());
    session.upsert_document(std::move(record));

    return result;
}

nlohmann::json StudyPlanner::upload_file(PlannerSession& session,
                                         const std::string& filename,
                                         std::vector<unsigned char> data) {
    std::string name = DocumentLoader::bare_filename(filename);
    if (!DocumentLoader::is_supported(name)) {
        UnsupportedFileError error(name);
        return error_result(error.kind(), error.what());
    }

    size_t bytes = data.size();
    session.uploaded_files[name] = std::move(data);
    return {
        {"status", "success"},
        {"filename", name},
        {"bytes", bytes}
    };
}

nlohmann::json StudyPlanner::reset_topics(PlannerSession& session) {
    session.topics.clear();
    session.documents.clear();
    return {
        {"status", "success"},
        {"message", "All topics cleared"}
    };
}

nlohmann::json StudyPlanner::list_topics(const PlannerSession& session) const {
    nlohmann::json by_subject = nlohmann::json::object();
    std::map<std::string, double> subject_hours;

    for (const auto& topic : session.topics) {
        nlohmann::json& entry = by_subject[topic.subject];
        if (!entry.contains("topics")) {
            entry["topics"] = nlohmann::json::array();
        }
        entry["topics"].push_back({
            {"topic_id", topic.id},
            {"title", topic.title},
            {"hours", topic.estimated_hours}
        });
        subject_hours[topic.subject] += topic.estimated_hours;
    }

    for (const auto& [subject, hours] : subject_hours) {
        by_subject[subject]["total_hours"] = round_to(hours, 1);
    }

    nlohmann::json documents = nlohmann::json::array();
    for (const auto& document : session.documents) {
        documents.push_back(JsonSerializer::document_to_json(document));
    }

    return {
        {"status", "success"},
        {"total_topics", session.topics.size()},
        {"total_hours", round_to(sum_hours(session.topics), 1)},
        {"by_subject", by_subject},
        {"documents", documents}
    };
}

nlohmann::json StudyPlanner::allocate(PlannerSession& session,
                                      const std::string& start_date,
                                      const std::string& end_date) const {
    try {
        std::unique_ptr<Allocator> allocator = make_allocator(options_.allocator);
        Schedule schedule = allocator->allocate(session.topics, session.profile_or_default(),
                                                start_date, end_date);

        const auto& summary = schedule.summary;
        nlohmann::json result = {
            {"status", "success"},
            {"schedule_id", schedule.id},
            {"days", summary.study_days},
            {"total_hours", summary.total_study_hours},
            {"hours_by_subject", summary.hours_per_subject},
            {"topics_scheduled", summary.topics_scheduled},
            {"total_topics", summary.total_topics},
            {"scale_factor", summary.scale_factor},
            {"policy", summary.policy},
            {"message", "Scheduled " + std::to_string(summary.total_topics) + " topics across " +
                        std::to_string(summary.study_days) + " days"}
        };

        session.current_schedule = std::move(schedule);
        return result;
    } catch (const PlannerError& e) {
        return error_result(e.kind(), e.what());
    }
}

nlohmann::json StudyPlanner::export_schedule(const PlannerSession& session, const std::string& format) const {
    ExportFormat export_format;
    try {
        export_format = ScheduleExporter::parse_format(format);
    } catch (const std::invalid_argument& e) {
        return error_result("InvalidArgument", e.what());
    }

    if (!session.current_schedule) {
        NoScheduleError error;
        return error_result(error.kind(), error.what());
    }

    const Schedule& schedule = *session.current_schedule;
    const auto& summary = schedule.summary;

    nlohmann::json result = {
        {"status", "success"},
        {"format", ScheduleExporter::format_name(export_format)},
        {"content", ScheduleExporter::render(schedule, export_format)},
        {"summary", {
            {"period", schedule.start_date + " to " + schedule.end_date},
            {"total_hours", summary.total_study_hours},
            {"study_days", summary.study_days},
            {"topics_scheduled", std::to_string(summary.topics_scheduled) + "/" + std::to_string(summary.total_topics)},
            {"hours_per_subject", summary.hours_per_subject}
        }}
    };
    if (export_format == ExportFormat::CSV) {
        result["rows"] = ScheduleExporter::row_count(schedule);
    }
    return result;
}

nlohmann::json StudyPlanner::add_or_update_exam(PlannerSession& session,
                                                const std::string& subject,
                                                const std::string& exam_date) {
    try {
        Date::parse(exam_date);
    } catch (const InvalidDateError& e) {
        return error_result(e.kind(), "Use YYYY-MM-DD format");
    }

    std::string message;
    auto it = std::find_if(session.exams.begin(), session.exams.end(),
                           [&subject](const Exam& e) { return e.subject == subject; });
    if (it != session.exams.end()) {
        it->exam_date = exam_date;
        message = "Updated " + subject + " exam to " + exam_date;
    } else {
        session.exams.push_back({subject, exam_date});
        message = "Added " + subject + " exam on " + exam_date;
    }

    nlohmann::json exams = nlohmann::json::array();
    for (const auto& exam : session.exams) {
        exams.push_back(JsonSerializer::exam_to_json(exam));
    }
    return {
        {"status", "success"},
        {"message", message},
        {"exams", exams}
    };
}

nlohmann::json StudyPlanner::set_profile(PlannerSession& session, const LearnerProfile& profile) {
    if (profile.max_daily_deep_hours <= 0.0 || profile.max_session_time <= 0.0) {
        return error_result("InvalidArgument", "Daily and session hours must be positive");
    }
    session.learner_profile = profile;
    return {
        {"status", "success"},
        {"profile", JsonSerializer::profile_to_json(profile)}
    };
}

nlohmann::json StudyPlanner::get_profile(const PlannerSession& session) const {
    return {
        {"status", "success"},
        {"is_default", !session.learner_profile.has_value()},
        {"profile", JsonSerializer::profile_to_json(session.profile_or_default())}
    };
}

nlohmann::json StudyPlanner::update_subject_confidence(PlannerSession& session,
                                                       const std::string& subject,
                                                       double confidence) {
    LearnerProfile profile = session.profile_or_default();
    double clamped = std::max(0.0, std::min(1.0, confidence));
    profile.subject_confidence[subject] = clamped;
    session.learner_profile = profile;

    return {
        {"status", "success"},
        {"message", "Set " + subject + " confidence to " + std::to_string(static_cast<int>(clamped * 100 + 0.5)) + "%"}
    };
}

} // namespace study_planner
