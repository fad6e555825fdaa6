#pragma once

#include "study_planner/document_loader.h"
#include "study_planner/types.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace study_planner {

// Everything one learner's planning session accumulates. Passed explicitly
// into every StudyPlanner operation.
struct PlannerSession {
    std::vector<Topic> topics;
    std::vector<Document> documents;
    UploadedFiles uploaded_files;
    std::optional<LearnerProfile> learner_profile;
    std::vector<Exam> exams;
    std::optional<Schedule> current_schedule;

    LearnerProfile profile_or_default() const {
        return learner_profile ? *learner_profile : LearnerProfile{};
    }

    Document* find_document(const std::string& id);
    void upsert_document(Document document);
};

// Hosts independent sessions in one process. Operations on the same session
// are serialized; different sessions proceed independently.
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Runs fn(PlannerSession&) under the session's lock, creating the
    // session on first use
    template<typename F>
    auto with_session(const std::string& session_id, F&& fn) -> decltype(fn(std::declval<PlannerSession&>())) {
        std::shared_ptr<Entry> entry = entry_for(session_id);
        std::lock_guard<std::mutex> lock(entry->mutex);
        return fn(entry->session);
    }

    bool contains(const std::string& session_id) const;
    // A call already running on the session keeps it alive until it returns
    bool erase(const std::string& session_id);
    size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        PlannerSession session;
    };

    std::shared_ptr<Entry> entry_for(const std::string& session_id);

    mutable std::mutex registry_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> sessions_;
};

} // namespace study_planner
