#include "study_planner/planner_session.h"
#include <algorithm>

namespace study_planner {

Document* PlannerSession::find_document(const std::string& id) {
    auto it = std::find_if(documents.begin(), documents.end(),
                           [&id](const Document& d) { return d.id == id; });
    return it == documents.end() ? nullptr : &*it;
}

void PlannerSession::upsert_document(Document document) {
    if (Document* existing = find_document(document.id)) {
        *existing = std::move(document);
    } else {
        documents.push_back(std::move(document));
    }
}

std::shared_ptr<SessionRegistry::Entry> SessionRegistry::entry_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& entry = sessions_[session_id];
    if (!entry) {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.count(session_id) > 0;
}

bool SessionRegistry::erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.erase(session_id) > 0;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return sessions_.size();
}

} // namespace study_planner
