#include "study_planner/page_source.h"

namespace study_planner {

LoadedDocument::LoadedDocument(std::string filename,
                               std::vector<std::string> pages,
                               std::vector<OutlineEntry> outline)
    : filename_(std::move(filename)),
      pages_(std::move(pages)),
      outline_(std::move(outline)) {}

std::string LoadedDocument::page_text(int page_index) const {
    if (page_index < 0 || page_index >= page_count()) {
        return std::string();
    }
    return pages_[page_index];
}

} // namespace study_planner
