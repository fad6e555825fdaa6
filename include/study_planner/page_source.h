#pragma once

#include "study_planner/types.h"
#include <string>
#include <vector>

namespace study_planner {

// Page-addressable document content. Page indices are 0-based.
class PageSource {
public:
    virtual ~PageSource() = default;

    virtual std::string filename() const = 0;
    virtual int page_count() const = 0;

    // Text of one page; empty when the page could not be read
    virtual std::string page_text(int page_index) const = 0;

    // Hierarchical table of contents, empty when the document has none
    virtual std::vector<OutlineEntry> outline() const = 0;
};

// Fully extracted document held in memory.
class LoadedDocument : public PageSource {
public:
    LoadedDocument() = default;
    LoadedDocument(std::string filename,
                   std::vector<std::string> pages,
                   std::vector<OutlineEntry> outline = {});

    std::string filename() const override { return filename_; }
    int page_count() const override { return static_cast<int>(pages_.size()); }
    std::string page_text(int page_index) const override;
    std::vector<OutlineEntry> outline() const override { return outline_; }

    void add_page(std::string text) { pages_.push_back(std::move(text)); }
    void add_outline_entry(OutlineEntry entry) { outline_.push_back(std::move(entry)); }

private:
    std::string filename_;
    std::vector<std::string> pages_;
    std::vector<OutlineEntry> outline_;
};

} // namespace study_planner
