#pragma once

#include "study_planner/types.h"
#include <memory>
#include <string>
#include <vector>

namespace study_planner {

struct ExtractedPage {
    int page_number;        // 0-based
    std::string text;
    std::string error;      // empty on success
};

struct ExtractedDocument {
    int page_count = 0;
    std::vector<ExtractedPage> pages;
    std::vector<OutlineEntry> outline;
};

// MuPDF-backed page text and outline extraction.
class TextExtractor {
public:
    TextExtractor();
    ~TextExtractor();

    TextExtractor(const TextExtractor&) = delete;
    TextExtractor& operator=(const TextExtractor&) = delete;

    ExtractedDocument extract_document(const std::string& pdf_path);

    // Opens a PDF held in memory (an uploaded file)
    ExtractedDocument extract_document(const std::string& filename,
                                       const std::vector<unsigned char>& data);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace study_planner
