#pragma once

#include "study_planner/page_source.h"
#include "study_planner/types.h"
#include <string>
#include <vector>

namespace study_planner {

struct SegmenterOptions {
    int max_outline_level = 2;
    size_t min_outline_sections = 3;
    size_t min_heading_sections = 2;
    size_t heading_scan_lines = 10;
    size_t min_heading_length = 5;      // exclusive
    size_t max_heading_length = 80;     // exclusive
    int min_chunk_pages = 20;
    int chunk_divisor = 10;
    size_t sample_chars = 1500;
    size_t max_title_length = 60;
    bool verbose = false;
};

enum class StructureTier {
    OUTLINE,
    HEADING_SCAN,
    FIXED_CHUNKS
};

struct DocumentStructure {
    std::vector<Section> sections;
    StructureTier tier;
};

// Derives ordered section boundaries from a document: outline first, then a
// heading scan of each page's first lines, then fixed page-range chunks.
class DocumentStructureExtractor {
public:
    explicit DocumentStructureExtractor(const SegmenterOptions& options = SegmenterOptions{});

    DocumentStructure extract(const PageSource& document) const;

    std::vector<Section> from_outline(const std::vector<OutlineEntry>& outline) const;
    std::vector<Section> from_headings(const PageSource& document) const;
    std::vector<Section> fixed_chunks(int total_pages) const;

    // First sample_chars bytes of each section's start page
    std::vector<std::string> sample_sections(const PageSource& document,
                                             const std::vector<Section>& sections) const;

    // Non-content section names ("contents", "index", "appendix", ...)
    static bool is_denied_exact(const std::string& lowered_title);
    static bool is_denied(const std::string& lowered_title);
    static bool is_heading_line(const std::string& line);

    static const char* tier_name(StructureTier tier);

private:
    SegmenterOptions options_;
};

} // namespace study_planner
