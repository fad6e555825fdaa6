#include "study_planner/structure_extractor.h"
#include "study_planner/text_utils.h"
#include <algorithm>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace study_planner {

namespace {

// Non-content sections. Known precision/recall tradeoff: substring matching
// also drops real chapters such as "Appendix: Worked Examples".
const std::set<std::string>& denylist() {
    static const std::set<std::string> names = {
        "contents", "index", "bibliography", "references", "glossary",
        "acknowledgment", "preface", "foreword", "dedication", "about the author",
        "table of contents", "list of figures", "list of tables", "credits",
        "back cover", "front cover", "cover", "title page", "copyright",
        "copyright page", "appendix", "answers", "data sets", "websites",
        "odd-numbered", "even-numbered"
    };
    return names;
}

} // namespace

DocumentStructureExtractor::DocumentStructureExtractor(const SegmenterOptions& options)
    : options_(options) {}

bool DocumentStructureExtractor::is_denied_exact(const std::string& lowered_title) {
    return denylist().count(lowered_title) > 0;
}

bool DocumentStructureExtractor::is_denied(const std::string& lowered_title) {
    if (is_denied_exact(lowered_title)) {
        return true;
    }
    for (const auto& name : denylist()) {
        if (lowered_title.find(name) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool DocumentStructureExtractor::is_heading_line(const std::string& line) {
    static const std::regex keyword_heading("^(chapter|unit|module)\\s+\\d+", std::regex::icase);
    static const std::regex numbered_heading("^\\d+\\.\\s+[A-Z][a-z]");
    return std::regex_search(line, keyword_heading) || std::regex_search(line, numbered_heading);
}

const char* DocumentStructureExtractor::tier_name(StructureTier tier) {
    switch (tier) {
        case StructureTier::OUTLINE: return "outline";
        case StructureTier::HEADING_SCAN: return "heading-scan";
        case StructureTier::FIXED_CHUNKS: return "fixed-chunks";
    }
    return "unknown";
}

std::vector<Section> DocumentStructureExtractor::from_outline(const std::vector<OutlineEntry>& outline) const {
    std::vector<Section> sections;

    for (const auto& entry : outline) {
        if (entry.level > options_.max_outline_level || entry.page < 1) {
            continue;
        }
        std::string title = trim(entry.title);
        if (utf8_length(title) <= 2 || is_denied(to_lower(title))) {
            continue;
        }
        sections.push_back({title, entry.page});
    }

    return sections;
}

std::vector<Section> DocumentStructureExtractor::from_headings(const PageSource& document) const {
    std::vector<Section> sections;
    std::set<std::string> seen_titles;

    for (int page = 0; page < document.page_count(); ++page) {
        std::istringstream stream(document.page_text(page));
        std::string raw_line;
        size_t line_number = 0;

        while (line_number < options_.heading_scan_lines && std::getline(stream, raw_line)) {
            line_number++;

            std::string line = trim(raw_line);
            size_t length = utf8_length(line);
            if (length <= options_.min_heading_length || length >= options_.max_heading_length) {
                continue;
            }
            if (is_denied_exact(to_lower(line)) || !is_heading_line(line)) {
                continue;
            }
            // Running headers repeat on every page; keep the first
            if (seen_titles.insert(line).second) {
                sections.push_back({line, page + 1});
            }
        }
    }

    return sections;
}

std::vector<Section> DocumentStructureExtractor::fixed_chunks(int total_pages) const {
    std::vector<Section> sections;
    int pages = std::max(1, total_pages);
    int pages_per_chunk = std::max(options_.min_chunk_pages, pages / options_.chunk_divisor);

    for (int i = 0; i < pages; i += pages_per_chunk) {
        int last = std::min(i + pages_per_chunk, pages);
        std::string title = "Section " + std::to_string(i / pages_per_chunk + 1) +
                            " (Pages " + std::to_string(i + 1) + "-" + std::to_string(last) + ")";
        sections.push_back({title, i + 1});
    }

    return sections;
}

DocumentStructure DocumentStructureExtractor::extract(const PageSource& document) const {
    DocumentStructure structure;
    structure.tier = StructureTier::OUTLINE;
    structure.sections = from_outline(document.outline());

    if (structure.sections.size() < options_.min_outline_sections) {
        structure.tier = StructureTier::HEADING_SCAN;
        structure.sections = from_headings(document);
    }

    if (structure.sections.size() < options_.min_heading_sections) {
        structure.tier = StructureTier::FIXED_CHUNKS;
        structure.sections = fixed_chunks(document.page_count());
    }

    std::stable_sort(structure.sections.begin(), structure.sections.end(),
                     [](const Section& a, const Section& b) { return a.page < b.page; });

    // Outlines occasionally list the same entry twice
    std::vector<Section> sections;
    std::set<std::pair<int, std::string>> seen;
    for (auto& section : structure.sections) {
        if (seen.insert({section.page, section.title}).second) {
            sections.push_back(std::move(section));
        }
    }
    structure.sections = std::move(sections);

    if (options_.verbose) {
        std::cout << "[DocumentStructureExtractor::extract] " << document.filename() << ": "
                  << structure.sections.size() << " sections via " << tier_name(structure.tier) << std::endl;
    }

    return structure;
}

std::vector<std::string> DocumentStructureExtractor::sample_sections(const PageSource& document,
                                                                     const std::vector<Section>& sections) const {
    std::vector<std::string> samples;
    samples.reserve(sections.size());

    for (const auto& section : sections) {
        int page_index = section.page - 1;
        if (page_index >= 0 && page_index < document.page_count()) {
            samples.push_back(utf8_prefix(document.page_text(page_index), options_.sample_chars));
        } else {
            samples.push_back(std::string());
        }
    }

    return samples;
}

} // namespace study_planner
