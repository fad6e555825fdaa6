#include "study_planner/complexity_estimator.h"
#include "study_planner/text_utils.h"
#include <algorithm>
#include <iterator>
#include <regex>

namespace study_planner {

namespace {

bool is_math_codepoint(char32_t cp) {
    switch (cp) {
        case U'∑': // sum
        case U'∫': // integral
        case U'∂': // partial
        case U'∇': // nabla
        case U'≤':
        case U'≥':
        case U'≠':
        case U'±':
        case U'×':
        case U'÷':
        case U'√': // sqrt
        case U'∞': // infinity
        case U'∈': // element of
        case U'∀': // for all
        case U'∃': // exists
        case U'=':
            return true;
        default:
            return false;
    }
}

// Decodes one UTF-8 sequence at text[pos], advancing pos. Malformed bytes
// decode to U+FFFD.
char32_t next_codepoint(const std::string& text, size_t& pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t extra = 0;
    char32_t cp;

    if (lead < 0x80) {
        cp = lead;
    } else if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        extra = 3;
    } else {
        ++pos;
        return U'\uFFFD';
    }

    ++pos;
    for (size_t i = 0; i < extra; ++i, ++pos) {
        if (pos >= text.size() || (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80) {
            return U'\uFFFD';
        }
        cp = (cp << 6) | (static_cast<unsigned char>(text[pos]) & 0x3F);
    }
    return cp;
}

size_t count_matches(const std::string& text, const std::regex& pattern) {
    return static_cast<size_t>(std::distance(
        std::sregex_iterator(text.begin(), text.end(), pattern),
        std::sregex_iterator()));
}

} // namespace

size_t ComplexityEstimator::count_math_symbols(const std::string& text) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        if (is_math_codepoint(next_codepoint(text, pos))) {
            count++;
        }
    }
    return count;
}

size_t ComplexityEstimator::count_formulas(const std::string& text) {
    // single letter, "=", then at least three more characters on the line
    static const std::regex formula_regex("\\b[a-z]\\s*=\\s*[^,\\n]{3,}");
    return count_matches(to_lower(text), formula_regex);
}

size_t ComplexityEstimator::count_definitions(const std::string& text) {
    static const std::regex definition_regex("\\b(defined?|means?|refers?\\s+to|is\\s+called)\\b");
    return count_matches(to_lower(text), definition_regex);
}

bool ComplexityEstimator::is_quantitative_subject(const std::string& subject) {
    static const char* const keywords[] = {"physics", "math", "calculus", "chem"};
    std::string lowered = to_lower(subject);
    for (const char* keyword : keywords) {
        if (lowered.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

double ComplexityEstimator::estimate(const std::string& sample, const std::string& subject) {
    if (sample.empty()) {
        return kEmptySample;
    }

    double complexity = kBase;
    if (count_math_symbols(sample) > 3) {
        complexity += 0.15;
    }
    if (count_formulas(sample) > 2) {
        complexity += 0.15;
    }
    if (count_definitions(sample) > 3) {
        complexity += 0.1;
    }
    if (is_quantitative_subject(subject)) {
        complexity += 0.1;
    }

    return std::min(kMax, std::max(kMin, complexity));
}

} // namespace study_planner
