#include "study_planner/text_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace study_planner {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

std::string trim(const std::string& text) {
    auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    auto begin = std::find_if(text.begin(), text.end(), not_space);
    auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

size_t utf8_length(const std::string& text) {
    size_t length = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) {
            length++;
        }
    }
    return length;
}

std::string utf8_prefix(const std::string& text, size_t max_codepoints) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation(static_cast<unsigned char>(text[i]))) {
            if (seen == max_codepoints) {
                return text.substr(0, i);
            }
            seen++;
        }
    }
    return text;
}

std::uint64_t stable_hash64(std::string_view text) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : text) { h ^= c; h *= 1099511628211ull; }
    return h;
}

std::string short_hash(std::string_view text, size_t length) {
    char buffer[24];
    std::snprintf(buffer, sizeof(buffer), "%016llx",
                  static_cast<unsigned long long>(stable_hash64(text)));
    return std::string(buffer, std::min<size_t>(length, 16));
}

} // namespace study_planner
