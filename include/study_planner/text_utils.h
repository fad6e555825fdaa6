#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace study_planner {

std::string trim(const std::string& text);
std::string to_lower(const std::string& text);

// Length in code points, counting each malformed byte as one
size_t utf8_length(const std::string& text);

// First max_codepoints code points, never splitting a sequence
std::string utf8_prefix(const std::string& text, size_t max_codepoints);

// FNV-1a, stable across runs and platforms
std::uint64_t stable_hash64(std::string_view text);

// First `length` lowercase hex digits of stable_hash64(text)
std::string short_hash(std::string_view text, size_t length = 8);

} // namespace study_planner
