#pragma once

#include <string>

namespace study_planner {

// Heuristic difficulty score in [0.3, 0.9] from a text sample and subject.
class ComplexityEstimator {
public:
    static constexpr double kBase = 0.4;
    static constexpr double kEmptySample = 0.5;
    static constexpr double kMin = 0.3;
    static constexpr double kMax = 0.9;

    static double estimate(const std::string& sample, const std::string& subject);

    static size_t count_math_symbols(const std::string& text);
    static size_t count_formulas(const std::string& text);
    static size_t count_definitions(const std::string& text);
    static bool is_quantitative_subject(const std::string& subject);
};

} // namespace study_planner
