#include <gtest/gtest.h>
#include <study_planner/complexity_estimator.h>

using study_planner::ComplexityEstimator;

TEST(ComplexityEstimatorTest, EmptySampleIsNeutral) {
    EXPECT_DOUBLE_EQ(ComplexityEstimator::estimate("", "Physics"), 0.5);
    EXPECT_DOUBLE_EQ(ComplexityEstimator::estimate("", "History"), 0.5);
}

TEST(ComplexityEstimatorTest, PlainProseIsBase) {
    EXPECT_NEAR(ComplexityEstimator::estimate("The war ended in the spring.", "History"), 0.4, 1e-9);
}

TEST(ComplexityEstimatorTest, QuantitativeSubjectAddsWeight) {
    const std::string text = "The war ended in the spring.";
    EXPECT_NEAR(ComplexityEstimator::estimate(text, "Physics"), 0.5, 1e-9);
    EXPECT_NEAR(ComplexityEstimator::estimate(text, "Organic Chemistry"), 0.5, 1e-9);
    EXPECT_NEAR(ComplexityEstimator::estimate(text, "Applied MATHEMATICS"), 0.5, 1e-9);
    EXPECT_TRUE(ComplexityEstimator::is_quantitative_subject("Calculus II"));
    EXPECT_FALSE(ComplexityEstimator::is_quantitative_subject("Literature"));
}

TEST(ComplexityEstimatorTest, MathSymbols) {
    EXPECT_EQ(ComplexityEstimator::count_math_symbols("\xE2\x88\x91 \xE2\x88\xAB \xE2\x88\x82 \xE2\x88\x87"), 4u);
    EXPECT_EQ(ComplexityEstimator::count_math_symbols("a = b"), 1u);
    EXPECT_EQ(ComplexityEstimator::count_math_symbols("\xC2\xB1 \xC3\x97 \xC3\xB7"), 3u);   // ± × ÷
    EXPECT_NEAR(ComplexityEstimator::estimate("\xE2\x88\x91 \xE2\x88\xAB \xE2\x88\x82 \xE2\x88\x87", "History"),
                0.55, 1e-9);
}

TEST(ComplexityEstimatorTest, MalformedUtf8DoesNotCount) {
    EXPECT_EQ(ComplexityEstimator::count_math_symbols("\xFF\xFE\xE2\x88"), 0u);
    EXPECT_NO_THROW(ComplexityEstimator::estimate("\xFF\xFE\xE2\x88", "Physics"));
}

TEST(ComplexityEstimatorTest, Formulas) {
    const std::string text = "x = 5 + 3\ny = 2 * z\nf = m * a\n";
    EXPECT_EQ(ComplexityEstimator::count_formulas(text), 3u);
    EXPECT_EQ(ComplexityEstimator::count_formulas("x = 1, y = 2"), 0u);
    // three '=' do not reach the symbol threshold
    EXPECT_NEAR(ComplexityEstimator::estimate(text, "History"), 0.55, 1e-9);
}

TEST(ComplexityEstimatorTest, Definitions) {
    const std::string text = "A vector is defined by magnitude. Force means push. "
                             "Mass refers to inertia. This is called momentum.";
    EXPECT_EQ(ComplexityEstimator::count_definitions(text), 4u);
    EXPECT_NEAR(ComplexityEstimator::estimate(text, "History"), 0.5, 1e-9);
}

TEST(ComplexityEstimatorTest, ClampedToUpperBound) {
    const std::string text =
        "\xE2\x88\x91 \xE2\x88\xAB \xE2\x88\x82 \xE2\x88\x87\n"
        "x = 5 + 3\ny = 2 * z\nf = m * a\n"
        "Work is defined as force. Power means rate. Energy refers to capacity. This is called conservation.";
    double complexity = ComplexityEstimator::estimate(text, "Physics");
    EXPECT_NEAR(complexity, 0.9, 1e-9);
    EXPECT_LE(complexity, ComplexityEstimator::kMax);
}
