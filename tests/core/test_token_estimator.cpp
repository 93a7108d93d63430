#include "patchmark/core/token_estimator.hpp"
#include <gtest/gtest.h>

namespace patchmark {

TEST(TokenEstimatorTest, CharRatioRoundsUp)
{
    CharRatioEstimator estimator;

    EXPECT_EQ(estimator.estimate(""), 0);
    EXPECT_EQ(estimator.estimate("abc"), 1);
    EXPECT_EQ(estimator.estimate("abcd"), 1);
    EXPECT_EQ(estimator.estimate("abcde"), 2);
}

TEST(TokenEstimatorTest, CharRatioClampsZeroRatio)
{
    CharRatioEstimator estimator(0);

    EXPECT_EQ(estimator.estimate("abc"), 3);
}

TEST(TokenEstimatorTest, CharRatioIsMonotonic)
{
    CharRatioEstimator estimator;
    std::string text;
    size_t previous = 0;

    for (int i = 0; i < 50; ++i) {
        text += static_cast<char>('a' + i % 26);
        auto units = estimator.estimate(text);
        EXPECT_GE(units, previous);
        previous = units;
    }
}

TEST(TokenEstimatorTest, LexicalCountsWordsNumbersAndPunctuation)
{
    LexicalEstimator estimator;

    EXPECT_EQ(estimator.estimate(""), 0);
    EXPECT_EQ(estimator.estimate("hello"), 1);
    EXPECT_EQ(estimator.estimate("hello world"), 3);
    EXPECT_EQ(estimator.estimate("x=42;"), 4);
    EXPECT_EQ(estimator.estimate("a->b"), 4);
    EXPECT_EQ(estimator.estimate("snake_case_name"), 1);
}

TEST(TokenEstimatorTest, LexicalIsDeterministic)
{
    LexicalEstimator estimator;
    const std::string text = "@@ -1,3 +1,4 @@\n console.log('a');\n";

    EXPECT_EQ(estimator.estimate(text), estimator.estimate(text));
}

TEST(TokenEstimatorTest, FactoryAndNames)
{
    EXPECT_EQ(estimator_from_string("chars"), EstimatorKind::CHARS);
    EXPECT_EQ(estimator_from_string("lexical"), EstimatorKind::LEXICAL);
    EXPECT_FALSE(estimator_from_string("bpe").has_value());
    EXPECT_EQ(estimator_name(EstimatorKind::LEXICAL), "lexical");

    auto estimator = make_estimator(EstimatorKind::CHARS);
    ASSERT_NE(estimator, nullptr);
    EXPECT_EQ(estimator->estimate("12345678"), 2);
}

} // namespace patchmark
