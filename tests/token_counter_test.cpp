#include <gtest/gtest.h>
#include "code_atlas/token_counter.hpp"

using code_atlas::estimate_tokens;

TEST(TokenCounterTest, EmptyAndWhitespaceCostNothing) {
    EXPECT_EQ(estimate_tokens(""), 0u);
    EXPECT_EQ(estimate_tokens("   \t  "), 0u);
}

TEST(TokenCounterTest, IdentifierRunsCostOnePerFourChars) {
    EXPECT_EQ(estimate_tokens("abcd"), 1u);
    EXPECT_EQ(estimate_tokens("abcde"), 2u);
    EXPECT_EQ(estimate_tokens("snake_case_name"), 4u);
}

TEST(TokenCounterTest, PunctuationCostsOneEach) {
    // a + b ; -> a, +, b, ;
    EXPECT_EQ(estimate_tokens("a + b;"), 4u);
    EXPECT_EQ(estimate_tokens("f(x)"), 4u);
}

TEST(TokenCounterTest, NewlineRunsCostOne) {
    EXPECT_EQ(estimate_tokens("\n\n\n"), 1u);
    EXPECT_EQ(estimate_tokens("x\r\n\r\ny"), 3u);
}

TEST(TokenCounterTest, IsAdditiveOverSeparatedChunks) {
    std::string a = "def run(self):\n    return 1\n";
    std::string b = "class Widget:\n    pass\n";
    EXPECT_EQ(estimate_tokens(a + b), estimate_tokens(a) + estimate_tokens(b));
}
