#include <gtest/gtest.h>
#include <string>

#include "analysis/SyntaxValidator.h"
#include "analysis/providers/TreeSitterSymbolProvider.h"

class SyntaxValidatorTest : public ::testing::Test {
protected:
    TreeSitterSymbolProvider grammars;
    SyntaxValidator validator{&grammars};
};

TEST_F(SyntaxValidatorTest, FlagsUnclosedFunctionBody) {
    auto errors = validator.validate("broken.rs", "fn broken() { let x = 5;");
    ASSERT_FALSE(errors.empty());
    for (const auto& e : errors) {
        bool known = e.message.rfind("Missing '", 0) == 0 || e.message.rfind("Unexpected '", 0) == 0 ||
                     e.message.rfind("Syntax error detected", 0) == 0;
        EXPECT_TRUE(known) << e.message;
        EXPECT_GE(e.line, 1u);
        EXPECT_GE(e.column, 1u);
        EXPECT_NE(e.message.find(" at " + std::to_string(e.line) + ":" + std::to_string(e.column)), std::string::npos)
            << e.message;
    }
}

TEST_F(SyntaxValidatorTest, ValidSourceHasNoErrors) {
    EXPECT_TRUE(validator.validate("ok.rs", "fn ok() -> i32 {\n    1\n}\n").empty());
}

TEST_F(SyntaxValidatorTest, ErrorsPointPastTheValidPrefix) {
    auto errors = validator.validate("x.rs", "fn ok() {}\n\nfn bad( {\n");
    ASSERT_FALSE(errors.empty());
    for (const auto& e : errors) {
        EXPECT_GE(e.line, 3u) << e.message;
    }
}

TEST_F(SyntaxValidatorTest, FilesWithoutGrammarAreAcceptedAsIs) {
    EXPECT_FALSE(validator.canValidate("script.py"));
    EXPECT_TRUE(validator.canValidate("lib.rs"));
    EXPECT_TRUE(validator.validate("script.py", "def (((:\n").empty());
}

TEST(SyntaxValidatorSnippet, TrimsAndCapsAtFortyCharacters) {
    EXPECT_EQ(SyntaxValidator::snippet("  hello world  ", 0, 15), "hello world");
    EXPECT_EQ(SyntaxValidator::snippet("abcdef", 0, 6, 3), "abc");
    std::string longText(100, 'x');
    EXPECT_EQ(SyntaxValidator::snippet(longText, 0, 100).size(), 40u);
}

TEST(SyntaxValidatorSnippet, CountsCodePointsNotBytes) {
    std::string text = "h\xC3\xA9llo";  // "héllo"
    EXPECT_EQ(SyntaxValidator::snippet(text, 0, static_cast<uint32_t>(text.size()), 2), "h\xC3\xA9");
}

TEST(SyntaxValidatorSnippet, EmptyRangeIsUnknown) {
    EXPECT_EQ(SyntaxValidator::snippet("abc", 2, 2), "<unknown>");
}

TEST(SyntaxValidatorNull, NoGrammarsMeansNothingIsValidated) {
    SyntaxValidator validator(nullptr);
    EXPECT_FALSE(validator.canValidate("a.rs"));
    EXPECT_TRUE(validator.validate("a.rs", "fn (").empty());
}
