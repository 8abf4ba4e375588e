#include <gtest/gtest.h>
#include <string>

#include "analysis/BlockExtent.h"

TEST(BlockExtent, NestedBracesSpanWholeBlock) {
    std::string src = "{ a; { b; } c; }";
    EXPECT_EQ(BlockExtent::resolve(src, 0), src.size());
}

TEST(BlockExtent, StopsAtMatchingBraceNotEndOfFile) {
    std::string src = "fn a() {\n    1\n}\n\nfn b() {\n    2\n}\n";
    size_t end = BlockExtent::resolve(src, 0);
    EXPECT_EQ(src.substr(0, end), "fn a() {\n    1\n}");
}

TEST(BlockExtent, BracesInsideStringLiteralsAreIgnored) {
    std::string src = "fn f() {\n  \"}\"\n}\nrest";
    size_t end = BlockExtent::resolve(src, 0);
    EXPECT_EQ(src.substr(0, end), "fn f() {\n  \"}\"\n}");
}

TEST(BlockExtent, EscapedQuoteDoesNotCloseLiteral) {
    std::string src = "f() { x = \"a\\\"}\"; }";
    EXPECT_EQ(BlockExtent::resolve(src, 0), src.size());
}

TEST(BlockExtent, UnbalancedBracesRunToEnd) {
    std::string src = "fn f() {\n  let x = 1;\n";
    EXPECT_EQ(BlockExtent::resolve(src, 0), src.size());
}

TEST(BlockExtent, StartOffsetIsRespected) {
    std::string src = "xx\nfn g() { y }\nzz";
    size_t start = src.find("fn g");
    size_t end = BlockExtent::resolve(src, start);
    EXPECT_EQ(src.substr(start, end), "fn g() { y }");
}

TEST(BlockExtent, IndentationBlockExcludesTrailingBlankLines) {
    std::string src = "def f():\n    return 1\n\n    x = 2\n\ndef g():\n    pass\n";
    size_t end = BlockExtent::resolve(src, 0);
    EXPECT_EQ(end, src.find("\n\ndef g") + 1);
    EXPECT_EQ(src.substr(0, end), "def f():\n    return 1\n\n    x = 2\n");
}

TEST(BlockExtent, BraceBeyondThreeLinesUsesIndentation) {
    std::string src = "class A:\n  a\n  b\n  c\n  d = {}\nnext\n";
    size_t end = BlockExtent::resolve(src, 0);
    EXPECT_EQ(src.substr(0, end), "class A:\n  a\n  b\n  c\n  d = {}\n");
}

TEST(BlockExtent, SingleLineWithoutBodyCoversFirstLine) {
    std::string src = "x = 1\ny = 2\n";
    EXPECT_EQ(BlockExtent::resolve(src, 0), std::string("x = 1\n").size());
}

TEST(BlockExtent, StartPastEndIsZero) {
    EXPECT_EQ(BlockExtent::resolve("abc", 3), 0u);
}

TEST(BlockExtent, IndentWidthCountsSpacesAndTabs) {
    EXPECT_EQ(BlockExtent::indentWidth("    x"), 4u);
    EXPECT_EQ(BlockExtent::indentWidth("\t\tx"), 2u);
    EXPECT_EQ(BlockExtent::indentWidth("x"), 0u);
}
