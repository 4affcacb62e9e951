#include "cia/extractors/pattern_matching.hpp"

#include <gtest/gtest.h>

namespace cia::extractors::patterns
{
    TEST(SourceTextTest, LineTable) {
        const SourceText source("first\r\nsecond\n\nfourth\n");

        EXPECT_EQ(source.line_count(), 4u);
        EXPECT_EQ(source.line(1), "first");
        EXPECT_EQ(source.line(2), "second");
        EXPECT_EQ(source.line(3), "");
        EXPECT_EQ(source.line(4), "fourth");
        EXPECT_EQ(source.line(5), "");
        EXPECT_EQ(source.line(0), "");
    }

    TEST(SourceTextTest, LineOfOffset) {
        const SourceText source("ab\ncd\nef");

        EXPECT_EQ(source.line_of(0), 1u);
        EXPECT_EQ(source.line_of(2), 1u);
        EXPECT_EQ(source.line_of(3), 2u);
        EXPECT_EQ(source.line_of(7), 3u);
        EXPECT_EQ(source.line_start(3), 6u);
    }

    TEST(PatternMatchingTest, MatchLinesIsAnchoredAtLineStart) {
        const SourceText source("def a():\n    def b():\nx = def c()\ndef d():\n");
        const std::regex pattern(R"(def\s+(\w+))");

        const auto matches = match_lines(source, pattern);

        ASSERT_EQ(matches.size(), 2u);
        EXPECT_EQ(matches[0].line, 1u);
        EXPECT_EQ(matches[0].group(1), "a");
        EXPECT_EQ(matches[1].line, 4u);
        EXPECT_EQ(matches[1].group(1), "d");
        EXPECT_EQ(matches[1].group(7), "");
    }

    TEST(PatternMatchingTest, MatchMaySpanLines) {
        const SourceText source("function f(a,\n           b) {\n}\n");
        const std::regex pattern(R"(function\s+(\w+)\s*\(([^)]*)\))");

        const auto matches = match_lines(source, pattern);

        ASSERT_EQ(matches.size(), 1u);
        EXPECT_EQ(split_parameters(matches[0].group(2)), (std::vector<std::string>{"a", "b"}));
        EXPECT_EQ(find_block_end(source, matches[0].end_offset(), matches[0].line), 3u);
    }

    TEST(PatternMatchingTest, BlockEndSkipsNestedBlocksAndLiterals) {
        const SourceText source(
            "fn run() {\n"
            "    if ok {\n"
            "        log(\"}\");\n"
            "        // }\n"
            "    }\n"
            "}\n");

        EXPECT_EQ(find_block_end(source, 8, 1), 6u);
    }

    TEST(PatternMatchingTest, BlockEndOnNextLine) {
        const SourceText source("void run()\n{\n    work();\n}\n");

        EXPECT_EQ(find_block_end(source, 10, 1), 4u);
    }

    TEST(PatternMatchingTest, BodylessDeclaration) {
        const SourceText source("fn find(&self) -> u32;\nfn other() {}\n");

        EXPECT_EQ(find_block_end(source, 14, 1), 1u);
    }

    TEST(PatternMatchingTest, UnclosedBlockKeepsStartLine) {
        const SourceText source("class A {\n  x\n");

        EXPECT_EQ(find_block_end(source, 7, 1), 1u);
    }

    TEST(PatternMatchingTest, IndentedBlockEnd) {
        const SourceText source(
            "def f(a,\n"
            "      b):\n"
            "    return a\n"
            "\n"
            "    # trailing comment\n"
            "x = 1\n");

        EXPECT_EQ(find_indented_block_end(source, 1), 3u);
    }

    TEST(PatternMatchingTest, SplitParametersKeepsNestedCommas) {
        const auto params = split_parameters("  opts: Record<string,\n   number>, cb: (a, b) => void ");

        ASSERT_EQ(params.size(), 2u);
        EXPECT_EQ(params[0], "opts: Record<string, number>");
        EXPECT_EQ(params[1], "cb: (a, b) => void");
        EXPECT_TRUE(split_parameters("   ").empty());
    }

    TEST(PatternMatchingTest, AnnotationAfterMarker) {
        EXPECT_EQ(annotation_after(": Promise<User> {", ":", "{;="), "Promise<User>");
        EXPECT_EQ(annotation_after(" -> Result<u32, String> where T: Clone {", "->", "{;"),
                  "Result<u32, String> where T: Clone");
        EXPECT_EQ(annotation_after(" {", ":", "{;="), "");
    }

    TEST(PatternMatchingTest, InnermostOwner) {
        Symbol outer;
        outer.start_line = 1;
        outer.end_line = 20;
        Symbol inner;
        inner.start_line = 5;
        inner.end_line = 10;
        const std::vector<Symbol> owners = {outer, inner};

        EXPECT_EQ(innermost_owner(owners, 7), 1u);
        EXPECT_EQ(innermost_owner(owners, 12), 0u);
        EXPECT_EQ(innermost_owner(owners, 5), 0u);
        EXPECT_EQ(innermost_owner(owners, 1), owners.size());
        EXPECT_EQ(innermost_owner(owners, 30), owners.size());
    }

    TEST(PatternMatchingTest, SortByPositionIsStable) {
        Symbol a;
        a.name = "a";
        a.start_line = 4;
        Symbol b;
        b.name = "b";
        b.start_line = 2;
        Symbol c;
        c.name = "c";
        c.start_line = 4;
        std::vector<Symbol> symbols = {a, b, c};

        sort_by_position(symbols);

        EXPECT_EQ(symbols[0].name, "b");
        EXPECT_EQ(symbols[1].name, "a");
        EXPECT_EQ(symbols[2].name, "c");
    }

    TEST(PatternMatchingTest, ControlKeywords) {
        EXPECT_TRUE(is_control_keyword("if"));
        EXPECT_TRUE(is_control_keyword("synchronized"));
        EXPECT_FALSE(is_control_keyword("getUser"));
    }

}  // namespace cia::extractors::patterns
