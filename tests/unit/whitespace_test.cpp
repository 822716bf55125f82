#include "../../src/transform/whitespace.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace refmt::transform;

class WhitespaceTest : public refmt::testing::TempDirTest {
   protected:
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================
// テキスト単位
// ============================================================

TEST_F(WhitespaceTest, RemovesTrailingSpacesAndTabs) {
    auto result = clean_trailing_whitespace("a  \nb\t\nc\n");
    EXPECT_EQ(result.text, "a\nb\nc\n");
    EXPECT_EQ(result.lines_cleaned, 2u);
}

TEST_F(WhitespaceTest, PreservesMissingFinalNewline) {
    auto result = clean_trailing_whitespace("a \nb ");
    EXPECT_EQ(result.text, "a\nb");
    EXPECT_EQ(result.lines_cleaned, 2u);
}

TEST_F(WhitespaceTest, CrlfIsNormalizedWithoutCounting) {
    auto result = clean_trailing_whitespace("a\r\nb \r\n");
    EXPECT_EQ(result.text, "a\nb\n");
    EXPECT_EQ(result.lines_cleaned, 1u);
}

TEST_F(WhitespaceTest, CleanTextIsUntouched) {
    auto result = clean_trailing_whitespace("  indented\n\nend\n");
    EXPECT_EQ(result.text, "  indented\n\nend\n");
    EXPECT_EQ(result.lines_cleaned, 0u);
}

// 全角スペース (U+3000) と NBSP (U+00A0) も行末の空白
TEST_F(WhitespaceTest, RemovesUnicodeWhitespace) {
    auto result = clean_trailing_whitespace("見出し　　\nvalue \t\n");
    EXPECT_EQ(result.text, "見出し\nvalue\n");
    EXPECT_EQ(result.lines_cleaned, 2u);
}

// 行中の全角スペースと非ASCII文字はそのまま
TEST_F(WhitespaceTest, KeepsInnerUnicodeWhitespace) {
    auto result = clean_trailing_whitespace("a　b 日本\n");
    EXPECT_EQ(result.text, "a　b 日本\n");
    EXPECT_EQ(result.lines_cleaned, 0u);
}

TEST_F(WhitespaceTest, EmptyInput) {
    auto result = clean_trailing_whitespace("");
    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.lines_cleaned, 0u);
}

// ============================================================
// ファイル単位
// ============================================================

TEST_F(WhitespaceTest, ProcessDirectoryRecursively) {
    auto a = write("a.py", "x = 1   \n");
    auto b = write("sub/b.md", "text\t\nmore  \n");
    auto skipped = write("c.bin", "data   \n");

    WhitespaceCleaner cleaner(WhitespaceOptions{}, out_, err_);
    auto [files, lines] = cleaner.process(root_);

    EXPECT_EQ(files, 2u);
    EXPECT_EQ(lines, 3u);
    EXPECT_EQ(read(a), "x = 1\n");
    EXPECT_EQ(read(b), "text\nmore\n");
    EXPECT_EQ(read(skipped), "data   \n");
    EXPECT_NE(out_.str().find("Cleaned 2 lines in '"), std::string::npos);
}

TEST_F(WhitespaceTest, DryRunReportsOnly) {
    auto a = write("a.txt", "x   \n");
    WhitespaceOptions options;
    options.dry_run = true;
    WhitespaceCleaner cleaner(options, out_, err_);

    auto [files, lines] = cleaner.process(a);
    EXPECT_EQ(files, 1u);
    EXPECT_EQ(lines, 1u);
    EXPECT_EQ(read(a), "x   \n");
    EXPECT_NE(out_.str().find("Would clean 1 lines in '"), std::string::npos);
}

TEST_F(WhitespaceTest, SkipsHiddenAndBuildDirectories) {
    auto hidden = write(".cache/a.py", "x  \n");
    auto built = write("node_modules/b.js", "y  \n");

    WhitespaceCleaner cleaner(WhitespaceOptions{}, out_, err_);
    auto [files, lines] = cleaner.process(root_);
    EXPECT_EQ(files, 0u);
    EXPECT_EQ(read(hidden), "x  \n");
    EXPECT_EQ(read(built), "y  \n");
}

TEST_F(WhitespaceTest, DisabledRemovalDoesNothing) {
    auto a = write("a.py", "x   \n");
    WhitespaceOptions options;
    options.remove_trailing = false;
    WhitespaceCleaner cleaner(options, out_, err_);
    EXPECT_EQ(cleaner.clean_file(a), 0u);
    EXPECT_EQ(read(a), "x   \n");
}
