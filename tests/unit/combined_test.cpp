#include "../../src/transform/combined.hpp"
#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace refmt::transform;

class CombinedTest : public refmt::testing::TempDirTest {
   protected:
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(CombinedTest, RenamesThenTransformsThenCleans) {
    auto file = write("TestFile.txt", "Line 1   \nTask done ✅\nLine 3\t\n");

    CombinedProcessor processor(CombinedOptions{}, out_, err_);
    auto stats = processor.process(file);

    EXPECT_EQ(stats.files_renamed, 1u);
    EXPECT_EQ(stats.files_emoji_transformed, 1u);
    EXPECT_EQ(stats.files_whitespace_cleaned, 1u);
    EXPECT_EQ(stats.whitespace_lines_cleaned, 2u);

    auto renamed = root_ / "testfile.txt";
    ASSERT_TRUE(std::filesystem::exists(renamed));
    EXPECT_EQ(read(renamed), "Line 1\nTask done [x]\nLine 3\n");
}

TEST_F(CombinedTest, DryRunChangesNothing) {
    std::string original = "Line 1   \nTask ✅\n";
    auto file = write("TestFile.txt", original);

    CombinedOptions options;
    options.dry_run = true;
    CombinedProcessor processor(options, out_, err_);
    auto stats = processor.process(file);

    EXPECT_EQ(stats.files_renamed, 1u);
    EXPECT_EQ(stats.files_emoji_transformed, 1u);
    EXPECT_EQ(stats.files_whitespace_cleaned, 1u);
    EXPECT_TRUE(std::filesystem::exists(file));
    EXPECT_EQ(read(file), original);
}

TEST_F(CombinedTest, RecursiveProcessesSubdirectories) {
    write("File1.txt", "Text   \n✅ Done\n");
    write("subdir/File2.md", "More text\t\n☐ Todo\n");

    CombinedOptions options;
    options.recursive = true;
    CombinedProcessor processor(options, out_, err_);
    auto stats = processor.process(root_);

    EXPECT_EQ(stats.files_renamed, 2u);
    EXPECT_EQ(stats.files_emoji_transformed, 2u);
    EXPECT_EQ(stats.files_whitespace_cleaned, 2u);
    EXPECT_EQ(read(root_ / "file1.txt"), "Text\n[x] Done\n");
    EXPECT_EQ(read(root_ / "subdir" / "file2.md"), "More text\n[ ] Todo\n");
}

TEST_F(CombinedTest, NonRecursiveStaysAtTopLevel) {
    write("Top.txt", "x \n");
    auto nested = write("sub/Nested.txt", "y \n");

    CombinedProcessor processor(CombinedOptions{false, false}, out_, err_);
    auto stats = processor.process(root_);

    EXPECT_EQ(stats.files_renamed, 1u);
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_EQ(read(nested), "y \n");
}

// 対象外の拡張子はリネームのみ
TEST_F(CombinedTest, UnknownExtensionOnlyRenamed) {
    write("Image.PNG", "binary   \n");

    CombinedProcessor processor(CombinedOptions{}, out_, err_);
    auto stats = processor.process(root_);

    EXPECT_EQ(stats.files_renamed, 1u);
    EXPECT_EQ(stats.files_whitespace_cleaned, 0u);
    EXPECT_EQ(read(root_ / "image.PNG"), "binary   \n");
}
