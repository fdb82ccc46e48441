#include "test_helpers.h"
#include <gtest/gtest.h>
#include <scry/extract/source_file.h>

using namespace scry;
using namespace scry::extract;
using namespace scry::test;

class SourceFileTest : public ScryTest {};

TEST_F(SourceFileTest, LinesFollowSplitlinesSemantics) {
    auto file = makeSourceFile("a.py", "one\r\ntwo\nthree\n");
    auto lines = file.lines();
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[2], "three");
    EXPECT_EQ(file.lineCount(), 3u);

    EXPECT_EQ(makeSourceFile("b.py", "x = 1").lineCount(), 1u);
    EXPECT_EQ(makeSourceFile("c.py", "").lineCount(), 0u);
    EXPECT_TRUE(makeSourceFile("c.py", "").lines().empty());
}

TEST_F(SourceFileTest, ExtensionIsLowercased) {
    EXPECT_EQ(makeSourceFile("src/Main.RS", "").extension(), ".rs");
    EXPECT_EQ(makeSourceFile("Makefile", "").extension(), "");
}

TEST_F(SourceFileTest, ReadsRelativeToRoot) {
    auto path = writeFile("pkg/mod.py", "x = 1\n");
    auto source = readSourceFile(testDir, path);
    ASSERT_TRUE(source) << source.error().message;
    EXPECT_EQ(source.value().relative_path, "pkg/mod.py");
    EXPECT_EQ(source.value().content, "x = 1\n");
    EXPECT_EQ(source.value().absolute_path, path);
}

TEST_F(SourceFileTest, MissingFileIsAnError) {
    auto source = readSourceFile(testDir, testDir / "gone.py");
    EXPECT_THAT(source, HasErrorCode(ErrorCode::FileNotFound));
}

TEST_F(SourceFileTest, PathOutsideRootFallsBackToFileName) {
    EXPECT_EQ(relativePathString(testDir / "root", testDir / "elsewhere" / "x.py"), "x.py");
}

TEST_F(SourceFileTest, NulBytesMarkBinaryContent) {
    EXPECT_FALSE(looksBinary("def f():\n    pass\n"));
    EXPECT_TRUE(looksBinary(std::string_view("\x7f" "ELF\0\0", 6)));
}
