#include <gtest/gtest.h>
#include "supervisor/line_assembler.hpp"

#include <string>
#include <vector>

class LineAssemblerTest : public ::testing::Test {
protected:
    LineAssembler assembler;
    std::vector<std::string> lines;

    LineAssembler::Emit collect() {
        return [this](const std::string& line) { lines.push_back(line); };
    }
};

TEST_F(LineAssemblerTest, SplitsAcrossChunks) {
    assembler.feed("ab", collect());
    EXPECT_TRUE(lines.empty());

    assembler.feed("c\ndef\r\n", collect());
    assembler.feed("ghi", collect());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(lines[1], "def");
    EXPECT_EQ(assembler.pending(), "ghi");

    assembler.flush(collect());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[2], "ghi");
    EXPECT_EQ(assembler.pending(), "");
}

TEST_F(LineAssemblerTest, RunsOfBreaksCollapse) {
    assembler.feed("one\r\n\r\n\ntwo\n", collect());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(assembler.pending(), "");
}

TEST_F(LineAssemblerTest, BreakSplitAcrossChunksYieldsNoBlankLine) {
    assembler.feed("abc\r", collect());
    assembler.feed("\nxyz", collect());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "abc");
    EXPECT_EQ(assembler.pending(), "xyz");
}

TEST_F(LineAssemblerTest, FlushIsIdempotent) {
    assembler.feed("tail", collect());
    assembler.flush(collect());
    assembler.flush(collect());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "tail");
}

TEST_F(LineAssemblerTest, FlushTrimsWhitespace) {
    assembler.feed("  padded \t", collect());
    assembler.flush(collect());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "padded");
}

TEST_F(LineAssemblerTest, FlushSkipsBlankTail) {
    assembler.feed("   ", collect());
    assembler.flush(collect());
    EXPECT_TRUE(lines.empty());
    EXPECT_EQ(assembler.pending(), "");
}

TEST_F(LineAssemblerTest, CompleteLinesKeepInnerWhitespace) {
    assembler.feed("  indented line  \n", collect());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "  indented line  ");
}

TEST_F(LineAssemblerTest, EmptyChunkIsNoop) {
    assembler.feed("", collect());
    assembler.feed(nullptr, 0, collect());
    EXPECT_TRUE(lines.empty());
    EXPECT_EQ(assembler.pending(), "");
}

TEST_F(LineAssemblerTest, BinaryLengthIsRespected) {
    const char data[] = {'a', '\n', 'b', '\0', 'c'};
    assembler.feed(data, 2, collect());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(assembler.pending(), "");
}
