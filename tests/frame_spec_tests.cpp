#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "frame_spec.hpp"

namespace stego::tests {

namespace {
std::vector<int> parse(const std::string& spec) {
    std::vector<int> frames;
    EXPECT_EQ(framespec::parseFrameSpec(spec, frames), StegoError::None) << spec;
    return frames;
}
}  // namespace

TEST(FrameSpecTests, ListsAndRanges) {
    EXPECT_EQ(parse("1,4,6-9,12"), (std::vector<int>{1, 4, 6, 7, 8, 9, 12}));
    EXPECT_EQ(parse("1-3"), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(parse("0"), (std::vector<int>{0}));
}

TEST(FrameSpecTests, RangesAreDirectionAgnostic) {
    EXPECT_EQ(parse("5-3"), (std::vector<int>{3, 4, 5}));
    EXPECT_EQ(parse("7-7"), (std::vector<int>{7}));
}

TEST(FrameSpecTests, SortsDeduplicatesAndIgnoresWhitespace) {
    EXPECT_EQ(parse(" 9, 2 ,2, 1 - 3 ,, "), (std::vector<int>{1, 2, 3, 9}));
}

TEST(FrameSpecTests, RejectsMalformedSpecs) {
    const std::vector<std::string> bad = {
        "x", "1,x", "1-", "-3", "1-2-3", "a-b", "1.5", "", " , ", "99999999999", "3--4",
    };
    for (const auto& spec : bad) {
        std::vector<int> frames{42};
        EXPECT_EQ(framespec::parseFrameSpec(spec, frames), StegoError::InvalidFrameSpec) << spec;
        EXPECT_TRUE(frames.empty()) << spec;
    }
}

TEST(FrameSpecTests, RejectsHugeExpansion) {
    std::vector<int> frames;
    EXPECT_EQ(framespec::parseFrameSpec("0-2000000000", frames), StegoError::InvalidFrameSpec);
}

TEST(FrameSpecTests, FormatIsListLiteral) {
    EXPECT_EQ(framespec::formatFrameList({1, 4, 6, 7, 8}), "[1, 4, 6, 7, 8]");
    EXPECT_EQ(framespec::formatFrameList({}), "[]");
    EXPECT_EQ(framespec::formatFrameList({42}), "[42]");
}

TEST(FrameSpecTests, LiteralParsing) {
    std::vector<int> frames;
    ASSERT_EQ(framespec::parseFrameListLiteral("[1, 4, 6, 7, 8]", frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{1, 4, 6, 7, 8}));

    ASSERT_EQ(framespec::parseFrameListLiteral("  [ 3,1 ,3, ]\n", frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{3, 1, 3}));

    ASSERT_EQ(framespec::parseFrameListLiteral("[]", frames), StegoError::None);
    EXPECT_TRUE(frames.empty());

    ASSERT_EQ(framespec::parseFrameListLiteral("[-2, +5]", frames), StegoError::None);
    EXPECT_EQ(frames, (std::vector<int>{-2, 5}));
}

TEST(FrameSpecTests, LiteralRejectsAnythingElse) {
    const std::vector<std::string> bad = {
        "1, 2", "[1 2]", "[1,,2]", "[,]", "[1", "1]", "[1.0]", "['1']", "[1] x",
        "[__import__('os')]", "[99999999999]", "(1, 2)", "",
    };
    for (const auto& text : bad) {
        std::vector<int> frames;
        EXPECT_EQ(framespec::parseFrameListLiteral(text, frames), StegoError::InvalidFrameSpec) << text;
    }
}

TEST(FrameSpecTests, FormatThenLiteralParse) {
    const std::vector<int> frames = {0, 10, 2147483647};
    std::vector<int> parsed;
    ASSERT_EQ(framespec::parseFrameListLiteral(framespec::formatFrameList(frames), parsed),
              StegoError::None);
    EXPECT_EQ(parsed, frames);
}

}  // namespace stego::tests
