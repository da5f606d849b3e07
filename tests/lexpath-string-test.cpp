#include <string_view>

#include <gtest/gtest.h>

#include <util/String.hpp>

using namespace lexpath::util;

namespace {

bool isSlash(char c) {
    return c == '/';
}

bool isAnySlash(char c) {
    return c == '/' || c == '\\';
}

}

TEST(StringTest, SplitSkipsEmptyParts) {
    auto parts = split("//a///b/c//", isSlash);

    ASSERT_EQ(parts.size(), 3);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "c");
}

TEST(StringTest, SplitKeepsEmptyParts) {
    auto parts = split("/a//b/", isSlash, false);

    ASSERT_EQ(parts.size(), 5);
    EXPECT_EQ(parts[0], "");
    EXPECT_EQ(parts[1], "a");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "b");
    EXPECT_EQ(parts[4], "");
}

TEST(StringTest, SplitEmpty) {
    EXPECT_TRUE(split("", isSlash).empty());
    EXPECT_TRUE(split("////", isSlash).empty());

    auto parts = split("", isSlash, false);

    ASSERT_EQ(parts.size(), 1);
    EXPECT_EQ(parts[0], "");
}

TEST(StringTest, SplitPredicate) {
    auto mixed = split(R"(a\b/c)", isAnySlash);

    ASSERT_EQ(mixed.size(), 3);
    EXPECT_EQ(mixed[0], "a");
    EXPECT_EQ(mixed[1], "b");
    EXPECT_EQ(mixed[2], "c");

    auto single = split(R"(a\b/c)", isSlash);

    ASSERT_EQ(single.size(), 2);
    EXPECT_EQ(single[0], R"(a\b)");
    EXPECT_EQ(single[1], "c");
}

TEST(StringTest, SplitReturnsViewsIntoSource) {
    const std::string_view source = "abc/def";

    auto parts = split(source, isSlash);

    ASSERT_EQ(parts.size(), 2);
    EXPECT_EQ(parts[1].data(), source.data() + 4);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
