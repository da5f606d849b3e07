#include <initializer_list>
#include <string_view>

#include <gtest/gtest.h>

#include <path/SegmentStack.hpp>

using namespace lexpath::path;

using Tag = SegmentStack::Tag;

namespace {

SegmentStack pushAll(bool rooted, std::initializer_list<std::string_view> segments) {
    SegmentStack stack{rooted};

    for (auto s : segments)
        stack.push(s);

    return stack;
}

}

TEST(SegmentStackTest, DropsEmptyAndCurrent) {
    auto stack = pushAll(false, {"", ".", "a", ".", "", "b"});

    ASSERT_EQ(stack.size(), 2);
    EXPECT_EQ(stack.join('/'), "a/b");
}

TEST(SegmentStackTest, ParentPopsName) {
    auto stack = pushAll(false, {"a", "b", "..", "c"});

    EXPECT_EQ(stack.join('/'), "a/c");

    auto all = pushAll(false, {"a", "b", "..", ".."});

    EXPECT_TRUE(all.empty());
    EXPECT_EQ(all.join('/'), "");
}

TEST(SegmentStackTest, RelativeKeepsLeadingParents) {
    auto stack = pushAll(false, {"..", "..", "a"});

    ASSERT_EQ(stack.size(), 3);
    EXPECT_EQ(stack.segments()[0].tag, Tag::Parent);
    EXPECT_EQ(stack.segments()[1].tag, Tag::Parent);
    EXPECT_EQ(stack.segments()[2].tag, Tag::Name);
    EXPECT_EQ(stack.join('/'), "../../a");
}

TEST(SegmentStackTest, ParentNeverConsumesParent) {
    auto stack = pushAll(false, {"a", "..", "..", "b", "..", ".."});

    EXPECT_EQ(stack.join('\\'), R"(..\..)");
}

TEST(SegmentStackTest, RootedDropsEscapingParents) {
    auto stack = pushAll(true, {"..", "..", "a", "..", "..", "b"});

    ASSERT_EQ(stack.size(), 1);
    EXPECT_EQ(stack.segments()[0].tag, Tag::Name);
    EXPECT_EQ(stack.join('/'), "b");
}

TEST(SegmentStackTest, NamesAreVerbatim) {
    auto stack = pushAll(false, {"...", ".a", "a.", R"(x\y)", "Mixed Case"});

    EXPECT_EQ(stack.size(), 5);
    EXPECT_EQ(stack.join('/'), R"(.../.a/a./x\y/Mixed Case)");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
