#include <string>

#include <gtest/gtest.h>

#include <util/Log.hpp>

using namespace lexpath::util;

class LogTest: public ::testing::Test {
protected:
    void SetUp() override {
        saved_ = Log::level();
    }

    void TearDown() override {
        Log::setLevel(saved_);
    }

private:
    Log::Level saved_{Log::Level::Info};
};

TEST_F(LogTest, Format) {
    Log::setLevel(Log::Level::Info);

    ::testing::internal::CaptureStdout();
    Log::w("Tag", "value ", 42, ' ', std::string{"x"});
    auto out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[Tag/W]: value 42 x\n");
}

TEST_F(LogTest, ErrorsGoToStderr) {
    Log::setLevel(Log::Level::Info);

    ::testing::internal::CaptureStderr();
    Log::e("Tag", "failed");
    auto err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[Tag/E]: failed\n");
}

TEST_F(LogTest, Threshold) {
    Log::setLevel(Log::Level::Warning);

    EXPECT_FALSE(Log::enabled(Log::Level::Debug));
    EXPECT_FALSE(Log::enabled(Log::Level::Info));
    EXPECT_TRUE(Log::enabled(Log::Level::Warning));
    EXPECT_TRUE(Log::enabled(Log::Level::Error));

    ::testing::internal::CaptureStdout();
    Log::i("Tag", "hidden");
    Log::w("Tag", "shown");
    auto out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[Tag/W]: shown\n");
}

TEST_F(LogTest, Silent) {
    Log::setLevel(Log::Level::Silent);

    EXPECT_FALSE(Log::enabled(Log::Level::Error));
    EXPECT_FALSE(Log::enabled(Log::Level::Silent));

    ::testing::internal::CaptureStderr();
    Log::e("Tag", "nothing");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
