// ═══════════════════════════════════════════════════════════════════
//  test_console.cpp — Tests for leveled console output
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <s2dm/console.h>

using namespace s2dm;

namespace {

class ConsoleTest : public ::testing::Test {
protected:
    void SetUp() override {
        console::setColors(false);
        console::setLevel(console::Level::Info);
    }
    void TearDown() override {
        console::setColors(true);
        console::setLevel(console::Level::Info);
    }
};

} // namespace

TEST_F(ConsoleTest, InfoGoesToStdout) {
    testing::internal::CaptureStdout();
    console::info("Materialized", 3, "types");
    auto out = testing::internal::GetCapturedStdout();
    EXPECT_NE(out.find("Materialized 3 types"), std::string::npos);
    EXPECT_EQ(out.back(), '\n');
}

TEST_F(ConsoleTest, WarnAndErrorGoToStderr) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    console::warn("careful");
    console::error("failed");
    auto out = testing::internal::GetCapturedStdout();
    auto err = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out.empty());
    EXPECT_NE(err.find("careful"), std::string::npos);
    EXPECT_NE(err.find("failed"), std::string::npos);
}

TEST_F(ConsoleTest, DebugHiddenByDefault) {
    testing::internal::CaptureStdout();
    console::debug("hidden");
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());

    console::setLevel(console::Level::Debug);
    testing::internal::CaptureStdout();
    console::debug("shown");
    EXPECT_NE(testing::internal::GetCapturedStdout().find("shown"), std::string::npos);
}

TEST_F(ConsoleTest, QuietLevelKeepsWarnings) {
    console::setLevel(console::Level::Warn);
    EXPECT_EQ(console::level(), console::Level::Warn);

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    console::info("hidden");
    console::success("hidden");
    console::warn("visible");
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
    EXPECT_NE(testing::internal::GetCapturedStderr().find("visible"), std::string::npos);
}

TEST_F(ConsoleTest, SilentSuppressesEverything) {
    console::setLevel(console::Level::Silent);
    testing::internal::CaptureStderr();
    console::error("nothing");
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());
}

TEST_F(ConsoleTest, NoEscapeCodesWithoutColors) {
    testing::internal::CaptureStdout();
    console::log("plain", true, 1.5);
    auto out = testing::internal::GetCapturedStdout();
    EXPECT_EQ(out.find('\033'), std::string::npos);
    EXPECT_NE(out.find("plain true 1.5"), std::string::npos);
}

TEST_F(ConsoleTest, TimerReportsAtDebug) {
    console::setLevel(console::Level::Debug);
    testing::internal::CaptureStdout();
    console::time("emit");
    console::timeEnd("emit");
    EXPECT_NE(testing::internal::GetCapturedStdout().find("emit:"), std::string::npos);

    testing::internal::CaptureStderr();
    console::timeEnd("emit");
    EXPECT_NE(testing::internal::GetCapturedStderr().find("does not exist"), std::string::npos);
}
