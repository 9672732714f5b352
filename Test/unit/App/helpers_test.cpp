#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "helpers.hpp"
#include "test_support.hpp"

#include <chrono>
#include <limits>
#include <string>

namespace App {

using namespace doppel_app;
using namespace std::chrono_literals;
using doppel_test::CerrCapture;
using ::testing::HasSubstr;
using ::testing::Not;

// ========== Number Formatting Tests ==========

TEST(HelpersTest, WithCommas_PositiveNumbers) {
    EXPECT_EQ(withCommas(0), "0");
    EXPECT_EQ(withCommas(100), "100");
    EXPECT_FALSE(withCommas(1000).empty());
    EXPECT_FALSE(withCommas(1234567890).empty());
}

TEST(HelpersTest, WithCommas_KeepsAllDigits) {
    // Grouping depends on the user locale; the digits never do
    std::string digits;
    for (char c : withCommas(1234567)) {
        if (c >= '0' && c <= '9') digits += c;
    }
    EXPECT_EQ(digits, "1234567");
}

TEST(HelpersTest, WithCommas_NegativeAndLargeNumbers) {
    EXPECT_THAT(withCommas(-1000), HasSubstr("-"));
    EXPECT_FALSE(withCommas(std::numeric_limits<long long>::max()).empty());
    EXPECT_FALSE(withCommas(std::numeric_limits<size_t>::max()).empty());
}

TEST(HelpersTest, FormatDuration_Milliseconds) {
    EXPECT_EQ(formatDuration(0ms), "0 ms");
    EXPECT_EQ(formatDuration(999ms), "999 ms");
}

TEST(HelpersTest, FormatDuration_Seconds) {
    EXPECT_EQ(formatDuration(1000ms), "1.00 s");
    EXPECT_EQ(formatDuration(1500ms), "1.50 s");
    EXPECT_EQ(formatDuration(59990ms), "59.99 s");
}

TEST(HelpersTest, FormatDuration_Minutes) {
    EXPECT_EQ(formatDuration(60000ms), "1 m 0.0 s");
    EXPECT_EQ(formatDuration(125500ms), "2 m 5.5 s");
}

// ========== Configuration Table Tests ==========

TEST(HelpersTest, RenderConfiguration_HashLayout) {
    const std::vector<InputSummary> sets{ { "Inputs", 12, 3, 1 } };
    const std::string out = renderConfiguration(sets, 4, 4);

    EXPECT_THAT(out, HasSubstr("Inputs"));
    EXPECT_THAT(out, HasSubstr("Images"));
    EXPECT_THAT(out, HasSubstr("Index files"));
    EXPECT_THAT(out, HasSubstr("12"));
    EXPECT_THAT(out, HasSubstr("32x32 pixels"));
    EXPECT_THAT(out, HasSubstr("64 bits"));
    EXPECT_THAT(out, Not(HasSubstr("Max Distance")));
}

TEST(HelpersTest, RenderConfiguration_FindLayout) {
    const std::vector<InputSummary> sets{ { "Reference", 2, 0, 0 }, { "Target", 5, 0, 2 } };
    const std::string out = renderConfiguration(sets, 8, 1, 6);

    EXPECT_THAT(out, HasSubstr("Reference"));
    EXPECT_THAT(out, HasSubstr("Target"));
    EXPECT_THAT(out, HasSubstr("8x8 pixels"));
    EXPECT_THAT(out, HasSubstr("Max Distance"));
}

TEST(HelpersTest, RenderConfiguration_AutoThreads) {
    const std::string out = renderConfiguration({ { "Inputs", 1, 0, 0 } }, -1, 4);
    EXPECT_THAT(out, HasSubstr("auto ("));
}

TEST(HelpersTest, PrintConfiguration_WritesToStderr) {
    CerrCapture capture;
    printConfiguration({ { "Inputs", 7, 0, 0 } }, 2, 4);
    EXPECT_THAT(capture.str(), HasSubstr("Inputs"));
}

// ========== Progress Bar Tests ==========

TEST(HelpersTest, Bar_BasicCreation) {
    auto progressBar = bar("Hashing");
    EXPECT_FALSE(progressBar.is_completed());
}

TEST(HelpersTest, BarCallback_CompletesAtHundredPercent) {
    CerrCapture capture;
    auto progressBar = bar("Hashing", true, true);
    auto callback = barCallback(progressBar);

    doppel::ProgressInfo info;
    info.total = 4;
    info.completed = 2;
    callback(info);
    EXPECT_FALSE(progressBar.is_completed());

    info.completed = 4;
    callback(info);
    EXPECT_TRUE(progressBar.is_completed());
    EXPECT_THAT(capture.str(), HasSubstr("Hashing"));
}

TEST(HelpersTest, BarCallback_ShowsFailureCount) {
    CerrCapture capture;
    auto progressBar = bar("Hashing");
    auto callback = barCallback(progressBar);

    doppel::ProgressInfo info;
    info.total = 10;
    info.completed = 3;
    info.failed = 2;
    callback(info);

    EXPECT_THAT(capture.str(), HasSubstr("(2 failed)"));
}

TEST(HelpersTest, BarCallback_IgnoresUpdatesAfterCompletion) {
    CerrCapture capture;
    auto progressBar = bar("Search");
    auto callback = barCallback(progressBar);

    doppel::ProgressInfo done;
    callback(done); // empty total counts as complete
    ASSERT_TRUE(progressBar.is_completed());

    doppel::ProgressInfo late;
    late.total = 10;
    late.completed = 1;
    EXPECT_NO_THROW(callback(late));
    EXPECT_TRUE(progressBar.is_completed());
}

TEST(HelpersTest, CursorVisibility_HideShow) {
    CerrCapture capture;
    hideCursor();
    showCursor();
    EXPECT_EQ(capture.str(), "\033[?25l\033[?25h");
}

} // namespace App
