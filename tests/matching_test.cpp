#include <gtest/gtest.h>

#include "displaysnap/matching.hpp"

#include "display_state_builders.hpp"

using displaysnap::MatchStage;
using displaysnap::fakes::display;

TEST(MatchDisplays, PrefersExactPathOverOrdinal) {
    const std::vector targets = {display("DP-2", 0, true, 1920, 1080, 60), display("DP-1", 1, true, 1920, 1080, 60)};
    const std::vector live    = {display("DP-1", 0, true, 1920, 1080, 60), display("DP-2", 1, true, 1920, 1080, 60)};

    const auto        result = displaysnap::match_displays(targets, live);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].live_index, 1u);
    EXPECT_EQ(result.matches[0].stage, MatchStage::kExact);
    EXPECT_EQ(result.matches[1].live_index, 0u);
    EXPECT_TRUE(result.unmatched_targets.empty());
    EXPECT_TRUE(result.unmatched_live.empty());
}

TEST(MatchDisplays, ExactPassCompletesBeforeOrdinalPass) {
    // The first target would claim DP-1 by ordinal if passes were interleaved.
    const std::vector targets = {display("HDMI-A-1", 0, true, 1920, 1080, 60), display("DP-1", 3, true, 2560, 1440, 144)};
    const std::vector live    = {display("DP-1", 0, true, 2560, 1440, 144), display("HDMI-A-2", 1, true, 1920, 1080, 60)};

    const auto        result = displaysnap::match_displays(targets, live);

    ASSERT_EQ(result.matches.size(), 2u);
    EXPECT_EQ(result.matches[0].target_index, 0u);
    EXPECT_EQ(result.matches[0].live_index, 1u);
    EXPECT_EQ(result.matches[0].stage, MatchStage::kClosestMode);
    EXPECT_EQ(result.matches[1].live_index, 0u);
    EXPECT_EQ(result.matches[1].stage, MatchStage::kExact);
}

TEST(MatchDisplays, ClosestModeAcceptsRotatedResolution) {
    const std::vector targets = {display("DP-4", -1, true, 1080, 1920, 60)};
    const std::vector live    = {display("DP-9", 0, true, 1920, 1080, 60)};

    const auto        result = displaysnap::match_displays(targets, live);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].stage, MatchStage::kClosestMode);
}

TEST(MatchDisplays, ClosestModePicksNearestRefreshThenLowestOrdinal) {
    const std::vector targets = {display("DP-4", -1, true, 1920, 1080, 75)};
    const std::vector live    = {
        display("DP-7", 0, true, 1920, 1080, 60),
        display("DP-8", 1, true, 1920, 1080, 74),
        display("DP-9", 2, true, 1920, 1080, 76),
    };

    const auto result = displaysnap::match_displays(targets, live);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].live_index, 1u);
    EXPECT_EQ(result.unmatched_live, (std::vector<std::size_t>{0, 2}));
}

TEST(MatchDisplays, LeavesIncompatibleDisplaysUnmatched) {
    const std::vector targets = {display("DISPLAY3", 5, true, 1280, 1024, 75)};
    const std::vector live    = {display("DISPLAY1", 0, true, 2560, 1440, 59)};

    const auto        result = displaysnap::match_displays(targets, live);

    EXPECT_TRUE(result.matches.empty());
    EXPECT_EQ(result.unmatched_targets, (std::vector<std::size_t>{0}));
    EXPECT_EQ(result.unmatched_live, (std::vector<std::size_t>{0}));
    EXPECT_EQ(result.for_target(0), nullptr);
}

TEST(MatchDisplays, PairsEachLiveDisplayOnce) {
    const std::vector targets = {display("A", 0, true, 1920, 1080, 60), display("B", 0, true, 1920, 1080, 60)};
    const std::vector live    = {display("C", 0, true, 1920, 1080, 60)};

    const auto        result = displaysnap::match_displays(targets, live);

    ASSERT_EQ(result.matches.size(), 1u);
    EXPECT_EQ(result.matches[0].target_index, 0u);
    EXPECT_EQ(result.matches[0].stage, MatchStage::kOrdinal);
    EXPECT_EQ(result.unmatched_targets, (std::vector<std::size_t>{1}));
}

TEST(ResolveDisplay, FindsRenamedDisplayAndSkipsExcluded) {
    const auto        expected = display("DP-2", 1, true, 1920, 1080, 60);
    const std::vector live     = {display("DP-1", 0, true, 2560, 1440, 144), display("DP-6", 1, true, 1920, 1080, 60)};

    const auto        found = displaysnap::resolve_display(expected, live, {"DP-1"});

    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->live_index, 1u);
    EXPECT_EQ(found->stage, MatchStage::kOrdinal);

    const auto excluded = displaysnap::resolve_display(expected, live, {"DP-6"});
    EXPECT_FALSE(excluded.has_value());
}

TEST(ResolveDisplay, ReportsMissingDisplay) {
    const auto        expected = display("HDMI-A-1", 4, true, 3840, 2160, 30);
    const std::vector live     = {display("DP-1", 0, true, 2560, 1440, 144)};

    EXPECT_FALSE(displaysnap::resolve_display(expected, live, {}).has_value());
}
