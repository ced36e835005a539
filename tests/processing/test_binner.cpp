/// @file tests/processing/test_binner.cpp
/// @brief Tests for steady-run duration binning.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/processing/binner.hpp"

#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace thermolog;

namespace {
constexpr double kInf = std::numeric_limits<double>::infinity();
constexpr double kMinute = 60.0;
} // namespace

// ─── Boundaries ───────────────────────────────────────────────────────────────

TEST(BinnerTest, LowerBoundInclusive) {
    Binner binner({1 * kMinute, 30 * kMinute, 60 * kMinute}, true, true);
    EXPECT_EQ(binner.label(30 * kMinute), "30 min ≤ τ < 60 min");
    EXPECT_EQ(binner.label(30 * kMinute - 1.0), "1 min ≤ τ < 30 min");
    EXPECT_EQ(binner.label(1 * kMinute), "1 min ≤ τ < 30 min");
}

TEST(BinnerTest, OpenEnds) {
    Binner binner({1 * kMinute, 30 * kMinute, 60 * kMinute}, true, true);
    EXPECT_EQ(binner.label(10.0), "τ < 1 min");
    EXPECT_EQ(binner.label(60 * kMinute), "τ ≥ 60 min");
    EXPECT_EQ(binner.label(5 * 60 * kMinute), "τ ≥ 60 min");
}

TEST(BinnerTest, ClosedEnds_LeaveOutsideUnlabelled) {
    Binner binner({1 * kMinute, 30 * kMinute, 60 * kMinute}, false, false);
    EXPECT_FALSE(binner.label(10.0).has_value());
    EXPECT_FALSE(binner.label(60 * kMinute).has_value());
    EXPECT_TRUE(binner.label(45 * kMinute).has_value());
}

// ─── Labels ───────────────────────────────────────────────────────────────────

TEST(BinnerTest, FromLimits_InfiniteEndsOpenBins) {
    Binner binner = Binner::from_limits({-kInf, 1 * kMinute, 30 * kMinute, 60 * kMinute, kInf});
    EXPECT_TRUE(binner.include_open_low());
    EXPECT_TRUE(binner.include_open_high());
    EXPECT_EQ(binner.thresholds().size(), 3u);
    EXPECT_EQ(binner.labels(), (std::vector<std::string>{
        "τ < 1 min", "1 min ≤ τ < 30 min", "30 min ≤ τ < 60 min", "τ ≥ 60 min"}));
}

TEST(BinnerTest, ShortThresholds_DisplayedInSeconds) {
    Binner binner({10.0, 30.0, 50.0}, false, true);
    EXPECT_FALSE(binner.display_minutes());
    EXPECT_EQ(binner.labels(), (std::vector<std::string>{
        "10 s ≤ τ < 30 s", "30 s ≤ τ < 50 s", "τ ≥ 50 s"}));
}

TEST(BinnerTest, Bin_LabelsEveryDuration) {
    Binner binner({kMinute, 2 * kMinute}, false, true);
    std::vector<double> durations = {30.0, 90.0, 600.0};
    auto labels = binner.bin(durations);
    ASSERT_EQ(labels.size(), 3u);
    EXPECT_FALSE(labels[0].has_value());
    EXPECT_EQ(labels[1], "1 min ≤ τ < 2 min");
    EXPECT_EQ(labels[2], "τ ≥ 2 min");
}

// ─── Errors ───────────────────────────────────────────────────────────────────

TEST(BinnerTest, InvalidThresholds_Throw) {
    EXPECT_THROW(Binner({60.0}, true, true), InvalidThreshold);
    EXPECT_THROW(Binner({}, true, true), InvalidThreshold);
    EXPECT_THROW(Binner({60.0, 30.0}, true, true), InvalidThreshold);
    EXPECT_THROW(Binner({60.0, 60.0}, true, true), InvalidThreshold);
    EXPECT_THROW(Binner({1.0, kInf}, true, true), InvalidThreshold);
    EXPECT_THROW(Binner::from_limits({-kInf, 60.0, kInf}), InvalidThreshold);
}
