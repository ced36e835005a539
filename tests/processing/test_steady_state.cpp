/// @file tests/processing/test_steady_state.cpp
/// @brief Tests for SteadyRunState and SteadyStateSegmenter.

#include <gtest/gtest.h>
#include "thermolog/core/errors.hpp"
#include "thermolog/processing/steady_state.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <vector>

using namespace thermolog;

// ─── Running state ────────────────────────────────────────────────────────────

TEST(SteadyRunStateTest, Start_ResetsStatistics) {
    SteadyRunState state;
    state.start(42.0);
    EXPECT_DOUBLE_EQ(state.mean, 42.0);
    EXPECT_DOUBLE_EQ(state.variance, 0.0);
    EXPECT_EQ(state.run_length, 1u);
}

TEST(SteadyRunStateTest, Step_TracksPopulationMoments) {
    SteadyRunState state;
    state.start(48.0);
    EXPECT_EQ(state.step(50.0, 2.0), 0u);
    EXPECT_EQ(state.step(52.0, 2.0), 0u);
    EXPECT_EQ(state.run_length, 3u);
    EXPECT_NEAR(state.mean, 50.0, 1e-12);
    EXPECT_NEAR(state.variance, 8.0 / 3.0, 1e-12);
}

TEST(SteadyRunStateTest, Step_ClosesRunAndRestartsAtTrigger) {
    SteadyRunState state;
    state.start(50.0);
    state.step(50.0, 2.0);
    EXPECT_EQ(state.step(60.0, 2.0), 2u);
    EXPECT_EQ(state.run_length, 1u);
    EXPECT_DOUBLE_EQ(state.mean, 60.0);
    EXPECT_DOUBLE_EQ(state.variance, 0.0);
}

TEST(SteadyRunStateTest, DeviationAtLimit_ExtendsRun) {
    SteadyRunState state;
    state.start(0.0);
    // Two samples 0 and 4 have standard deviation exactly 2
    EXPECT_EQ(state.step(4.0, 2.0), 0u);
    EXPECT_EQ(state.run_length, 2u);
}

// ─── Segmenter ────────────────────────────────────────────────────────────────

TEST(SteadyStateSegmenterTest, StepChange_SplitsAtTrigger) {
    SteadyStateSegmenter segmenter(2.0);
    std::vector<double> f = {50, 50, 50, 50, 90, 90, 90};

    EXPECT_EQ(segmenter.run_lengths(f), (std::vector<size_t>{4, 3}));

    auto durations = segmenter.durations(f, 10.0);
    ASSERT_EQ(durations.size(), f.size());
    for (size_t i = 0; i < 4; ++i) EXPECT_DOUBLE_EQ(durations[i], 40.0);
    for (size_t i = 4; i < 7; ++i) EXPECT_DOUBLE_EQ(durations[i], 30.0);
}

TEST(SteadyStateSegmenterTest, ConstantSeries_SingleRun) {
    SteadyStateSegmenter segmenter(2.0);
    std::vector<double> f(25, 60.0);
    EXPECT_EQ(segmenter.run_lengths(f), (std::vector<size_t>{25}));
}

TEST(SteadyStateSegmenterTest, SingleSample_SingleRun) {
    SteadyStateSegmenter segmenter;
    std::vector<double> f = {0.0};
    EXPECT_EQ(segmenter.run_lengths(f), (std::vector<size_t>{1}));
}

TEST(SteadyStateSegmenterTest, RunsCoverEverySampleOnce) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> jump(0.0, 1.0);
    std::normal_distribution<double> noise(0.0, 1.5);

    SteadyStateSegmenter segmenter(2.0);
    for (size_t n : {1u, 2u, 17u, 500u}) {
        std::vector<double> f;
        double level = 50.0;
        for (size_t i = 0; i < n; ++i) {
            if (jump(rng) < 0.05) level += 30.0;
            f.push_back(level + noise(rng));
        }

        auto runs = segmenter.run_lengths(f);
        EXPECT_EQ(std::accumulate(runs.begin(), runs.end(), size_t{0}), n);
        for (size_t length : runs) EXPECT_GT(length, 0u);

        auto per_sample = segmenter.sample_run_lengths(f);
        ASSERT_EQ(per_sample.size(), n);
        size_t i = 0;
        for (size_t length : runs) {
            for (size_t k = 0; k < length; ++k, ++i) {
                EXPECT_EQ(per_sample[i], length);
            }
        }
    }
}

TEST(SteadyStateSegmenterTest, EmptySeries_Throws) {
    SteadyStateSegmenter segmenter;
    std::vector<double> f;
    EXPECT_THROW(segmenter.run_lengths(f), EmptySeries);
    EXPECT_THROW(segmenter.durations(f, 10.0), EmptySeries);
}

TEST(SteadyStateSegmenterTest, NonPositiveLimit_Throws) {
    EXPECT_THROW(SteadyStateSegmenter(0.0), InvalidThreshold);
    EXPECT_THROW(SteadyStateSegmenter(-1.0), InvalidThreshold);
    EXPECT_THROW(SteadyStateSegmenter(std::numeric_limits<double>::quiet_NaN()), InvalidThreshold);
}
