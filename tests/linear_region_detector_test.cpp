#include "test_utils.hpp"
#include "tpd/errors.hpp"
#include "tpd/linear_region_detector.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <vector>

using namespace tpd;

class LinearRegionDetectorTest : public ::testing::Test {
  protected:
    TrimOptions options; // slope 1.0 K/s, tolerance 0.3, minimum 20 s
};

TEST(ComputeSlopesTest, FirstSlopeAndZeroStepsAreUndefined) {
    const auto slopes = compute_slopes({ 0.0, 1.0, 1.0, 3.0 }, { 300.0, 302.0, 303.0, 304.0 });
    ASSERT_EQ(slopes.size(), 4u);
    EXPECT_TRUE(std::isnan(slopes[0]));
    EXPECT_DOUBLE_EQ(slopes[1], 2.0);
    EXPECT_TRUE(std::isnan(slopes[2]));
    EXPECT_DOUBLE_EQ(slopes[3], 0.5);
}

TEST_F(LinearRegionDetectorTest, FindsRampFollowedByPlateau) {
    const auto times = tpd_test::uniform_times(51);
    const auto temperature = tpd_test::ramp_then_plateau(times, 300.0, 1.0, 30.0);

    const auto region = detect_linear_region(times, temperature, options);
    ASSERT_TRUE(region.has_value());
    // slope[0] is undefined, so the run starts at the second sample.
    EXPECT_DOUBLE_EQ(region->start_time, 1.0);
    EXPECT_DOUBLE_EQ(region->end_time, 30.0);
    EXPECT_GE(region->duration(), options.min_duration);
}

TEST_F(LinearRegionDetectorTest, RunStillOpenAtEndOfSeriesIsRejected) {
    // 10 s flat, then a 1 K/s ramp that is still going at t = 39.
    const auto times = tpd_test::uniform_times(40);
    const auto temperature = tpd_test::apply(times, [](double t) { return t <= 10.0 ? 300.0 : 300.0 + (t - 10.0); });

    EXPECT_FALSE(find_linear_run(times, temperature, options).has_value());
    EXPECT_FALSE(detect_linear_region(times, temperature, options).has_value());
}

TEST_F(LinearRegionDetectorTest, ReturnsFirstQualifyingRunNotLongest) {
    // 0-25 s ramp, 25-35 s plateau, 35-95 s ramp.
    const auto times = tpd_test::uniform_times(96);
    const auto temperature = tpd_test::apply(times, [](double t) {
        if (t <= 25.0) { return 300.0 + t; }
        if (t <= 35.0) { return 325.0; }
        return 325.0 + (t - 35.0);
    });

    const auto region = detect_linear_region(times, temperature, options);
    ASSERT_TRUE(region.has_value());
    EXPECT_DOUBLE_EQ(region->start_time, 1.0);
    EXPECT_DOUBLE_EQ(region->end_time, 25.0);
}

TEST_F(LinearRegionDetectorTest, SkipsRunsShorterThanMinimumDuration) {
    // 10 s ramp, plateau, a 30 s ramp, then a final plateau.
    const auto times = tpd_test::uniform_times(71);
    const auto temperature = tpd_test::apply(times, [](double t) {
        if (t <= 10.0) { return 300.0 + t; }
        if (t <= 30.0) { return 310.0; }
        if (t <= 60.0) { return 310.0 + (t - 30.0); }
        return 340.0;
    });

    const auto region = detect_linear_region(times, temperature, options);
    ASSERT_TRUE(region.has_value());
    EXPECT_DOUBLE_EQ(region->start_time, 31.0);
    EXPECT_DOUBLE_EQ(region->end_time, 60.0);
}

TEST_F(LinearRegionDetectorTest, NoRegionWhenSlopeIsOutsideTolerance) {
    const auto times = tpd_test::uniform_times(60);
    const auto temperature = tpd_test::ramp_then_plateau(times, 300.0, 2.0, 40.0);
    EXPECT_FALSE(detect_linear_region(times, temperature, options).has_value());

    options.target_slope = 2.0;
    EXPECT_TRUE(detect_linear_region(times, temperature, options).has_value());
}

TEST_F(LinearRegionDetectorTest, EmptyAndMismatchedInputGiveNoRegion) {
    EXPECT_FALSE(detect_linear_region({}, {}, options).has_value());
    EXPECT_FALSE(detect_linear_region({ 0.0, 1.0, 2.0 }, { 300.0, 301.0 }, options).has_value());
}

TEST_F(LinearRegionDetectorTest, NonMonotonicTimeBreaksTheRun) {
    auto times = tpd_test::uniform_times(60);
    const auto temperature = tpd_test::ramp_then_plateau(times, 300.0, 1.0, 49.0);
    times[15] = times[14]; // duplicate time stamp

    const auto run = find_linear_run(times, temperature, options);
    ASSERT_TRUE(run.has_value());
    // slope[15] is undefined and slope[16] halves, so the run resumes at 17.
    EXPECT_EQ(run->start, 17u);
    EXPECT_EQ(run->end, 49u);
}

TEST_F(LinearRegionDetectorTest, SmoothingSuppressesSingleSampleSpikes) {
    const auto times = tpd_test::uniform_times(71);
    auto temperature = tpd_test::ramp_then_plateau(times, 300.0, 1.0, 60.0);
    temperature[12] += 1.5;
    temperature[30] -= 1.5;
    temperature[48] += 1.5;

    EXPECT_FALSE(detect_linear_region(times, temperature, options).has_value());

    options.smoothing_enabled = true;
    options.smoothing_window = 3;
    options.tolerance = 0.6;
    const auto region = detect_linear_region(times, temperature, options);
    ASSERT_TRUE(region.has_value());
    EXPECT_GE(region->duration(), options.min_duration);
    // The plateau closes the run; the reflected edge keeps the first slope in tolerance.
    EXPECT_DOUBLE_EQ(region->start_time, 1.0);
    EXPECT_DOUBLE_EQ(region->end_time, 60.0);
}

TEST_F(LinearRegionDetectorTest, InvalidOptionsThrow) {
    const auto times = tpd_test::uniform_times(30);
    const auto temperature = tpd_test::apply(times, [](double t) { return 300.0 + t; });
    options.tolerance = -0.1;
    EXPECT_THROW(detect_linear_region(times, temperature, options), ConfigError);
    options.tolerance = 0.3;
    options.smoothing_window = 0;
    EXPECT_THROW(detect_linear_region(times, temperature, options), ConfigError);
}

TEST_F(LinearRegionDetectorTest, ExperimentWithoutTemperatureChannelHasNoRegion) {
    const auto times = tpd_test::uniform_times(40);
    Experiment experiment;
    experiment.name = "ions_only";
    experiment.channels.push_back(tpd_test::make_channel(
      "ions_only_Mass 4", ChannelRole::IonCurrent, times, tpd_test::apply(times, [](double t) { return t; })));
    EXPECT_FALSE(detect_linear_region(experiment, options).has_value());
}
