#include "test_utils.hpp"
#include "tpd/trim_applier.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace tpd;

class TrimApplierTest : public ::testing::Test {
  protected:
    void SetUp() override {
        times = tpd_test::uniform_times(10);
        experiment = tpd_test::make_experiment("Xe_5K_1",
                                               times,
                                               tpd_test::apply(times, [](double t) { return 300.0 + t; }),
                                               { { "Mass 131", tpd_test::apply(times, [](double t) { return 10.0 * t; }) },
                                                 { "Mass 132", tpd_test::apply(times, [](double t) { return -t; }) } });
    }

    std::vector<double> times;
    Experiment experiment;
};

TEST_F(TrimApplierTest, KeepsRowsInsideInclusiveRegion) {
    const TrimmedExperiment trimmed = apply_trim(experiment, TrimRegion{ 2.5, 6.0 });

    EXPECT_EQ(trimmed.name, experiment.name);
    EXPECT_EQ(trimmed.region, (TrimRegion{ 2.5, 6.0 }));
    ASSERT_EQ(trimmed.channels.size(), 3u);
    EXPECT_EQ(trimmed.row_count(), 4u);
    for (const auto &channel : trimmed.channels) {
        ASSERT_EQ(channel.size(), 4u);
        EXPECT_DOUBLE_EQ(channel.time.front(), 3.0);
        EXPECT_DOUBLE_EQ(channel.time.back(), 6.0);
    }
    EXPECT_EQ(trimmed.find_channel("Xe_5K_1_Mass 131")->value, (std::vector<double>{ 30.0, 40.0, 50.0, 60.0 }));
    EXPECT_EQ(trimmed.find_channel("Xe_5K_1_Mass 132")->value, (std::vector<double>{ -3.0, -4.0, -5.0, -6.0 }));
}

TEST_F(TrimApplierTest, PreservesRolesAndTemperatureTag) {
    const TrimmedExperiment trimmed = apply_trim(experiment, TrimRegion{ 0.0, 9.0 });
    ASSERT_NE(trimmed.temperature_channel(), nullptr);
    EXPECT_EQ(trimmed.temperature_channel()->name, "Xe_5K_1_Temperature");
    EXPECT_TRUE(trimmed.temperature_channel()->is_temperature());
    EXPECT_EQ(trimmed.ion_channels().size(), 2u);
    EXPECT_EQ(trimmed.row_count(), experiment.row_count());
}

TEST_F(TrimApplierTest, TrimmingTwiceWithSameRegionIsIdempotent) {
    const TrimRegion region{ 1.0, 7.5 };
    const TrimmedExperiment once = apply_trim(experiment, region);

    Experiment again_input;
    again_input.name = once.name;
    again_input.channels = once.channels;
    again_input.temperature_index = once.temperature_index;
    const TrimmedExperiment twice = apply_trim(again_input, region);

    ASSERT_EQ(once.channels.size(), twice.channels.size());
    for (std::size_t c = 0; c < once.channels.size(); ++c) {
        EXPECT_EQ(once.channels[c].time, twice.channels[c].time);
        EXPECT_EQ(once.channels[c].value, twice.channels[c].value);
    }
}

TEST_F(TrimApplierTest, RegionOutsideDataGivesEmptyChannels) {
    const TrimmedExperiment trimmed = apply_trim(experiment, TrimRegion{ 100.0, 200.0 });
    EXPECT_TRUE(trimmed.empty());
    EXPECT_EQ(trimmed.channels.size(), experiment.channels.size());
    for (const auto &channel : trimmed.channels) { EXPECT_TRUE(channel.empty()); }
}

TEST_F(TrimApplierTest, SelectsRowsByTemperatureTimeStamps) {
    // Ion channel clock is offset; rows follow the temperature channel.
    experiment.channels[0].time = tpd_test::apply(times, [](double t) { return t + 100.0; });
    EXPECT_EQ(select_rows(experiment, TrimRegion{ 4.0, 5.0 }), (std::vector<std::size_t>{ 4, 5 }));

    const TrimmedExperiment trimmed = apply_trim(experiment, TrimRegion{ 4.0, 5.0 });
    EXPECT_EQ(trimmed.channels[0].time, (std::vector<double>{ 104.0, 105.0 }));
}

TEST_F(TrimApplierTest, FallsBackToFirstChannelWithoutTemperatureTag) {
    experiment.temperature_index.reset();
    experiment.channels[0].time = tpd_test::apply(times, [](double t) { return 2.0 * t; });
    EXPECT_EQ(trim_reference_channel(experiment), &experiment.channels[0]);
    EXPECT_EQ(select_rows(experiment, TrimRegion{ 4.0, 8.0 }), (std::vector<std::size_t>{ 2, 3, 4 }));
}

TEST_F(TrimApplierTest, DoesNotModifyInput) {
    const Experiment before = experiment;
    (void)apply_trim(experiment, TrimRegion{ 2.0, 3.0 });
    ASSERT_EQ(experiment.channels.size(), before.channels.size());
    for (std::size_t c = 0; c < before.channels.size(); ++c) {
        EXPECT_EQ(experiment.channels[c].value, before.channels[c].value);
    }
}

TEST_F(TrimApplierTest, MisalignedChannelsThrow) {
    experiment.channels[1].time.pop_back();
    experiment.channels[1].value.pop_back();
    EXPECT_THROW(apply_trim(experiment, TrimRegion{ 0.0, 5.0 }), std::invalid_argument);
}
