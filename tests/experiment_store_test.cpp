#include "test_utils.hpp"
#include "tpd/errors.hpp"
#include "tpd/experiment_store.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace tpd;

class ExperimentStoreTest : public ::testing::Test {
  protected:
    // 1 K/s ramp for 30 s, then 20 s plateau.
    static Experiment ramp_experiment(const std::string &name) {
        const auto times = tpd_test::uniform_times(51);
        return tpd_test::make_experiment(name,
                                         times,
                                         tpd_test::ramp_then_plateau(times, 300.0, 1.0, 30.0),
                                         { { "Mass 131", tpd_test::apply(times, [](double t) { return 0.5 * t; }) } });
    }

    ExperimentStore store;
    TrimOptions trim_options;
};

TEST_F(ExperimentStoreTest, KeepsInsertionOrder) {
    store.add(ramp_experiment("Xe_5K_1"));
    store.add(ramp_experiment("Xe_1K_1"));
    store.add(ramp_experiment("Xe_3K_1"));
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.names(), (std::vector<std::string>{ "Xe_5K_1", "Xe_1K_1", "Xe_3K_1" }));
    EXPECT_TRUE(store.contains("Xe_1K_1"));
    EXPECT_FALSE(store.contains("Xe_2K_1"));
}

TEST_F(ExperimentStoreTest, UnknownNamesThrowOutOfRange) {
    EXPECT_THROW(store.experiment("missing"), std::out_of_range);
    EXPECT_THROW(store.trim_region("missing"), std::out_of_range);
    EXPECT_THROW(store.trimmed("missing"), std::out_of_range);
    EXPECT_THROW(store.detect_and_trim("missing", trim_options), std::out_of_range);
    EXPECT_THROW(store.set_trim_region("missing", 0.0, 1.0), std::out_of_range);
}

TEST_F(ExperimentStoreTest, RejectsMisalignedExperiment) {
    Experiment experiment = ramp_experiment("bad");
    experiment.channels[0].time.pop_back();
    experiment.channels[0].value.pop_back();
    EXPECT_THROW(store.add(experiment), std::invalid_argument);
    EXPECT_TRUE(store.empty());
}

TEST_F(ExperimentStoreTest, DetectAndTrimStoresRegionAndTrimmedData) {
    store.add(ramp_experiment("Xe_5K_1"));
    const auto region = store.detect_and_trim("Xe_5K_1", trim_options);

    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(*region, (TrimRegion{ 1.0, 30.0 }));
    EXPECT_EQ(store.trim_region("Xe_5K_1"), region);
    const auto trimmed = store.trimmed("Xe_5K_1");
    ASSERT_NE(trimmed, nullptr);
    EXPECT_EQ(trimmed->row_count(), 30u);
    EXPECT_EQ(trimmed->region, *region);
}

TEST_F(ExperimentStoreTest, RetrimWithoutRegionClearsState) {
    store.add(ramp_experiment("Xe_5K_1"));
    ASSERT_TRUE(store.detect_and_trim("Xe_5K_1", trim_options).has_value());

    trim_options.target_slope = 5.0;
    EXPECT_FALSE(store.detect_and_trim("Xe_5K_1", trim_options).has_value());
    EXPECT_FALSE(store.trim_region("Xe_5K_1").has_value());
    EXPECT_EQ(store.trimmed("Xe_5K_1"), nullptr);
}

TEST_F(ExperimentStoreTest, DetectAndTrimAllCoversEveryExperiment) {
    store.add(ramp_experiment("Xe_5K_1"));
    Experiment flat = ramp_experiment("Xe_1K_1");
    flat.channels.back().value.assign(flat.row_count(), 300.0);
    store.add(flat);

    const auto regions = store.detect_and_trim_all(trim_options);
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_TRUE(regions.at("Xe_5K_1").has_value());
    EXPECT_FALSE(regions.at("Xe_1K_1").has_value());
    EXPECT_EQ(store.trim_regions(), regions);
}

TEST_F(ExperimentStoreTest, InvalidTrimOptionsThrowBeforeTouchingState) {
    store.add(ramp_experiment("Xe_5K_1"));
    ASSERT_TRUE(store.detect_and_trim("Xe_5K_1", trim_options).has_value());
    trim_options.smoothing_window = 0;
    EXPECT_THROW(store.detect_and_trim_all(trim_options), ConfigError);
    EXPECT_TRUE(store.trim_region("Xe_5K_1").has_value());
}

TEST_F(ExperimentStoreTest, ManualTrimReplacesSnapshot) {
    store.add(ramp_experiment("Xe_5K_1"));
    const auto first = store.set_trim_region("Xe_5K_1", 10.0, 20.0);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->row_count(), 11u);

    const auto second = store.set_trim_region("Xe_5K_1", 0.0, 4.0);
    EXPECT_EQ(second->row_count(), 5u);
    EXPECT_EQ(store.trimmed("Xe_5K_1"), second);
    // The earlier snapshot is untouched.
    EXPECT_EQ(first->row_count(), 11u);
    EXPECT_EQ(first->region, (TrimRegion{ 10.0, 20.0 }));
}

TEST_F(ExperimentStoreTest, ManualTrimValidatesBoundaries) {
    store.add(ramp_experiment("Xe_5K_1"));
    EXPECT_THROW(store.set_trim_region("Xe_5K_1", 20.0, 10.0), std::invalid_argument);
    EXPECT_THROW(store.set_trim_region("Xe_5K_1", std::nan(""), 10.0), std::invalid_argument);
    EXPECT_FALSE(store.trim_region("Xe_5K_1").has_value());

    // A region without samples still yields (empty) trimmed data.
    const auto trimmed = store.set_trim_region("Xe_5K_1", 500.0, 600.0);
    ASSERT_NE(trimmed, nullptr);
    EXPECT_TRUE(trimmed->empty());

    store.clear_trim_region("Xe_5K_1");
    EXPECT_EQ(store.trimmed("Xe_5K_1"), nullptr);
}

TEST_F(ExperimentStoreTest, ReplacingAnExperimentResetsItsTrim) {
    store.add(ramp_experiment("Xe_5K_1"));
    store.set_trim_region("Xe_5K_1", 0.0, 10.0);
    store.add(ramp_experiment("Xe_5K_1"));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.trim_region("Xe_5K_1").has_value());
}

TEST_F(ExperimentStoreTest, ChannelViews) {
    store.add(ramp_experiment("Xe_5K_1"));
    store.add(ramp_experiment("Xe_1K_1"));
    store.detect_and_trim("Xe_5K_1", trim_options);

    const auto raw = store.raw_channels();
    ASSERT_EQ(raw.size(), 2u);
    EXPECT_EQ(raw.at("Xe_1K_1").size(), 2u);
    EXPECT_EQ(raw.at("Xe_1K_1").at("Xe_1K_1_Mass 131").size(), 51u);

    const auto trimmed = store.trimmed_channels();
    ASSERT_EQ(trimmed.size(), 1u);
    EXPECT_EQ(trimmed.at("Xe_5K_1").at("Xe_5K_1_Temperature").size(), 30u);
}

TEST_F(ExperimentStoreTest, LoadFilesIsolatesFailures) {
    tpd_test::TempDir dir;
    const auto times = tpd_test::uniform_times(5);
    const std::string good_content = tpd_test::make_instrument_file(
      { { "Mass 131", times, { 1.0, 2.0, 3.0, 4.0, 5.0 } }, { "Temperature", times, { 1.0, 2.0, 3.0, 4.0, 5.0 } } });
    const auto good = dir.write("Xe_5K_1.txt", good_content);
    const auto malformed = dir.write("Xe_2K_1.txt", "too\nshort\n");
    const auto missing = dir.file("Xe_9K_1.txt");

    const LoadReport report = store.load_files({ good, malformed, missing });
    EXPECT_EQ(report.loaded, (std::vector<std::string>{ "Xe_5K_1" }));
    EXPECT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures.count(malformed), 1u);
    EXPECT_EQ(report.failures.count(missing), 1u);
    EXPECT_EQ(store.names(), (std::vector<std::string>{ "Xe_5K_1" }));
    EXPECT_EQ(store.experiment("Xe_5K_1").row_count(), 5u);
}
