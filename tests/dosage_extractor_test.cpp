#include "tpd/dosage_extractor.hpp"
#include <gtest/gtest.h>

using namespace tpd;

TEST(DosageExtractorTest, ReadsIntegerDosage) {
    const auto dosage = extract_dosage("Xe_5K_1");
    ASSERT_TRUE(dosage.has_value());
    EXPECT_DOUBLE_EQ(*dosage, 5.0);
}

TEST(DosageExtractorTest, ReadsCommaDecimalAndLowercaseUnit) {
    const auto dosage = extract_dosage("Xe_12,5k_2");
    ASSERT_TRUE(dosage.has_value());
    EXPECT_DOUBLE_EQ(*dosage, 12.5);
}

TEST(DosageExtractorTest, ReadsDotDecimal) {
    const auto dosage = extract_dosage("Kr_0.75K_3");
    ASSERT_TRUE(dosage.has_value());
    EXPECT_DOUBLE_EQ(*dosage, 0.75);
}

TEST(DosageExtractorTest, IgnoresThePrefix) {
    // "10K_" in the prefix must not be read as the dosage.
    const auto dosage = extract_dosage("10K_2K_1");
    ASSERT_TRUE(dosage.has_value());
    EXPECT_DOUBLE_EQ(*dosage, 2.0);
}

TEST(DosageExtractorTest, MissingDosageIsNullopt) {
    EXPECT_FALSE(extract_dosage("Xe_NoDose_3").has_value());
    EXPECT_FALSE(extract_dosage("Xe5K1").has_value());
    EXPECT_FALSE(extract_dosage("Xe_5K").has_value()); // unit must be followed by '_'
    EXPECT_FALSE(extract_dosage("").has_value());
    // The number must directly follow a '_'.
    EXPECT_FALSE(extract_dosage("Xe_NoDose5K_3").has_value());
    EXPECT_FALSE(extract_dosage("Xe_.5K_1").has_value());
    EXPECT_FALSE(extract_dosage("Xe_abc12,5k_2").has_value());
}
