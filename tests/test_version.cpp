#include <gtest/gtest.h>
#include "../src/version.hpp"

TEST(VersionTest, Comparisons) {
    EXPECT_LT(version_compare("1.2.3", "1.2.4"), 0);
    EXPECT_GT(version_compare("2.0.0", "1.9.9"), 0);
    EXPECT_EQ(version_compare("1.2.3", "1.2.3"), 0);
    EXPECT_LT(version_compare("1.10.0", "1.11.0"), 0);
    EXPECT_GT(version_compare("1.10.0", "1.9.0"), 0);

    EXPECT_LT(version_compare("1.0.0-alpha", "1.0.0"), 0);
    EXPECT_LT(version_compare("1.0.0-alpha", "1.0.0-beta"), 0);
    EXPECT_LT(version_compare("1.0.0-beta.2", "1.0.0-beta.11"), 0);
    EXPECT_LT(version_compare("1.0.0-1", "1.0.0-alpha"), 0);
}

TEST(VersionTest, LeadingZeros) {
    EXPECT_EQ(version_compare("01.2.3", "1.2.3"), 0);
    EXPECT_EQ(version_compare("1.02.003", "1.2.3"), 0);
    EXPECT_LT(version_compare("0.2.3", "0.2.4"), 0);
    EXPECT_LT(version_compare("00.2.3", "0.2.04"), 0);
    EXPECT_EQ(version_compare("0.0.0", "00.00.00"), 0);
}

TEST(VersionTest, MetadataAndColonIgnoredForOrdering) {
    EXPECT_EQ(version_compare("1.2.3+build.7", "1.2.3"), 0);
    EXPECT_EQ(version_compare("1.2.3:2.0.0", "1.2.3"), 0);
}

TEST(VersionTest, ShorthandForms) {
    EXPECT_EQ(version_compare("1", "1.0.0"), 0);
    EXPECT_EQ(version_compare("1.2", "1.2.0"), 0);
    EXPECT_LT(version_compare("1.2", "1.2.1"), 0);
}

TEST(VersionTest, InvalidSortsFirst) {
    EXPECT_LT(version_compare("garbage", "0.0.1"), 0);
    EXPECT_GT(version_compare("0.0.1", "garbage"), 0);
}

TEST(VersionTest, RangeMembership) {
    EXPECT_EQ(version_compare_range("1.2.3", "1.2.0:1.2.4"), 0);
    EXPECT_EQ(version_compare_range("1.2.3", "1.2.3:_"), 0);
    EXPECT_EQ(version_compare_range("9.0.0", "1.2.3:_"), 0);
    EXPECT_LT(version_compare_range("1.2.3", "1.2.4"), 0);
    EXPECT_GT(version_compare_range("1.2.5", "1.2.0:1.2.4"), 0);
    EXPECT_LT(version_compare_range("1.1.9", "1.2.0:1.2.4"), 0);
    EXPECT_EQ(version_compare_range("1.2.4", ":1.2.4"), 0);
    EXPECT_GT(version_compare_range("1.2.5", ":1.2.4"), 0);
    EXPECT_EQ(version_compare_range("0.0.1", ""), 0);
    EXPECT_EQ(version_compare_range("1.2.4+meta", "1.2.0:1.2.4"), 0);
}

TEST(VersionTest, Projections) {
    EXPECT_EQ(version_major("1.2.3"), "1");
    EXPECT_EQ(version_major("01.2.3"), "1");
    EXPECT_EQ(version_major_minor("1.2.3-rc1"), "1.2");
    EXPECT_EQ(version_major_minor("4"), "4.0");
    EXPECT_EQ(version_major("not-a-version"), "");
}

TEST(VersionTest, Metadata) {
    EXPECT_TRUE(version_has_meta("1.2.3+abc"));
    EXPECT_FALSE(version_has_meta("1.2.3-rc"));
    EXPECT_EQ(version_strip_meta("1.2.3+abc"), "1.2.3");
    EXPECT_EQ(version_strip_meta("1.2.3"), "1.2.3");
}

TEST(VersionTest, Validity) {
    EXPECT_TRUE(is_version_valid("1.2.3"));
    EXPECT_TRUE(is_version_valid("1.2.3-rc.1+build.5"));
    EXPECT_FALSE(is_version_valid("1.2"));
    EXPECT_FALSE(is_version_valid("1.2.3:_"));
    EXPECT_FALSE(is_version_valid("v1.2.3"));
}

TEST(VersionTest, MetadataTolerantMatching) {
    EXPECT_TRUE(version_matches("1.2.3+meta", "1.2.3"));
    EXPECT_TRUE(version_matches("1.2.3", "1.2.3"));
    EXPECT_TRUE(version_matches("1.2.3+meta", "1.2.3+meta"));
    EXPECT_FALSE(version_matches("1.2.3", "1.2.3+meta"));
    EXPECT_FALSE(version_matches("1.2.3+other", "1.2.3+meta"));
    EXPECT_FALSE(version_matches("1.2.4", "1.2.3"));
}

TEST(VersionTest, FormatRange) {
    EXPECT_EQ(format_version_range("1.0.0:_"), ">=1.0.0");
    EXPECT_EQ(format_version_range("1.0.0:2.0.0"), "1.0.0:2.0.0");
    EXPECT_EQ(format_version_range("1.0.0"), "1.0.0");
}
