#include <gtest/gtest.h>
#include "../src/version.hpp"

TEST(VersionTest, Comparisons) {
    EXPECT_TRUE(version_compare("1.0", "2.0"));
    EXPECT_FALSE(version_compare("2.0", "1.0"));
    EXPECT_FALSE(version_compare("1.0", "1.0")); // strictly less

    EXPECT_TRUE(version_compare("1.2.9", "1.3.0"));
    EXPECT_TRUE(version_compare("1.9", "1.10"));
    EXPECT_TRUE(version_compare("1.0-alpha", "1.0"));
    EXPECT_TRUE(version_compare("1.0-alpha", "1.0-beta"));
    EXPECT_TRUE(version_compare("1.0-beta.1", "1.0-beta.2"));
}

TEST(VersionTest, MissingComponentsCountAsZero) {
    EXPECT_EQ(compare_versions("6.5", "6.5.0"), std::strong_ordering::equal);
    EXPECT_TRUE(version_compare("6.3", "6.5"));
    EXPECT_FALSE(version_compare("6.5.0", "6.5"));
}

TEST(VersionTest, LeadingVIsIgnored) {
    EXPECT_EQ(compare_versions("v1.2.0", "1.2.0"), std::strong_ordering::equal);
    EXPECT_TRUE(version_compare("V1.2.0", "1.2.1"));
}

TEST(VersionTest, ExtractVersionToken) {
    EXPECT_EQ(extract_version_token("v2.1.0"), "2.1.0");
    EXPECT_EQ(extract_version_token("release-1.4"), "1.4");
    EXPECT_EQ(extract_version_token("2.0.0-beta"), "2.0.0");
    EXPECT_EQ(extract_version_token("latest"), "");
    EXPECT_EQ(extract_version_token("build7"), "");
}
