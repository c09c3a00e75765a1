/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/fastdrop/fastdrop.h>

namespace kcenon::fastdrop::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, PatchVersionIsCorrect) {
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, ProtocolIdentifierCarriesVersion) {
    EXPECT_EQ(protocol_id, "/fastdrop/transfer/1.0.0");
    EXPECT_EQ(wire_version, 1);
}

}  // namespace kcenon::fastdrop::test
