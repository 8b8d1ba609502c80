// STAKEVAULT - Time Utility Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>

#include <stakevault/util/time.h>

namespace stakevault {
namespace util {
namespace {

class TimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        DisableMockTime();
    }

    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(TimeTest, GetTimeIsRecent) {
    // 2023-11-14, well before any machine running these tests
    EXPECT_GT(GetTime(), 1700000000);
    EXPECT_FALSE(IsMockTimeEnabled());
}

TEST_F(TimeTest, MockTime) {
    EnableMockTime();
    SetMockTime(1700000000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1700000000);

    SetMockTime(1700003600);
    EXPECT_EQ(GetTime(), 1700003600);

    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 1700003600);
}

TEST_F(TimeTest, EnableMockTimeKeepsExistingValue) {
    SetMockTime(1234);
    EnableMockTime();
    EXPECT_EQ(GetTime(), 1234);
}

TEST_F(TimeTest, FormatISO8601) {
    EXPECT_EQ(FormatISO8601(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(1700000000), "2023-11-14T22:13:20Z");
}

TEST_F(TimeTest, FormatDuration) {
    EXPECT_EQ(FormatDuration(Seconds(0)), "0s");
    EXPECT_EQ(FormatDuration(Seconds(59)), "59s");
    EXPECT_EQ(FormatDuration(Seconds(3600)), "1h");
    EXPECT_EQ(FormatDuration(Seconds(90061)), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds(7260)), "2h 1m");
    EXPECT_EQ(FormatDuration(Seconds(-120)), "-2m");
}

} // namespace
} // namespace util
} // namespace stakevault
