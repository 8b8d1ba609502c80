// STAKEVAULT - Vault Parameter Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/staking/entry.h>
#include <stakevault/staking/error.h>
#include <stakevault/staking/params.h>
#include <stakevault/util/config.h>

using namespace stakevault;
using namespace stakevault::staking;

// ============================================================================
// VaultParams
// ============================================================================

TEST(VaultParamsTest, DefaultsAreValid) {
    VaultParams params;
    std::string error;
    EXPECT_TRUE(params.Validate(&error)) << error;
}

TEST(VaultParamsTest, ValidateRejectsOutOfRange) {
    std::string error;

    VaultParams params;
    params.rewardPerBlock = -1;
    EXPECT_FALSE(params.Validate(&error));
    EXPECT_EQ(error, "rewardperblock out of range");

    params = VaultParams();
    params.carryAmount = MAX_MONEY + 1;
    EXPECT_FALSE(params.Validate(&error));

    params = VaultParams();
    params.stakingHours = MAX_DURATION_HOURS + 1;
    EXPECT_FALSE(params.Validate(&error));

    params = VaultParams();
    params.unbondingHours = -1;
    EXPECT_FALSE(params.Validate(&error));

    params = VaultParams();
    params.averageBlockTime = 0;
    EXPECT_FALSE(params.Validate(&error));
    EXPECT_EQ(error, "blocktime must be positive");
}

TEST(VaultParamsTest, FromConfigReadsKeys) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "rewardperblock=250\n"
        "earlyexittax=40\n"
        "stakelimit=3\n"
        "carryamount=5\n"
        "stakinghours=48\n"
        "unbondinghours=2\n"
        "blocktime=15\n"
        "collection=0x0101010101010101010101010101010101010101\n").success);

    std::string error;
    auto params = VaultParams::FromConfig(config, &error);
    ASSERT_TRUE(params.has_value()) << error;
    EXPECT_EQ(params->rewardPerBlock, 250);
    EXPECT_EQ(params->earlyExitTax, 40);
    EXPECT_EQ(params->stakeLimit, 3u);
    EXPECT_EQ(params->carryAmount, 5);
    EXPECT_EQ(params->stakingHours, 48);
    EXPECT_EQ(params->unbondingHours, 2);
    EXPECT_EQ(params->averageBlockTime, 15);
    EXPECT_EQ(params->collection[0], 0x01);
    EXPECT_TRUE(params->rewardToken.IsNull());
}

TEST(VaultParamsTest, FromConfigKeepsDefaults) {
    util::ConfigManager config;
    auto params = VaultParams::FromConfig(config);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->rewardPerBlock, DEFAULT_REWARD_PER_BLOCK);
    EXPECT_EQ(params->stakeLimit, DEFAULT_STAKE_LIMIT);
    EXPECT_EQ(params->unbondingHours, DEFAULT_UNBONDING_HOURS);
}

TEST(VaultParamsTest, FromConfigRejectsMalformed) {
    std::string error;

    util::ConfigManager config;
    config.Set("stakinghours", "12abc");
    EXPECT_FALSE(VaultParams::FromConfig(config, &error).has_value());
    EXPECT_EQ(error, "Invalid integer for 'stakinghours'");

    util::ConfigManager negative;
    negative.Set("stakelimit", "-1");
    EXPECT_FALSE(VaultParams::FromConfig(negative, &error).has_value());

    util::ConfigManager badAddress;
    badAddress.Set("rewardtoken", "0x1234");
    EXPECT_FALSE(VaultParams::FromConfig(badAddress, &error).has_value());
    EXPECT_EQ(error, "Invalid address for 'rewardtoken'");
}

// ============================================================================
// VaultSettings
// ============================================================================

TEST(VaultSettingsTest, FromParamsConvertsHours) {
    VaultParams params;
    params.stakingHours = 10;
    params.unbondingHours = 3;

    VaultSettings settings = VaultSettings::FromParams(params, 1700000000);
    EXPECT_EQ(settings.stakingEndTime, 1700000000 + 36000);
    EXPECT_EQ(settings.unbondingPeriod, 10800);
    EXPECT_EQ(settings.rewardPerBlock, params.rewardPerBlock);
}

TEST(VaultSettingsTest, SerializeRestores) {
    VaultParams params;
    params.rewardPerBlock = 77;
    VaultSettings settings = VaultSettings::FromParams(params, 1000);

    auto bytes = settings.Serialize();
    auto copy = VaultSettings::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy->rewardPerBlock, 77);
    EXPECT_EQ(copy->stakingEndTime, settings.stakingEndTime);
    EXPECT_EQ(copy->ToString(), settings.ToString());

    EXPECT_FALSE(VaultSettings::Deserialize(bytes.data(), bytes.size() - 1).has_value());
}

// ============================================================================
// Entries and Errors
// ============================================================================

TEST(StakeEntryTest, SerializeRejectsUnknownState) {
    StakeEntry entry;
    entry.state = StakeState::Unbonding;
    entry.owner[0] = 0x42;
    entry.stakedAt = 100;
    entry.unbondingAt = 200;
    entry.lastClaimedBlock = 9;

    auto bytes = entry.Serialize();
    auto copy = StakeEntry::Deserialize(bytes.data(), bytes.size());
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(*copy, entry);

    bytes[0] = 7;
    EXPECT_FALSE(StakeEntry::Deserialize(bytes.data(), bytes.size()).has_value());
}

TEST(StakeErrorTest, ResultFormatting) {
    EXPECT_STREQ(StakeErrorToString(StakeError::OK), "OK");
    EXPECT_TRUE(StakeResult::Success().IsOk());

    auto failure = StakeResult::Failure(StakeError::STAKE_LIMIT_EXCEEDED, "limit 3");
    EXPECT_FALSE(failure.IsOk());
    EXPECT_NE(failure.ToString().find("limit 3"), std::string::npos);
    EXPECT_STREQ(StakeStateToString(StakeState::Free), "Free");
}
