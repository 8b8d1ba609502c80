// STAKEVAULT - Stake Registry Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/staking/registry.h>

#include <algorithm>

using namespace stakevault;
using namespace stakevault::staking;

// ============================================================================
// Test Fixture
// ============================================================================

class RegistryTest : public ::testing::Test {
protected:
    Address CreateTestAddress(uint8_t id) {
        Address addr;
        addr[0] = id;
        addr[19] = id;
        return addr;
    }

    StakeEntry CreateEntry(const Address& owner, StakeState state = StakeState::Staked) {
        StakeEntry entry;
        entry.state = state;
        entry.owner = owner;
        entry.stakedAt = 1700000000;
        entry.lastClaimedBlock = 100;
        return entry;
    }

    StakeRegistry registry_;
};

// ============================================================================
// Mutation Tests
// ============================================================================

TEST_F(RegistryTest, AddIndexesEntry) {
    Address alice = CreateTestAddress(1);
    ASSERT_TRUE(registry_.Add(10, CreateEntry(alice)));

    EXPECT_TRUE(registry_.Contains(10));
    ASSERT_NE(registry_.Get(10), nullptr);
    EXPECT_EQ(registry_.Get(10)->owner, alice);
    EXPECT_EQ(registry_.StakesCount(), 1u);
    EXPECT_EQ(registry_.ListByOwner(alice), std::vector<AssetId>{10});
    EXPECT_EQ(registry_.TrackedAssets(), std::vector<AssetId>{10});
    EXPECT_EQ(registry_.TrackedOwners(), std::vector<Address>{alice});
}

TEST_F(RegistryTest, AddRejectsDuplicate) {
    Address alice = CreateTestAddress(1);
    ASSERT_TRUE(registry_.Add(10, CreateEntry(alice)));
    EXPECT_FALSE(registry_.Add(10, CreateEntry(CreateTestAddress(2))));
    EXPECT_EQ(registry_.StakesCount(), 1u);
    EXPECT_EQ(registry_.Get(10)->owner, alice);
}

TEST_F(RegistryTest, ActiveCounterIsManualAndNeverNegative) {
    EXPECT_EQ(registry_.ActiveStakesCount(), 0u);
    EXPECT_FALSE(registry_.DecrementActive());

    registry_.IncrementActive();
    registry_.IncrementActive();
    EXPECT_EQ(registry_.ActiveStakesCount(), 2u);
    EXPECT_TRUE(registry_.DecrementActive());
    EXPECT_EQ(registry_.ActiveStakesCount(), 1u);
}

TEST_F(RegistryTest, RemoveDropsOwnerWithLastAsset) {
    Address alice = CreateTestAddress(1);
    Address bob = CreateTestAddress(2);
    registry_.Add(1, CreateEntry(alice, StakeState::Free));
    registry_.Add(2, CreateEntry(alice, StakeState::Free));
    registry_.Add(3, CreateEntry(bob, StakeState::Free));

    ASSERT_TRUE(registry_.Remove(1));
    EXPECT_EQ(registry_.CountByOwner(alice), 1u);
    EXPECT_EQ(registry_.TrackedOwners().size(), 2u);

    ASSERT_TRUE(registry_.Remove(2));
    EXPECT_EQ(registry_.CountByOwner(alice), 0u);
    EXPECT_TRUE(registry_.ListByOwner(alice).empty());
    EXPECT_EQ(registry_.TrackedOwners(), std::vector<Address>{bob});
    EXPECT_EQ(registry_.TrackedAssets(), std::vector<AssetId>{3});
    EXPECT_EQ(registry_.StakesCount(), 1u);

    EXPECT_FALSE(registry_.Remove(2));
    EXPECT_TRUE(registry_.CheckInvariants().empty());
}

TEST_F(RegistryTest, UpdateKeepsOwner) {
    Address alice = CreateTestAddress(1);
    registry_.Add(1, CreateEntry(alice));

    StakeEntry updated = CreateEntry(alice, StakeState::Unbonding);
    updated.unbondingAt = 1700007200;
    EXPECT_TRUE(registry_.Update(1, updated));
    EXPECT_EQ(*registry_.Get(1), updated);

    EXPECT_FALSE(registry_.Update(1, CreateEntry(CreateTestAddress(2))));
    EXPECT_FALSE(registry_.Update(99, updated));
}

TEST_F(RegistryTest, EntriesAreOrderedByAsset) {
    Address alice = CreateTestAddress(1);
    registry_.Add(30, CreateEntry(alice, StakeState::Free));
    registry_.Add(10, CreateEntry(alice, StakeState::Free));
    registry_.Add(20, CreateEntry(alice, StakeState::Free));

    auto entries = registry_.Entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].asset, 10u);
    EXPECT_EQ(entries[1].asset, 20u);
    EXPECT_EQ(entries[2].asset, 30u);
}

TEST_F(RegistryTest, ClearResetsEverything) {
    registry_.Add(1, CreateEntry(CreateTestAddress(1)));
    registry_.IncrementActive();
    registry_.Clear();

    EXPECT_EQ(registry_.StakesCount(), 0u);
    EXPECT_EQ(registry_.ActiveStakesCount(), 0u);
    EXPECT_TRUE(registry_.TrackedAssets().empty());
    EXPECT_TRUE(registry_.TrackedOwners().empty());
}

// ============================================================================
// Invariant Tests
// ============================================================================

TEST_F(RegistryTest, InvariantsHoldForConsistentRegistry) {
    for (AssetId id = 1; id <= 20; ++id) {
        StakeState state = id % 3 == 0 ? StakeState::Unbonding : StakeState::Staked;
        registry_.Add(id, CreateEntry(CreateTestAddress(static_cast<uint8_t>(id % 4 + 1)), state));
        if (state == StakeState::Staked) {
            registry_.IncrementActive();
        }
    }
    for (AssetId id = 3; id <= 20; id += 3) {
        registry_.Remove(id);
    }
    EXPECT_TRUE(registry_.CheckInvariants().empty());
}

TEST_F(RegistryTest, InvariantsReportActiveCounterDrift) {
    registry_.Add(1, CreateEntry(CreateTestAddress(1)));
    auto violations = registry_.CheckInvariants();
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_NE(violations[0].find("activeStakesCount"), std::string::npos);
}
