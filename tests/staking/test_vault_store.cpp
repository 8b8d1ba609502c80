// STAKEVAULT - Vault Store Tests
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include <gtest/gtest.h>
#include <stakevault/db/memorydb.h>
#include <stakevault/staking/clock.h>
#include <stakevault/staking/vault_store.h>

#include <memory>

using namespace stakevault;
using namespace stakevault::staking;

namespace {

constexpr Timestamp START_TIME = 1700000000;
constexpr BlockHeight START_HEIGHT = 500;

Address MakeAddress(uint8_t id) {
    Address addr;
    addr[0] = id;
    addr[19] = id;
    return addr;
}

std::string AssetKey(AssetId asset) {
    std::string key(1, db::prefix::ENTRY);
    for (int shift = 56; shift >= 0; shift -= 8) {
        key.push_back(static_cast<char>((asset >> shift) & 0xff));
    }
    return key;
}

} // namespace

// ============================================================================
// Test Fixture
// ============================================================================

class VaultStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        admin_ = MakeAddress(1);
        alice_ = MakeAddress(2);
        vaultAddr_ = MakeAddress(0xEE);
        clock_ = std::make_shared<ManualChainClock>(START_TIME, START_HEIGHT);

        env_ = LocalEnvironment::Create();
        env_.genesisTime = START_TIME - 5000;
        env_.blockTime = 10;
        env_.authorizer->AddAdmin(admin_);
        ASSERT_TRUE(env_.tokens->Mint(alice_, 1000));
        ASSERT_TRUE(env_.tokens->Mint(vaultAddr_, 50000));

        vault_ = MakeVault(env_);
        env_.assets->RegisterReceiver(vaultAddr_, vault_.get());

        VaultParams params;
        params.rewardPerBlock = 100;
        params.earlyExitTax = 20;
        params.carryAmount = 5;
        params.stakeLimit = 10;
        params.stakingHours = 24;
        params.unbondingHours = 1;
        params.averageBlockTime = 10;
        ASSERT_TRUE(vault_->Initialize(admin_, params).IsOk());

        for (AssetId asset : {3, 1, 2}) {
            ASSERT_TRUE(env_.assets->Mint(alice_, asset));
            ASSERT_TRUE(vault_->Stake(alice_, asset).IsOk());
        }
    }

    void TearDown() override {
        env_.assets->UnregisterReceiver(vaultAddr_);
    }

    std::unique_ptr<StakeVault> MakeVault(const LocalEnvironment& env) {
        VaultContext ctx;
        ctx.custodian = env.assets;
        ctx.token = env.tokens;
        ctx.authorizer = env.authorizer;
        ctx.pauseGate = env.pauseGate;
        ctx.clock = clock_;
        return std::make_unique<StakeVault>(vaultAddr_, ctx);
    }

    Address admin_, alice_, vaultAddr_;
    std::shared_ptr<ManualChainClock> clock_;
    LocalEnvironment env_;
    std::unique_ptr<StakeVault> vault_;
    db::MemoryDatabase db_;
};

// ============================================================================
// Save and Load
// ============================================================================

TEST_F(VaultStoreTest, EmptyDatabaseLeavesVaultUninitialized) {
    VaultStore store(db_);
    EXPECT_FALSE(store.HasVault());

    LocalEnvironment env = LocalEnvironment::Create();
    ASSERT_TRUE(store.LoadEnvironment(env).ok());
    EXPECT_EQ(env.genesisTime, 0);
    EXPECT_EQ(env.blockTime, 0);

    auto fresh = MakeVault(env);
    ASSERT_TRUE(store.LoadVault(*fresh).ok());
    EXPECT_FALSE(fresh->IsInitialized());
}

TEST_F(VaultStoreTest, SaveAndLoadRestoresVault) {
    clock_->AdvanceBlocks(20, 10);
    ASSERT_TRUE(vault_->Unstake(alice_, 2, false).IsOk());

    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_, &env_).ok());
    EXPECT_TRUE(store.HasVault());

    LocalEnvironment env = LocalEnvironment::Create();
    ASSERT_TRUE(store.LoadEnvironment(env).ok());
    auto loaded = MakeVault(env);
    db::Status status = store.LoadVault(*loaded);
    ASSERT_TRUE(status.ok()) << status.ToString();

    EXPECT_TRUE(loaded->IsInitialized());
    EXPECT_EQ(loaded->TotalStakes(), 3u);
    EXPECT_EQ(loaded->ActiveStakeCount(), 2u);
    EXPECT_EQ(loaded->ListStakesByOwner(alice_), vault_->ListStakesByOwner(alice_));
    EXPECT_EQ(loaded->StakeInfo(2).value, vault_->StakeInfo(2).value);
    EXPECT_EQ(loaded->PendingReward(1).value, vault_->PendingReward(1).value);
    EXPECT_EQ(loaded->Settings().ToString(), vault_->Settings().ToString());
    EXPECT_TRUE(loaded->CheckInvariants().empty());
}

TEST_F(VaultStoreTest, EnvironmentRoundTrip) {
    env_.pauseGate->SetPaused(true);

    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_, &env_).ok());

    LocalEnvironment env = LocalEnvironment::Create();
    ASSERT_TRUE(store.LoadEnvironment(env).ok());
    EXPECT_EQ(env.genesisTime, START_TIME - 5000);
    EXPECT_EQ(env.blockTime, 10);
    EXPECT_TRUE(env.pauseGate->IsPaused());
    EXPECT_EQ(env.tokens->BalanceOf(alice_), env_.tokens->BalanceOf(alice_));
    EXPECT_EQ(env.assets->OwnerOf(1), vaultAddr_);
    EXPECT_TRUE(env.authorizer->IsAdmin(admin_));
}

TEST_F(VaultStoreTest, SaveDeletesRemovedEntries) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    EXPECT_TRUE(db_.Exists(AssetKey(3)));

    clock_->AdvanceTime(2 * 3600);
    ASSERT_TRUE(vault_->Withdraw(alice_, 3, true).IsOk());
    ASSERT_TRUE(store.Save(*vault_).ok());
    EXPECT_FALSE(db_.Exists(AssetKey(3)));
    EXPECT_TRUE(db_.Exists(AssetKey(1)));

    auto loaded = MakeVault(env_);
    ASSERT_TRUE(store.LoadVault(*loaded).ok());
    EXPECT_EQ(loaded->TotalStakes(), 2u);
    EXPECT_FALSE(loaded->StakeInfo(3).IsOk());
}

// ============================================================================
// Corruption
// ============================================================================

TEST_F(VaultStoreTest, CounterMismatchIsCorruption) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    ASSERT_TRUE(db_.Delete(AssetKey(1)).ok());

    auto loaded = MakeVault(env_);
    EXPECT_TRUE(store.LoadVault(*loaded).IsCorruption());
    EXPECT_FALSE(loaded->IsInitialized());
}

TEST_F(VaultStoreTest, MalformedEntryIsCorruption) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    ASSERT_TRUE(db_.Put(AssetKey(2), "junk").ok());

    auto loaded = MakeVault(env_);
    EXPECT_TRUE(store.LoadVault(*loaded).IsCorruption());
}

TEST_F(VaultStoreTest, MalformedEntryKeyIsCorruption) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    ASSERT_TRUE(db_.Put(std::string(1, db::prefix::ENTRY) + "x", "junk").ok());

    auto loaded = MakeVault(env_);
    EXPECT_TRUE(store.LoadVault(*loaded).IsCorruption());
}

TEST_F(VaultStoreTest, MissingSettingsIsCorruption) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    ASSERT_TRUE(db_.Delete(db::MakeKey(db::prefix::PARAMS)).ok());

    auto loaded = MakeVault(env_);
    EXPECT_TRUE(store.LoadVault(*loaded).IsCorruption());
}

TEST_F(VaultStoreTest, LoadIntoInitializedVaultIsRejected) {
    VaultStore store(db_);
    ASSERT_TRUE(store.Save(*vault_).ok());
    EXPECT_TRUE(store.LoadVault(*vault_).IsCorruption());
}
