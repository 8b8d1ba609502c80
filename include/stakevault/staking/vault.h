// STAKEVAULT - Stake Vault
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Custody vault for unique assets earning pro-rata block rewards.
//
// Key features:
// - Per-asset lifecycle: Staked -> Unbonding -> Free -> removed
// - Pro-rata rewards frozen at the end of the staking period
// - Early exit against a fixed tax, unconditional withdrawal after the end
// - Administrative settings, pause gate and emergency withdrawals
//
// Every state-changing operation is all-or-nothing: preconditions are checked
// first, token and asset transfers are journalled and rolled back if a later
// transfer fails, and the registry is only updated once all transfers went
// through. Calls made back into the vault while an operation is running
// (for example from a custody callback) are rejected with REENTRANT_CALL.

#ifndef STAKEVAULT_STAKING_VAULT_H
#define STAKEVAULT_STAKING_VAULT_H

#include "stakevault/staking/clock.h"
#include "stakevault/staking/collaborators.h"
#include "stakevault/staking/entry.h"
#include "stakevault/staking/error.h"
#include "stakevault/staking/params.h"
#include "stakevault/staking/registry.h"
#include "stakevault/staking/reward.h"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stakevault {
namespace staking {

/// Collaborators the vault talks to; all are required
struct VaultContext {
    std::shared_ptr<IAssetCustodian> custodian;
    std::shared_ptr<ITokenLedger> token;
    std::shared_ptr<IAuthorizer> authorizer;
    std::shared_ptr<IPauseGate> pauseGate;
    std::shared_ptr<IChainClock> clock;
};

/// Complete persisted state of a vault
struct VaultSnapshot {
    bool initialized{false};
    VaultSettings settings;
    std::vector<StakeView> entries;
    uint64_t stakesCount{0};
    uint64_t activeStakesCount{0};
};

class StakeVault : public IAssetReceiver {
public:
    /**
     * @param self Custody account of the vault
     * @param context Collaborators; throws std::invalid_argument if one is missing
     */
    StakeVault(const Address& self, VaultContext context);
    ~StakeVault() override;

    StakeVault(const StakeVault&) = delete;
    StakeVault& operator=(const StakeVault&) = delete;

    const Address& VaultAddress() const { return self_; }

    // ========================================================================
    // Initialization
    // ========================================================================

    /// One-time setup; a second call fails ALREADY_INITIALIZED
    StakeResult Initialize(const Address& caller, const VaultParams& params);

    bool IsInitialized() const;

    // ========================================================================
    // Staking Operations
    // ========================================================================

    /// Deposit an asset plus the carry amount and start accruing rewards
    StakeResult Stake(const Address& caller, AssetId asset);

    /**
     * Leave the Staked state after settling the pending reward. Without
     * forceWithTax the entry starts unbonding; with it the exit tax is
     * charged and the entry becomes Free.
     */
    StakeResult Unstake(const Address& caller, AssetId asset, bool forceWithTax);

    /**
     * Return the asset and the carry deposit and delete the entry.
     *
     * Before the staking period ends a caller still inside a lock window
     * (Staked, or Unbonding with unbondingAt in the future) must pass
     * forceWithTax, which charges the exit tax. After the period ends
     * withdrawal is unconditional and charges nothing.
     *
     * StakeResult::amount holds the reward plus carry paid out.
     */
    StakeResult Withdraw(const Address& caller, AssetId asset, bool forceWithTax);

    /// Pay the pending reward of one Staked entry
    StakeResult ClaimReward(const Address& caller, AssetId asset);

    /// Pay the pending rewards of every Staked entry of the caller
    StakeResult ClaimAllRewards(const Address& caller);

    // ========================================================================
    // Administration
    // ========================================================================

    StakeResult SetStakeLimit(const Address& caller, uint64_t limit);
    StakeResult SetRewardPerBlock(const Address& caller, Amount reward);
    StakeResult SetEarlyExitTax(const Address& caller, Amount tax);
    StakeResult SetCarryAmount(const Address& caller, Amount carry);

    /// End the staking period the given number of hours from now
    StakeResult SetStakingEndTime(const Address& caller, int64_t hoursFromNow);

    StakeResult SetUnbondingPeriod(const Address& caller, int64_t hours);

    StakeResult Pause(const Address& caller);
    StakeResult Unpause(const Address& caller);

    /// Send the vault's whole token balance to the caller
    StakeResult ForceWithdrawRewardPool(const Address& caller);

    /// Send an asset in custody to the caller; the registry is not touched
    StakeResult ForceWithdrawAsset(const Address& caller, AssetId asset);

    // ========================================================================
    // IAssetReceiver
    // ========================================================================

    /// Accepts every incoming asset
    bool OnAssetReceived(const Address& op, const Address& from, AssetId asset) override;

    // ========================================================================
    // Queries
    // ========================================================================

    std::vector<AssetId> ListStakesByOwner(const Address& owner) const;
    std::vector<StakeView> StakesOf(const Address& owner) const;
    StakeQuery<StakeEntry> StakeInfo(AssetId asset) const;
    StakeQuery<Timestamp> UnbondingTimestamp(AssetId asset) const;
    StakeQuery<Amount> PendingReward(AssetId asset) const;
    size_t StakeCount(const Address& owner) const;

    Timestamp StakingEndTime() const;
    int64_t UnbondingPeriod() const;
    Amount RewardPerBlock() const;
    uint64_t StakeLimit() const;
    Amount CarryAmount() const;
    Amount EarlyExitTax() const;
    int64_t AverageBlockTime() const;

    std::vector<Address> TrackedOwners() const;
    std::vector<AssetId> TrackedAssets() const;
    uint64_t TotalStakes() const;
    uint64_t ActiveStakeCount() const;

    bool IsPaused() const;
    bool IsStakingOver() const;
    VaultSettings Settings() const;

    /// Registry invariant violations; empty when consistent
    std::vector<std::string> CheckInvariants() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    VaultSnapshot Snapshot() const;

    /**
     * Load persisted state into a fresh vault. The registry is rebuilt entry
     * by entry and the stored counters must match the rebuilt ones.
     */
    StakeResult Restore(const VaultSnapshot& snapshot);

private:
    /// Marks an operation in progress for the lifetime of the scope
    class OperationScope {
    public:
        explicit OperationScope(bool& flag) : flag_(flag) { flag_ = true; }
        ~OperationScope() { flag_ = false; }
    private:
        bool& flag_;
    };

    /// Reward settlement computed ahead of an exit
    struct ExitPlan {
        StakeEntry updated;
        Amount reward{0};
        Amount tax{0};
        bool leavesActive{false};
    };

    StakeError CheckUserOperation(const Address& caller) const;
    StakeError CheckAdminOperation(const Address& caller, AdminAction action) const;
    StakeError FindOwnedEntry(const Address& caller, AssetId asset,
                              const StakeEntry*& entry) const;

    /// Settle rewards and move a Staked entry to Unbonding or Free
    StakeError PlanUnstake(const StakeEntry& entry, bool forceWithTax,
                           Timestamp now, ExitPlan& plan) const;

    RewardSchedule Schedule() const;

    StakeResult Reject(const char* op, StakeError error,
                       const std::string& detail = "") const;

    template<typename Apply>
    StakeResult AdminUpdate(const Address& caller, AdminAction action, Apply&& apply);

    Address self_;
    VaultContext ctx_;
    RewardEngine engine_;

    StakeRegistry registry_;
    VaultSettings settings_;
    bool initialized_{false};
    bool inOperation_{false};

    mutable std::recursive_mutex mutex_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_VAULT_H
