// STAKEVAULT - Reward Accrual Engine
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Pro-rata block rewards for staked entries:
//
//   reward = (effectiveHeight - lastClaimedBlock) * (rewardPerBlock / activeStakes)
//
// The per-stake share is truncated before it is multiplied by the block
// count, and this ordering is relied on by existing balances. Once the
// staking period is over the effective height is frozen at the height
// estimated for the period end.

#ifndef STAKEVAULT_STAKING_REWARD_H
#define STAKEVAULT_STAKING_REWARD_H

#include "stakevault/staking/clock.h"
#include "stakevault/staking/entry.h"
#include "stakevault/staking/error.h"

namespace stakevault {
namespace staking {

/// Inputs to a reward computation, taken from the vault at call time
struct RewardSchedule {
    Amount rewardPerBlock{0};
    uint64_t activeStakes{0};
    Timestamp stakingEndTime{0};
    int64_t averageBlockTime{1};
};

class RewardEngine {
public:
    explicit RewardEngine(const IChainClock& clock) : clock_(clock) {}

    /**
     * Estimate the block height at a past moment:
     * height - (now - past) / averageBlockTime, never below zero.
     * Fails PAST_TIMESTAMP_REQUIRED unless past < now.
     */
    StakeQuery<BlockHeight> BlockHeightAt(Timestamp past, int64_t averageBlockTime) const;

    /// Current height, or the estimated period-end height once now > end
    StakeQuery<BlockHeight> EffectiveHeight(Timestamp stakingEndTime,
                                            int64_t averageBlockTime) const;

    /// Truncated share of one active stake; zero when there are none
    static Amount PerStakeShare(Amount rewardPerBlock, uint64_t activeStakes);

    /**
     * Reward owed to a Staked entry since its last claim.
     * Fails NOT_STAKED for other states and NO_ACTIVE_STAKES when the
     * schedule has no active stakes to divide by.
     */
    StakeQuery<Amount> PendingReward(const StakeEntry& entry,
                                     const RewardSchedule& schedule) const;

private:
    const IChainClock& clock_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_REWARD_H
