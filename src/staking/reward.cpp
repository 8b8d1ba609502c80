// STAKEVAULT - Reward Accrual Engine
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/reward.h"
#include "stakevault/util/logging.h"

namespace stakevault {
namespace staking {

StakeQuery<BlockHeight> RewardEngine::BlockHeightAt(Timestamp past,
                                                    int64_t averageBlockTime) const {
    Timestamp now = clock_.Now();
    if (past >= now) {
        return StakeQuery<BlockHeight>::Fail(StakeError::PAST_TIMESTAMP_REQUIRED);
    }
    if (averageBlockTime <= 0) {
        return StakeQuery<BlockHeight>::Fail(StakeError::INVALID_PARAMS);
    }

    BlockHeight elapsedBlocks = (now - past) / averageBlockTime;
    BlockHeight height = clock_.Height() - elapsedBlocks;
    return StakeQuery<BlockHeight>::Ok(height > 0 ? height : 0);
}

StakeQuery<BlockHeight> RewardEngine::EffectiveHeight(Timestamp stakingEndTime,
                                                      int64_t averageBlockTime) const {
    if (clock_.Now() > stakingEndTime) {
        return BlockHeightAt(stakingEndTime, averageBlockTime);
    }
    return StakeQuery<BlockHeight>::Ok(clock_.Height());
}

Amount RewardEngine::PerStakeShare(Amount rewardPerBlock, uint64_t activeStakes) {
    if (activeStakes == 0 || rewardPerBlock <= 0) {
        return 0;
    }
    return rewardPerBlock / static_cast<Amount>(activeStakes);
}

StakeQuery<Amount> RewardEngine::PendingReward(const StakeEntry& entry,
                                               const RewardSchedule& schedule) const {
    if (entry.state != StakeState::Staked) {
        return StakeQuery<Amount>::Fail(StakeError::NOT_STAKED);
    }
    if (schedule.activeStakes == 0) {
        return StakeQuery<Amount>::Fail(StakeError::NO_ACTIVE_STAKES);
    }

    auto height = EffectiveHeight(schedule.stakingEndTime, schedule.averageBlockTime);
    if (!height.IsOk()) {
        return StakeQuery<Amount>::Fail(height.error);
    }

    if (height.value <= entry.lastClaimedBlock) {
        return StakeQuery<Amount>::Ok(0);
    }

    BlockHeight blocks = height.value - entry.lastClaimedBlock;
    Amount share = PerStakeShare(schedule.rewardPerBlock, schedule.activeStakes);

    Amount reward = MAX_MONEY;
    if (share > 0 && blocks > MAX_MONEY / share) {
        LOG_WARN(util::LogCategory::REWARD) << "Reward overflow over " << blocks
                                            << " blocks, capped";
    } else {
        reward = blocks * share;
    }

    return StakeQuery<Amount>::Ok(reward);
}

} // namespace staking
} // namespace stakevault
