// STAKEVAULT - Chain Clock
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Source of the current time and block height seen by the vault.

#ifndef STAKEVAULT_STAKING_CLOCK_H
#define STAKEVAULT_STAKING_CLOCK_H

#include "stakevault/core/types.h"

#include <atomic>

namespace stakevault {
namespace staking {

class IChainClock {
public:
    virtual ~IChainClock() = default;

    /// Current time in Unix seconds
    virtual Timestamp Now() const = 0;

    /// Current block height
    virtual BlockHeight Height() const = 0;
};

/**
 * Clock driven explicitly by the caller. Used by tests and simulations.
 */
class ManualChainClock : public IChainClock {
public:
    ManualChainClock(Timestamp now, BlockHeight height) : now_(now), height_(height) {}

    Timestamp Now() const override { return now_.load(); }
    BlockHeight Height() const override { return height_.load(); }

    void SetNow(Timestamp now) { now_.store(now); }
    void SetHeight(BlockHeight height) { height_.store(height); }

    /// Advance by a number of blocks, moving time forward blockTime per block
    void AdvanceBlocks(BlockHeight blocks, int64_t blockTime);

    /// Advance wall-clock time only
    void AdvanceTime(int64_t seconds) { now_.fetch_add(seconds); }

private:
    std::atomic<Timestamp> now_;
    std::atomic<BlockHeight> height_;
};

/**
 * Clock backed by util::GetTime() (honours mock time). The height is derived
 * from a genesis timestamp and the average block time.
 */
class SystemChainClock : public IChainClock {
public:
    SystemChainClock(Timestamp genesisTime, int64_t blockTime);

    Timestamp Now() const override;
    BlockHeight Height() const override;

    Timestamp GenesisTime() const { return genesisTime_; }

private:
    Timestamp genesisTime_;
    int64_t blockTime_;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_CLOCK_H
