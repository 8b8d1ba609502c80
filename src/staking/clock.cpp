// STAKEVAULT - Chain Clock
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/clock.h"
#include "stakevault/util/time.h"

namespace stakevault {
namespace staking {

void ManualChainClock::AdvanceBlocks(BlockHeight blocks, int64_t blockTime) {
    height_.fetch_add(blocks);
    now_.fetch_add(blocks * blockTime);
}

SystemChainClock::SystemChainClock(Timestamp genesisTime, int64_t blockTime)
    : genesisTime_(genesisTime), blockTime_(blockTime > 0 ? blockTime : 1) {}

Timestamp SystemChainClock::Now() const {
    return util::GetTime();
}

BlockHeight SystemChainClock::Height() const {
    Timestamp now = Now();
    if (now <= genesisTime_) {
        return 0;
    }
    return (now - genesisTime_) / blockTime_;
}

} // namespace staking
} // namespace stakevault
