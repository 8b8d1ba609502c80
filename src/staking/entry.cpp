// STAKEVAULT - Stake Entry
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/entry.h"
#include "stakevault/core/serialize.h"

#include <sstream>

namespace stakevault {
namespace staking {

const char* StakeStateToString(StakeState state) {
    switch (state) {
        case StakeState::Staked: return "Staked";
        case StakeState::Unbonding: return "Unbonding";
        case StakeState::Free: return "Free";
        default: return "Unknown";
    }
}

std::vector<Byte> StakeEntry::Serialize() const {
    DataStream ss;
    ss << static_cast<uint8_t>(state);
    ss << owner;
    ss << stakedAt;
    ss << unbondingAt;
    ss << lastClaimedBlock;
    return ss.Bytes();
}

std::optional<StakeEntry> StakeEntry::Deserialize(const Byte* data, size_t len) {
    try {
        DataStream ss(data, len);
        StakeEntry entry;

        uint8_t state;
        ss >> state;
        if (state > static_cast<uint8_t>(StakeState::Free)) {
            return std::nullopt;
        }
        entry.state = static_cast<StakeState>(state);

        ss >> entry.owner;
        ss >> entry.stakedAt;
        ss >> entry.unbondingAt;
        ss >> entry.lastClaimedBlock;

        if (!ss.empty()) {
            return std::nullopt;
        }
        return entry;
    } catch (const std::ios_base::failure&) {
        return std::nullopt;
    }
}

std::string StakeEntry::ToString() const {
    std::ostringstream ss;
    ss << "StakeEntry(state=" << StakeStateToString(state)
       << ", owner=" << owner.ToHex()
       << ", stakedAt=" << stakedAt
       << ", unbondingAt=" << unbondingAt
       << ", lastClaimedBlock=" << lastClaimedBlock << ")";
    return ss.str();
}

} // namespace staking
} // namespace stakevault
