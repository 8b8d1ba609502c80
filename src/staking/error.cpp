// STAKEVAULT - Staking Error Codes
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#include "stakevault/staking/error.h"

namespace stakevault {
namespace staking {

const char* StakeErrorToString(StakeError error) {
    switch (error) {
        case StakeError::OK: return "OK";
        case StakeError::NOT_INITIALIZED: return "Vault not initialized";
        case StakeError::ALREADY_INITIALIZED: return "Vault already initialized";
        case StakeError::INVALID_PARAMS: return "Invalid parameters";
        case StakeError::UNAUTHORIZED: return "Caller not authorized";
        case StakeError::SYSTEM_PAUSED: return "System paused";
        case StakeError::REENTRANT_CALL: return "Reentrant call rejected";
        case StakeError::STAKING_PERIOD_ENDED: return "Staking period ended";
        case StakeError::STAKE_LIMIT_EXCEEDED: return "Stake limit exceeded";
        case StakeError::CALLER_NOT_ASSET_HOLDER: return "Caller does not hold the asset";
        case StakeError::ALREADY_STAKED: return "Asset already staked";
        case StakeError::ENTRY_NOT_FOUND: return "Stake entry not found";
        case StakeError::NOT_STAKED: return "Entry is not in Staked state";
        case StakeError::CALLER_NOT_ENTRY_OWNER: return "Caller does not own the entry";
        case StakeError::FORCED_EXIT_REQUIRED: return "Still locked, forced exit with tax required";
        case StakeError::PAST_TIMESTAMP_REQUIRED: return "Timestamp must be in the past";
        case StakeError::NO_ACTIVE_STAKES: return "No active stakes";
        case StakeError::TRANSFER_FAILED: return "Custody transfer failed";
        case StakeError::INSUFFICIENT_REWARD_POOL: return "Insufficient reward pool";
        default: return "Unknown error";
    }
}

std::string StakeResult::ToString() const {
    if (IsOk()) {
        return "OK";
    }
    std::string result = StakeErrorToString(error);
    if (!detail.empty()) {
        result += ": " + detail;
    }
    return result;
}

} // namespace staking
} // namespace stakevault
