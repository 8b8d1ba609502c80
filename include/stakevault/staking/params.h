// STAKEVAULT - Vault Parameters
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// Initialization parameters (durations in hours, as supplied by the operator)
// and the live settings derived from them (absolute times in seconds).

#ifndef STAKEVAULT_STAKING_PARAMS_H
#define STAKEVAULT_STAKING_PARAMS_H

#include "stakevault/core/types.h"
#include "stakevault/util/time.h"

#include <optional>
#include <string>
#include <vector>

namespace stakevault {

namespace util {
class ConfigManager;
}

namespace staking {

// ============================================================================
// Defaults
// ============================================================================

/// Seconds per block used to estimate heights from wall-clock time
constexpr int64_t DEFAULT_AVERAGE_BLOCK_TIME = 12;

constexpr Amount DEFAULT_REWARD_PER_BLOCK = 1 * COIN;
constexpr Amount DEFAULT_EARLY_EXIT_TAX = COIN / 2;
constexpr Amount DEFAULT_CARRY_AMOUNT = COIN / 10;
constexpr uint64_t DEFAULT_STAKE_LIMIT = 1000;
constexpr int64_t DEFAULT_STAKING_HOURS = 720;
constexpr int64_t DEFAULT_UNBONDING_HOURS = 72;

/// Upper bound on any hour count (about 100 years)
constexpr int64_t MAX_DURATION_HOURS = 24 * 365 * 100;

/// Convert an operator-supplied hour count to seconds
inline int64_t HoursToSeconds(int64_t hours) {
    return hours * util::SECONDS_PER_HOUR;
}

// ============================================================================
// Initialization Parameters
// ============================================================================

struct VaultParams {
    /// Identity of the staked collection
    Address collection;

    /// Identity of the reward token
    Address rewardToken;

    /// Reward per block shared by all active stakes
    Amount rewardPerBlock{DEFAULT_REWARD_PER_BLOCK};

    /// Fixed tax for skipping the unbonding wait
    Amount earlyExitTax{DEFAULT_EARLY_EXIT_TAX};

    /// Maximum number of simultaneously active stakes
    uint64_t stakeLimit{DEFAULT_STAKE_LIMIT};

    /// Deposit taken at stake time and returned on withdrawal
    Amount carryAmount{DEFAULT_CARRY_AMOUNT};

    /// Staking period length, counted from initialization
    int64_t stakingHours{DEFAULT_STAKING_HOURS};

    int64_t unbondingHours{DEFAULT_UNBONDING_HOURS};

    int64_t averageBlockTime{DEFAULT_AVERAGE_BLOCK_TIME};

    /// Check ranges; on failure describes the first bad field in *error
    bool Validate(std::string* error = nullptr) const;

    /**
     * Build parameters from configuration keys (collection, rewardtoken,
     * rewardperblock, earlyexittax, stakelimit, carryamount, stakinghours,
     * unbondinghours, blocktime). Absent keys keep their defaults.
     */
    static std::optional<VaultParams> FromConfig(const util::ConfigManager& config,
                                                 std::string* error = nullptr);
};

// ============================================================================
// Live Settings
// ============================================================================

struct VaultSettings {
    Address collection;
    Address rewardToken;
    Amount rewardPerBlock{0};
    Amount earlyExitTax{0};
    uint64_t stakeLimit{0};
    Amount carryAmount{0};

    /// Absolute end of the staking period
    Timestamp stakingEndTime{0};

    /// Unbonding wait in seconds
    int64_t unbondingPeriod{0};

    int64_t averageBlockTime{DEFAULT_AVERAGE_BLOCK_TIME};

    static VaultSettings FromParams(const VaultParams& params, Timestamp now);

    std::vector<Byte> Serialize() const;
    static std::optional<VaultSettings> Deserialize(const Byte* data, size_t len);

    std::string ToString() const;
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_PARAMS_H
