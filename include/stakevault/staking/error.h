// STAKEVAULT - Staking Error Codes
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License

#ifndef STAKEVAULT_STAKING_ERROR_H
#define STAKEVAULT_STAKING_ERROR_H

#include "stakevault/core/types.h"

#include <string>
#include <utility>

namespace stakevault {
namespace staking {

/// Reason a vault operation was rejected
enum class StakeError {
    OK,
    NOT_INITIALIZED,
    ALREADY_INITIALIZED,
    INVALID_PARAMS,
    UNAUTHORIZED,
    SYSTEM_PAUSED,
    REENTRANT_CALL,
    STAKING_PERIOD_ENDED,
    STAKE_LIMIT_EXCEEDED,
    CALLER_NOT_ASSET_HOLDER,
    ALREADY_STAKED,
    ENTRY_NOT_FOUND,
    NOT_STAKED,
    CALLER_NOT_ENTRY_OWNER,
    FORCED_EXIT_REQUIRED,
    PAST_TIMESTAMP_REQUIRED,
    NO_ACTIVE_STAKES,
    TRANSFER_FAILED,
    INSUFFICIENT_REWARD_POOL,
};

/// Convert error to string
const char* StakeErrorToString(StakeError error);

// ============================================================================
// Operation Results
// ============================================================================

/**
 * Outcome of a state-changing vault operation. On failure nothing was
 * changed; on success amount holds the reward or balance paid to the caller.
 */
struct StakeResult {
    StakeError error{StakeError::OK};

    /// Reward token moved to the caller by this operation
    Amount amount{0};

    /// Extra context for logs and the CLI
    std::string detail;

    bool IsOk() const { return error == StakeError::OK; }

    static StakeResult Success(Amount paid = 0) {
        StakeResult result;
        result.amount = paid;
        return result;
    }

    static StakeResult Failure(StakeError err, const std::string& why = "") {
        StakeResult result;
        result.error = err;
        result.detail = why;
        return result;
    }

    /// "OK" or "<code>: <detail>"
    std::string ToString() const;
};

/// Result of a fallible read-only query
template<typename T>
struct StakeQuery {
    StakeError error{StakeError::OK};
    T value{};

    bool IsOk() const { return error == StakeError::OK; }

    static StakeQuery Ok(T v) {
        StakeQuery q;
        q.value = std::move(v);
        return q;
    }

    static StakeQuery Fail(StakeError err) {
        StakeQuery q;
        q.error = err;
        return q;
    }
};

} // namespace staking
} // namespace stakevault

#endif // STAKEVAULT_STAKING_ERROR_H
