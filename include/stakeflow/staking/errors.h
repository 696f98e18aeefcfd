// STAKEFLOW - Staking Errors
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Error taxonomy and result type returned by every staking operation.

#ifndef STAKEFLOW_STAKING_ERRORS_H
#define STAKEFLOW_STAKING_ERRORS_H

#include <stakeflow/core/types.h>

#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Error Codes
// ============================================================================

enum class StakingError {
    None,
    /// Zero or out-of-range parameter on an admin setter
    InvalidConfiguration,
    BelowMinimumStake,
    /// Withdraw amount exceeds account balance
    InsufficientBalance,
    /// Zero-amount withdraw or reward funding
    ZeroAmount,
    Unauthorized,
    /// Token vault signaled failure
    TransferFailed,
    /// Mutating call while another mutating call is in progress
    ReentrantCall,
    /// Checked arithmetic overflowed or underflowed
    ArithmeticOverflow
};

const char* StakingErrorToString(StakingError error);

// ============================================================================
// Operation Result
// ============================================================================

/**
 * Outcome of a staking operation.
 *
 * On success `amount` holds the value moved by the operation (net staked,
 * net payout, reward claimed, rate committed) and `fee` the fee charged.
 * On failure nothing was changed.
 */
struct OperationResult {
    StakingError error{StakingError::None};
    std::string message;
    Amount amount{0};
    Amount fee{0};

    bool IsSuccess() const { return error == StakingError::None; }
    explicit operator bool() const { return IsSuccess(); }

    static OperationResult Success(Amount amount = 0, Amount fee = 0) {
        OperationResult r;
        r.amount = amount;
        r.fee = fee;
        return r;
    }

    static OperationResult Failure(StakingError error, const std::string& msg) {
        OperationResult r;
        r.error = error;
        r.message = msg;
        return r;
    }

    std::string ToString() const;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_ERRORS_H
