// STAKEFLOW - Staking State
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// In-memory state owned by the staking engine: one GlobalState and one
// Account per staker.

#ifndef STAKEFLOW_STAKING_STATE_H
#define STAKEFLOW_STAKING_STATE_H

#include <stakeflow/core/fixedpoint.h>
#include <stakeflow/core/types.h>

#include <cstdint>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Adjustment Reason
// ============================================================================

/// Why the reward rate last changed
enum class AdjustmentReason {
    None,
    /// Pool empty or nothing staked; rate forced to the floor
    FloorForced,
    DecreasedLowSustainability,
    IncreasedHighSustainability,
    /// Set by an administrator
    Manual
};

const char* AdjustmentReasonToString(AdjustmentReason reason);

// ============================================================================
// Global State
// ============================================================================

struct GlobalState {
    /// Sum of every Account::balance
    Amount totalStaked{0};

    /// Reward base units emitted per second across the whole pool
    Amount rewardRate{0};

    /// Cumulative reward per staked unit since inception (scaled 10^18)
    FixedPoint rewardPerUnitStored;

    /// Time of the last accrual settlement
    Timestamp lastUpdateTime{0};

    // Controller cadence
    Timestamp lastRateAdjustmentTime{0};
    int64_t rateAdjustmentPeriod{0};
    AdjustmentReason lastAdjustmentReason{AdjustmentReason::None};
    uint64_t adjustmentCount{0};

    // Policy bounds
    uint64_t maxAPR{0};                    // basis points
    uint64_t targetSustainabilityDays{0};
    Amount minRewardRate{0};
    Amount minimumStake{0};

    // Informational counters
    Amount totalFeesCollected{0};
    Amount totalRewardsDistributed{0};
    Amount totalRewardsFunded{0};

    std::string ToString() const;
};

// ============================================================================
// Account
// ============================================================================

/// Per-staker record; a zero-balance account is equivalent to absence
struct Account {
    /// Staked amount after fees
    Amount balance{0};

    /// rewardPerUnitStored at this account's last settlement
    FixedPoint rewardPerUnitPaid;

    /// Earned but not yet claimed
    Amount pendingReward{0};

    /// Balance-weighted average of stake entry times
    Timestamp weightedStakeTime{0};

    /// First deposit ever made by this account
    Timestamp firstStakeTime{0};

    Amount totalClaimed{0};

    bool IsEmpty() const { return balance == 0 && pendingReward == 0; }

    std::string ToString() const;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_STATE_H
