// STAKEFLOW - Staking Policy
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Initial parameters for the staking engine, their valid ranges, and the
// mapping from the [staking] configuration section.

#ifndef STAKEFLOW_STAKING_POLICY_H
#define STAKEFLOW_STAKING_POLICY_H

#include <stakeflow/core/types.h>
#include <stakeflow/util/config.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stakeflow {
namespace staking {

// ============================================================================
// Policy Constants
// ============================================================================

/// Configuration section holding staking parameters
constexpr const char* POLICY_SECTION = "staking";

/// Upper bound on any reward rate (base units per second)
constexpr Amount MAX_REWARD_RATE = 1000 * COIN;

/// Adjustment period bounds (seconds)
constexpr int64_t MIN_ADJUSTMENT_PERIOD = SECONDS_PER_HOUR;
constexpr int64_t MAX_ADJUSTMENT_PERIOD = 30 * SECONDS_PER_DAY;

/// Max APR bounds (basis points)
constexpr uint64_t MIN_MAX_APR = 1;
constexpr uint64_t MAX_MAX_APR = 100000;  // 1000%

/// Sustainability target bounds (days)
constexpr uint64_t MIN_TARGET_DAYS = 1;
constexpr uint64_t MAX_TARGET_DAYS = 3650;

/// Defaults
constexpr Amount DEFAULT_REWARD_RATE = 10000;          // 0.0001 token/s
constexpr Amount DEFAULT_MIN_REWARD_RATE = 100;
constexpr int64_t DEFAULT_ADJUSTMENT_PERIOD = SECONDS_PER_DAY;
constexpr uint64_t DEFAULT_MAX_APR = 5000;             // 50%
constexpr uint64_t DEFAULT_TARGET_DAYS = 180;
constexpr Amount DEFAULT_MINIMUM_STAKE = COIN;

// ============================================================================
// Staking Policy
// ============================================================================

struct StakingPolicy {
    Amount rewardRate{DEFAULT_REWARD_RATE};
    Amount minRewardRate{DEFAULT_MIN_REWARD_RATE};
    int64_t rateAdjustmentPeriod{DEFAULT_ADJUSTMENT_PERIOD};
    uint64_t maxAPR{DEFAULT_MAX_APR};
    uint64_t targetSustainabilityDays{DEFAULT_TARGET_DAYS};
    Amount minimumStake{DEFAULT_MINIMUM_STAKE};

    /// Address the vault holds staked principal and the reward pool under
    Address custody{Address::FromId(0xC0)};

    /// Receives the non-pool share of every fee
    Address feeRecipient{Address::FromId(0xFE)};

    /// Callers allowed to change configuration (used by the simulator)
    std::vector<Address> admins;

    /// First violated range, or nullopt when every field is valid
    std::optional<std::string> Validate() const;

    std::string ToString() const;
};

// ============================================================================
// Range Checks
// ============================================================================

bool IsValidRewardRate(Amount rate, Amount minRewardRate);
bool IsValidMinRewardRate(Amount value);
bool IsValidAdjustmentPeriod(int64_t seconds);
bool IsValidMaxAPR(uint64_t bps);
bool IsValidMinimumStake(Amount value);
bool IsValidTargetDays(uint64_t days);

/**
 * Read the [staking] section into a policy.
 *
 * Keys: rewardrate, minrewardrate (base units per second), adjustmentperiod
 * (duration such as "12h" or "1d"), maxapr (bp), targetdays, minimumstake
 * (decimal token amount), custody, feerecipient, admin (hex addresses, admin
 * may be comma separated). Missing keys keep the value already in `policy`.
 *
 * @param config Parsed configuration
 * @param policy Policy to update; left untouched on error
 * @return Error naming the offending key, or success
 */
util::ConfigParseResult LoadStakingPolicy(const util::ConfigManager& config,
                                          StakingPolicy& policy);

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_POLICY_H
