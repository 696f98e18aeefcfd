// STAKEFLOW - Fee Schedule
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Entry and duration-tiered exit fees, and the pool/recipient split.
//
// Exit fee tiers (half-open intervals on holding duration):
//   [0, 7d)   500 bp
//   [7d, 14d) 350 bp
//   [14d, 30d) 200 bp
//   [30d, ∞)  100 bp
// Deposits always pay ENTRY_FEE_BPS regardless of duration.

#ifndef STAKEFLOW_STAKING_FEES_H
#define STAKEFLOW_STAKING_FEES_H

#include <stakeflow/core/types.h>

#include <array>
#include <cstdint>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Fee Constants
// ============================================================================

/// Fixed fee on every deposit (1%)
constexpr BasisPoints ENTRY_FEE_BPS = 100;

/// Share of every fee that stays in custody as reward pool
constexpr uint32_t POOL_SHARE_PERCENT = 70;

/// Share of every fee sent to the fee recipient
constexpr uint32_t RECIPIENT_SHARE_PERCENT = 30;

struct FeeTier {
    /// Minimum holding duration (seconds) for this tier to apply
    int64_t minDuration;
    BasisPoints feeBps;
};

/// Tier table, ordered by ascending duration and descending fee
constexpr std::array<FeeTier, 4> FEE_TIERS = {{
    {0, 500},
    {7 * SECONDS_PER_DAY, 350},
    {14 * SECONDS_PER_DAY, 200},
    {30 * SECONDS_PER_DAY, 100},
}};

// ============================================================================
// Fee Split
// ============================================================================

struct FeeSplit {
    Amount total{0};
    Amount poolShare{0};
    Amount recipientShare{0};

    /// Rounding remainder; stays in custody with the pool share
    Amount Residual() const { return total - poolShare - recipientShare; }

    /// Everything that remains in custody
    Amount RetainedInPool() const { return total - recipientShare; }
};

// ============================================================================
// Fee Schedule
// ============================================================================

class FeeSchedule {
public:
    /// Exit fee tier for a holding duration; negative durations use the first tier
    static BasisPoints TierFor(int64_t duration);

    static BasisPoints EntryFeeBps() { return ENTRY_FEE_BPS; }

    /// floor(amount * bps / 10000)
    static Amount ComputeFee(Amount amount, BasisPoints bps);

    /// 70/30 split, each share floored
    static FeeSplit Split(Amount fee);

    static const std::array<FeeTier, 4>& Tiers() { return FEE_TIERS; }

    /// "5.00%"
    static std::string FormatBps(BasisPoints bps);
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_FEES_H
