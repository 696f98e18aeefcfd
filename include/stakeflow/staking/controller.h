// STAKEFLOW - Reward Rate Controller
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Dead-band controller that keeps the reward pool solvent for a target
// number of days.
//
// Once per adjustment period the controller compares how many days the
// available pool can sustain the current rate against the target:
// - below 90% of target: rate -10%, floored at minRewardRate
// - above 150% of target: rate +10%, capped at the rate implying maxAPR
// - otherwise: unchanged
// An empty pool or an empty stake forces the rate to the floor.

#ifndef STAKEFLOW_STAKING_CONTROLLER_H
#define STAKEFLOW_STAKING_CONTROLLER_H

#include <stakeflow/core/types.h>
#include <stakeflow/staking/accrual.h>
#include <stakeflow/staking/state.h>

#include <cstdint>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Controller Constants
// ============================================================================

/// Dead band, as percent of targetSustainabilityDays (bounds exclusive)
constexpr uint64_t LOW_SUSTAINABILITY_PERCENT = 90;
constexpr uint64_t HIGH_SUSTAINABILITY_PERCENT = 150;

/// Fixed step applied outside the band
constexpr uint64_t RATE_DECREASE_PERCENT = 90;
constexpr uint64_t RATE_INCREASE_PERCENT = 110;

// ============================================================================
// Rate Proposal
// ============================================================================

struct RateProposal {
    /// True when the proposed rate differs from the current one
    bool shouldAdjust{false};

    /// An adjustment period has elapsed
    bool due{false};

    Amount currentRate{0};
    Amount proposedRate{0};
    AdjustmentReason reason{AdjustmentReason::None};

    /// Inputs observed
    Amount availableRewards{0};
    uint64_t sustainabilityDays{0};

    /// Human-readable explanation
    std::string note;

    std::string ToString() const;
};

// ============================================================================
// Rate Controller
// ============================================================================

class RateController {
public:
    explicit RateController(GlobalState& state) : state_(state) {}

    /// custodyBalance - totalStaked, floored at zero
    static Amount AvailableRewards(Amount custodyBalance, Amount totalStaked);

    /// available / rate / 86400; zero when either is zero
    static uint64_t SustainabilityDays(Amount available, Amount rate);

    /// APR in basis points implied by `rate` over `totalStaked` (saturating)
    static uint64_t AprFor(Amount rate, Amount totalStaked);

    /// Largest rate whose APR does not exceed maxAprBps
    static Amount MaxRateForAPR(uint64_t maxAprBps, Amount totalStaked);

    /// APR of the current rate; zero with nothing staked
    uint64_t EstimateAPR() const;

    bool IsAdjustmentDue(Timestamp now) const;

    /// Proposal for `now` given the vault's custody balance; no side effects
    RateProposal CheckAdjustment(Timestamp now, Amount custodyBalance) const;

    /**
     * Commit a proposal. Requires a settlement at the same instant so that
     * accrual up to now was booked at the old rate.
     *
     * @return true if the rate changed
     */
    bool Apply(const SettlementReceipt& receipt, const RateProposal& proposal);

    /// Administrative override; records reason Manual
    void SetManualRate(const SettlementReceipt& receipt, Amount rate);

    /// Lift the rate to minRewardRate if it is below; returns true if lifted
    bool EnforceFloor(const SettlementReceipt& receipt);

private:
    void RequireCurrent(const SettlementReceipt& receipt) const;

    GlobalState& state_;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_CONTROLLER_H
