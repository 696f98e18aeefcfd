// STAKEFLOW - Reward Rate Controller Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/controller.h"
#include "stakeflow/core/fixedpoint.h"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace stakeflow {
namespace staking {

std::string RateProposal::ToString() const {
    std::ostringstream ss;
    ss << "RateProposal(" << (shouldAdjust ? "adjust" : "hold")
       << ", " << currentRate << " -> " << proposedRate
       << ", reason=" << AdjustmentReasonToString(reason)
       << ", available=" << FormatAmount(availableRewards)
       << ", days=" << sustainabilityDays;
    if (!note.empty()) {
        ss << ", " << note;
    }
    ss << ")";
    return ss.str();
}

// ============================================================================
// Metrics
// ============================================================================

Amount RateController::AvailableRewards(Amount custodyBalance, Amount totalStaked) {
    return custodyBalance > totalStaked ? custodyBalance - totalStaked : 0;
}

uint64_t RateController::SustainabilityDays(Amount available, Amount rate) {
    if (rate == 0 || available == 0) {
        return 0;
    }
    return available / rate / static_cast<uint64_t>(SECONDS_PER_DAY);
}

uint64_t RateController::AprFor(Amount rate, Amount totalStaked) {
    if (totalStaked == 0) {
        return 0;
    }
    uint256 apr = MulDiv(uint256(rate) * static_cast<uint64_t>(SECONDS_PER_YEAR),
                         BPS_DENOMINATOR, totalStaked);
    if (apr > std::numeric_limits<uint64_t>::max()) {
        return std::numeric_limits<uint64_t>::max();
    }
    return apr.convert_to<uint64_t>();
}

Amount RateController::MaxRateForAPR(uint64_t maxAprBps, Amount totalStaked) {
    uint256 denominator = uint256(BPS_DENOMINATOR) * static_cast<uint64_t>(SECONDS_PER_YEAR);
    return NarrowToAmount(MulDiv(maxAprBps, totalStaked, denominator));
}

uint64_t RateController::EstimateAPR() const {
    return AprFor(state_.rewardRate, state_.totalStaked);
}

bool RateController::IsAdjustmentDue(Timestamp now) const {
    return now - state_.lastRateAdjustmentTime >= state_.rateAdjustmentPeriod;
}

// ============================================================================
// Decision
// ============================================================================

RateProposal RateController::CheckAdjustment(Timestamp now, Amount custodyBalance) const {
    RateProposal proposal;
    proposal.currentRate = state_.rewardRate;
    proposal.proposedRate = state_.rewardRate;
    proposal.availableRewards = AvailableRewards(custodyBalance, state_.totalStaked);
    proposal.sustainabilityDays =
        SustainabilityDays(proposal.availableRewards, state_.rewardRate);

    if (!IsAdjustmentDue(now)) {
        proposal.note = "adjustment period not elapsed";
        return proposal;
    }
    proposal.due = true;

    if (proposal.availableRewards == 0 || state_.totalStaked == 0) {
        proposal.proposedRate = state_.minRewardRate;
        proposal.reason = AdjustmentReason::FloorForced;
        proposal.note = proposal.availableRewards == 0 ? "reward pool empty"
                                                       : "nothing staked";
    } else {
        uint256 days = uint256(proposal.sustainabilityDays) * 100;
        uint256 target = state_.targetSustainabilityDays;

        if (days < target * LOW_SUSTAINABILITY_PERCENT) {
            Amount reduced = NarrowToAmount(
                MulDiv(state_.rewardRate, RATE_DECREASE_PERCENT, 100));
            proposal.proposedRate = std::max(reduced, state_.minRewardRate);
            proposal.reason = AdjustmentReason::DecreasedLowSustainability;
            proposal.note = "sustainability below target band";
        } else if (days > target * HIGH_SUSTAINABILITY_PERCENT) {
            Amount increased = NarrowToAmount(
                MulDiv(state_.rewardRate, RATE_INCREASE_PERCENT, 100));
            if (AprFor(increased, state_.totalStaked) > state_.maxAPR) {
                increased = MaxRateForAPR(state_.maxAPR, state_.totalStaked);
                proposal.note = "sustainability above target band, capped by maxAPR";
            } else {
                proposal.note = "sustainability above target band";
            }
            proposal.proposedRate = std::max(increased, state_.minRewardRate);
            proposal.reason = AdjustmentReason::IncreasedHighSustainability;
        } else {
            proposal.note = "sustainability within target band";
        }
    }

    proposal.shouldAdjust = proposal.proposedRate != proposal.currentRate;
    return proposal;
}

// ============================================================================
// Commit
// ============================================================================

void RateController::RequireCurrent(const SettlementReceipt& receipt) const {
    if (receipt.Time() < state_.lastUpdateTime) {
        throw std::logic_error("rate change without a current settlement");
    }
}

bool RateController::Apply(const SettlementReceipt& receipt, const RateProposal& proposal) {
    RequireCurrent(receipt);
    if (!proposal.shouldAdjust || proposal.proposedRate == state_.rewardRate) {
        return false;
    }
    state_.rewardRate = proposal.proposedRate;
    state_.lastRateAdjustmentTime = receipt.Time();
    state_.lastAdjustmentReason = proposal.reason;
    ++state_.adjustmentCount;
    return true;
}

void RateController::SetManualRate(const SettlementReceipt& receipt, Amount rate) {
    RequireCurrent(receipt);
    state_.rewardRate = rate;
    state_.lastRateAdjustmentTime = receipt.Time();
    state_.lastAdjustmentReason = AdjustmentReason::Manual;
    ++state_.adjustmentCount;
}

bool RateController::EnforceFloor(const SettlementReceipt& receipt) {
    RequireCurrent(receipt);
    if (state_.rewardRate >= state_.minRewardRate) {
        return false;
    }
    state_.rewardRate = state_.minRewardRate;
    state_.lastRateAdjustmentTime = receipt.Time();
    state_.lastAdjustmentReason = AdjustmentReason::FloorForced;
    ++state_.adjustmentCount;
    return true;
}

} // namespace staking
} // namespace stakeflow
