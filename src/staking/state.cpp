// STAKEFLOW - Staking State Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/state.h"

#include <sstream>

namespace stakeflow {
namespace staking {

const char* AdjustmentReasonToString(AdjustmentReason reason) {
    switch (reason) {
        case AdjustmentReason::None:                        return "none";
        case AdjustmentReason::FloorForced:                 return "floor-forced";
        case AdjustmentReason::DecreasedLowSustainability:  return "decreased-low-sustainability";
        case AdjustmentReason::IncreasedHighSustainability: return "increased-high-sustainability";
        case AdjustmentReason::Manual:                      return "manual";
        default:                                            return "unknown";
    }
}

std::string GlobalState::ToString() const {
    std::ostringstream ss;
    ss << "GlobalState(staked=" << FormatAmount(totalStaked)
       << ", rate=" << rewardRate
       << ", rpu=" << rewardPerUnitStored.ToString()
       << ", updated=" << lastUpdateTime
       << ", lastAdjust=" << lastRateAdjustmentTime
       << " [" << AdjustmentReasonToString(lastAdjustmentReason) << "]"
       << ", fees=" << FormatAmount(totalFeesCollected)
       << ", distributed=" << FormatAmount(totalRewardsDistributed)
       << ")";
    return ss.str();
}

std::string Account::ToString() const {
    std::ostringstream ss;
    ss << "Account(balance=" << FormatAmount(balance)
       << ", pending=" << FormatAmount(pendingReward)
       << ", weightedTime=" << weightedStakeTime
       << ", claimed=" << FormatAmount(totalClaimed)
       << ")";
    return ss.str();
}

} // namespace staking
} // namespace stakeflow
