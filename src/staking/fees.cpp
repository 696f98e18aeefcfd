// STAKEFLOW - Fee Schedule Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/fees.h"
#include "stakeflow/core/fixedpoint.h"

#include <iomanip>
#include <sstream>

namespace stakeflow {
namespace staking {

BasisPoints FeeSchedule::TierFor(int64_t duration) {
    BasisPoints bps = FEE_TIERS.front().feeBps;
    for (const auto& tier : FEE_TIERS) {
        if (duration >= tier.minDuration) {
            bps = tier.feeBps;
        }
    }
    return bps;
}

Amount FeeSchedule::ComputeFee(Amount amount, BasisPoints bps) {
    return NarrowToAmount(MulDiv(amount, bps, BPS_DENOMINATOR));
}

FeeSplit FeeSchedule::Split(Amount fee) {
    FeeSplit split;
    split.total = fee;
    split.poolShare = NarrowToAmount(MulDiv(fee, POOL_SHARE_PERCENT, 100));
    split.recipientShare = NarrowToAmount(MulDiv(fee, RECIPIENT_SHARE_PERCENT, 100));
    return split;
}

std::string FeeSchedule::FormatBps(BasisPoints bps) {
    std::ostringstream ss;
    ss << bps / 100 << "." << std::setw(2) << std::setfill('0') << bps % 100 << "%";
    return ss.str();
}

} // namespace staking
} // namespace stakeflow
