// STAKEFLOW - Reward Accrual Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/accrual.h"

namespace stakeflow {
namespace staking {

int64_t RewardAccrual::Elapsed(Timestamp now) const {
    return now > state_.lastUpdateTime ? now - state_.lastUpdateTime : 0;
}

FixedPoint RewardAccrual::RewardPerUnit(Timestamp now) const {
    if (state_.totalStaked == 0) {
        return state_.rewardPerUnitStored;
    }

    uint256 emitted = uint256(static_cast<uint64_t>(Elapsed(now))) * state_.rewardRate;
    return state_.rewardPerUnitStored +
           FixedPoint::FromRatio(emitted, state_.totalStaked);
}

Amount RewardAccrual::Earned(const Account& account, Timestamp now) const {
    FixedPoint delta = RewardPerUnit(now) - account.rewardPerUnitPaid;
    return CheckedAdd(delta.MulAmount(account.balance), account.pendingReward);
}

SettlementReceipt RewardAccrual::Settle(Timestamp now) {
    state_.rewardPerUnitStored = RewardPerUnit(now);
    if (now > state_.lastUpdateTime) {
        state_.lastUpdateTime = now;
    }
    return SettlementReceipt(now, std::nullopt);
}

SettlementReceipt RewardAccrual::Settle(const Address& address, Account& account,
                                        Timestamp now) {
    Settle(now);
    account.pendingReward = Earned(account, now);
    account.rewardPerUnitPaid = state_.rewardPerUnitStored;
    return SettlementReceipt(now, address);
}

} // namespace staking
} // namespace stakeflow
