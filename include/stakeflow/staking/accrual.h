// STAKEFLOW - Reward Accrual
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Reward-per-unit accumulator and per-account earnings.
//
// Rewards stream at `rewardRate` base units per second, shared pro rata by
// staked balance. The accumulator grows by rate * elapsed * 10^18 / totalStaked
// and never decreases. An account's earnings are its balance times the
// accumulator growth since its last settlement, plus anything already pending.
//
// Settlement must happen before any change to a balance, totalStaked or the
// rate. Ledger and controller mutations therefore take a SettlementReceipt,
// which only RewardAccrual::Settle can produce.

#ifndef STAKEFLOW_STAKING_ACCRUAL_H
#define STAKEFLOW_STAKING_ACCRUAL_H

#include <stakeflow/core/fixedpoint.h>
#include <stakeflow/core/types.h>
#include <stakeflow/staking/state.h>

#include <optional>

namespace stakeflow {
namespace staking {

class RewardAccrual;

// ============================================================================
// Settlement Receipt
// ============================================================================

/**
 * Proof that accrual was settled at a given time, globally or for one account.
 */
class SettlementReceipt {
public:
    Timestamp Time() const { return time_; }

    /// Settled account, or nullopt for a global-only settlement
    const std::optional<Address>& SettledAccount() const { return account_; }

    bool Covers(const Address& account) const {
        return account_ && *account_ == account;
    }

private:
    friend class RewardAccrual;

    SettlementReceipt(Timestamp time, std::optional<Address> account)
        : time_(time), account_(std::move(account)) {}

    Timestamp time_;
    std::optional<Address> account_;
};

// ============================================================================
// Reward Accrual
// ============================================================================

class RewardAccrual {
public:
    explicit RewardAccrual(GlobalState& state) : state_(state) {}

    /// Accumulator value at `now`; pure and idempotent
    FixedPoint RewardPerUnit(Timestamp now) const;

    /// Reward owed to `account` at `now`, including pending
    Amount Earned(const Account& account, Timestamp now) const;

    /// Fold elapsed accrual into the stored accumulator
    SettlementReceipt Settle(Timestamp now);

    /// Global settlement followed by moving the account's earnings to pending
    SettlementReceipt Settle(const Address& address, Account& account, Timestamp now);

private:
    /// Seconds since the last settlement; clock regressions count as zero
    int64_t Elapsed(Timestamp now) const;

    GlobalState& state_;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_ACCRUAL_H
