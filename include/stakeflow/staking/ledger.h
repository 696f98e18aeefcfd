// STAKEFLOW - Stake Ledger
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Per-account balances and weighted stake time.
//
// Every mutation requires a SettlementReceipt covering the account it
// touches; totalStaked in the shared GlobalState is kept equal to the sum of
// all balances.

#ifndef STAKEFLOW_STAKING_LEDGER_H
#define STAKEFLOW_STAKING_LEDGER_H

#include <stakeflow/core/types.h>
#include <stakeflow/staking/accrual.h>
#include <stakeflow/staking/state.h>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace stakeflow {
namespace staking {

class StakeLedger {
public:
    explicit StakeLedger(GlobalState& state) : state_(state) {}

    // ========================================================================
    // Lookup
    // ========================================================================

    const Account* Find(const Address& address) const;

    /// Account record, created empty on first use
    Account& GetOrCreate(const Address& address);

    /// Copy of the current record, nullopt if the account was never created
    std::optional<Account> Snapshot(const Address& address) const;

    /// Put back a snapshot taken with Snapshot(); nullopt erases the record
    void Restore(const Address& address, const std::optional<Account>& snapshot);

    // ========================================================================
    // Mutation
    // ========================================================================

    /**
     * Credit a net deposit and blend the entry time into weightedStakeTime:
     *   new = (old * oldBalance + now * net) / (oldBalance + net)
     * or `now` when the previous balance was zero.
     */
    void Deposit(const SettlementReceipt& receipt, const Address& address, Amount net);

    /// Remove `amount` from the balance; weightedStakeTime is left unchanged
    void Debit(const SettlementReceipt& receipt, const Address& address, Amount amount);

    /// Zero pendingReward and return what it held
    Amount TakeReward(const SettlementReceipt& receipt, const Address& address);

    // ========================================================================
    // Totals
    // ========================================================================

    /// Recomputed sum of balances (for auditing against totalStaked)
    Amount SumBalances() const;

    size_t AccountCount() const { return accounts_.size(); }

    /// Accounts with a non-zero balance
    size_t ActiveStakerCount() const;

    std::vector<Address> Addresses() const;

private:
    Account& Require(const SettlementReceipt& receipt, const Address& address);

    GlobalState& state_;
    std::map<Address, Account> accounts_;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_LEDGER_H
