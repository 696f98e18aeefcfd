// STAKEFLOW - Stake Ledger Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/ledger.h"
#include "stakeflow/core/fixedpoint.h"

#include <stdexcept>

namespace stakeflow {
namespace staking {

// ============================================================================
// Lookup
// ============================================================================

const Account* StakeLedger::Find(const Address& address) const {
    auto it = accounts_.find(address);
    return it == accounts_.end() ? nullptr : &it->second;
}

Account& StakeLedger::GetOrCreate(const Address& address) {
    return accounts_[address];
}

std::optional<Account> StakeLedger::Snapshot(const Address& address) const {
    const Account* account = Find(address);
    if (!account) {
        return std::nullopt;
    }
    return *account;
}

void StakeLedger::Restore(const Address& address, const std::optional<Account>& snapshot) {
    if (snapshot) {
        accounts_[address] = *snapshot;
    } else {
        accounts_.erase(address);
    }
}

Account& StakeLedger::Require(const SettlementReceipt& receipt, const Address& address) {
    if (!receipt.Covers(address)) {
        throw std::logic_error("ledger mutation for " + address.ToShortString() +
                               " without a settlement of that account");
    }
    return GetOrCreate(address);
}

// ============================================================================
// Mutation
// ============================================================================

void StakeLedger::Deposit(const SettlementReceipt& receipt, const Address& address,
                          Amount net) {
    Account& account = Require(receipt, address);
    Timestamp now = receipt.Time();

    Amount newBalance = CheckedAdd(account.balance, net);
    Amount newTotal = CheckedAdd(state_.totalStaked, net);

    if (account.balance == 0) {
        account.weightedStakeTime = now;
        if (account.firstStakeTime == 0) {
            account.firstStakeTime = now;
        }
    } else {
        uint256 weighted =
            uint256(static_cast<uint64_t>(account.weightedStakeTime)) * account.balance +
            uint256(static_cast<uint64_t>(now)) * net;
        account.weightedStakeTime =
            static_cast<Timestamp>(NarrowToAmount(weighted / newBalance));
    }
    account.balance = newBalance;
    state_.totalStaked = newTotal;
}

void StakeLedger::Debit(const SettlementReceipt& receipt, const Address& address,
                        Amount amount) {
    Account& account = Require(receipt, address);
    Amount newBalance = CheckedSub(account.balance, amount);
    state_.totalStaked = CheckedSub(state_.totalStaked, amount);
    account.balance = newBalance;
}

Amount StakeLedger::TakeReward(const SettlementReceipt& receipt, const Address& address) {
    Account& account = Require(receipt, address);
    Amount reward = account.pendingReward;
    account.pendingReward = 0;
    account.totalClaimed = CheckedAdd(account.totalClaimed, reward);
    return reward;
}

// ============================================================================
// Totals
// ============================================================================

Amount StakeLedger::SumBalances() const {
    Amount sum = 0;
    for (const auto& [_, account] : accounts_) {
        sum = CheckedAdd(sum, account.balance);
    }
    return sum;
}

size_t StakeLedger::ActiveStakerCount() const {
    size_t count = 0;
    for (const auto& [_, account] : accounts_) {
        if (account.balance > 0) {
            ++count;
        }
    }
    return count;
}

std::vector<Address> StakeLedger::Addresses() const {
    std::vector<Address> out;
    out.reserve(accounts_.size());
    for (const auto& [address, _] : accounts_) {
        out.push_back(address);
    }
    return out;
}

} // namespace staking
} // namespace stakeflow
