// STAKEFLOW - Token Vault Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/vault.h"
#include "stakeflow/util/logging.h"

#include <limits>

namespace stakeflow {
namespace staking {

InMemoryTokenVault::InMemoryTokenVault(const Address& custody) : custody_(custody) {}

bool InMemoryTokenVault::TransferIn(const Address& from, Amount amount) {
    return Move(from, custody_, amount);
}

bool InMemoryTokenVault::TransferOut(const Address& to, Amount amount) {
    return Move(custody_, to, amount);
}

Amount InMemoryTokenVault::BalanceOf(const Address& holder) const {
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

void InMemoryTokenVault::Mint(const Address& holder, Amount amount) {
    Amount& balance = balances_[holder];
    balance = CheckedAdd(balance, amount);
}

Amount InMemoryTokenVault::TotalSupply() const {
    Amount total = 0;
    for (const auto& [_, balance] : balances_) {
        total = CheckedAdd(total, balance);
    }
    return total;
}

bool InMemoryTokenVault::Move(const Address& from, const Address& to, Amount amount) {
    Amount fromBalance = BalanceOf(from);
    if (fromBalance < amount) {
        LOG_DEBUG(util::LogCategory::VAULT) << "Transfer of " << FormatAmount(amount)
                                            << " from " << from.ToShortString()
                                            << " rejected: balance " << FormatAmount(fromBalance);
        return false;
    }
    if (from == to || amount == 0) {
        ++transferCount_;
        return true;
    }
    Amount toBalance = BalanceOf(to);
    if (toBalance > std::numeric_limits<Amount>::max() - amount) {
        return false;
    }
    balances_[from] = fromBalance - amount;
    balances_[to] = toBalance + amount;
    ++transferCount_;
    return true;
}

} // namespace staking
} // namespace stakeflow
