// STAKEFLOW - Token Vault
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License
//
// Custody interface the staking engine moves tokens through, plus an
// in-memory implementation used by the simulator and tests.

#ifndef STAKEFLOW_STAKING_VAULT_H
#define STAKEFLOW_STAKING_VAULT_H

#include <stakeflow/core/types.h>

#include <cstddef>
#include <map>
#include <string>

namespace stakeflow {
namespace staking {

// ============================================================================
// Vault Interface
// ============================================================================

/**
 * External token ledger. The engine only ever moves tokens between holders
 * and its own custody address; a false return aborts the whole operation.
 */
class ITokenVault {
public:
    virtual ~ITokenVault() = default;

    /// Move `amount` from `from` into custody
    virtual bool TransferIn(const Address& from, Amount amount) = 0;

    /// Move `amount` from custody to `to`
    virtual bool TransferOut(const Address& to, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder) const = 0;
};

// ============================================================================
// In-Memory Vault
// ============================================================================

class InMemoryTokenVault : public ITokenVault {
public:
    explicit InMemoryTokenVault(const Address& custody);

    bool TransferIn(const Address& from, Amount amount) override;
    bool TransferOut(const Address& to, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;

    /// Create tokens for a holder
    void Mint(const Address& holder, Amount amount);

    const Address& Custody() const { return custody_; }

    /// Sum of all balances
    Amount TotalSupply() const;

    size_t TransferCount() const { return transferCount_; }

protected:
    /// Move between two holders; false on insufficient balance or overflow
    bool Move(const Address& from, const Address& to, Amount amount);

private:
    Address custody_;
    std::map<Address, Amount> balances_;
    size_t transferCount_{0};
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_VAULT_H
