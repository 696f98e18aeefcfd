// STAKEFLOW - Authorization
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#ifndef STAKEFLOW_STAKING_AUTHORIZATION_H
#define STAKEFLOW_STAKING_AUTHORIZATION_H

#include <stakeflow/core/types.h>

#include <set>
#include <vector>

namespace stakeflow {
namespace staking {

/// Access check consulted before every administrative change
class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;
    virtual bool IsAuthorized(const Address& caller) const = 0;
};

/// Fixed set of administrator addresses
class AllowListAuthorizer : public IAuthorizer {
public:
    AllowListAuthorizer() = default;
    explicit AllowListAuthorizer(const std::vector<Address>& admins);

    bool IsAuthorized(const Address& caller) const override;

    void Grant(const Address& admin);
    void Revoke(const Address& admin);
    size_t Size() const { return admins_.size(); }

private:
    std::set<Address> admins_;
};

} // namespace staking
} // namespace stakeflow

#endif // STAKEFLOW_STAKING_AUTHORIZATION_H
