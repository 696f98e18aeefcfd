// STAKEFLOW - Authorization Implementation
// Copyright (c) 2024 STAKEFLOW Developers
// MIT License

#include "stakeflow/staking/authorization.h"

namespace stakeflow {
namespace staking {

AllowListAuthorizer::AllowListAuthorizer(const std::vector<Address>& admins)
    : admins_(admins.begin(), admins.end()) {}

bool AllowListAuthorizer::IsAuthorized(const Address& caller) const {
    return admins_.count(caller) > 0;
}

void AllowListAuthorizer::Grant(const Address& admin) {
    admins_.insert(admin);
}

void AllowListAuthorizer::Revoke(const Address& admin) {
    admins_.erase(admin);
}

} // namespace staking
} // namespace stakeflow
