// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <metastake/core/address.hpp>
#include <metastake/core/likely.h>
#include <metastake/core/result.hpp>
#include <metastake/staking/collaborators.hpp>
#include <metastake/staking/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>

METASTAKE_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<void> toggle(
    Authorizer const &authorizer, Address const &principal,
    AdminAction const action, bool &flag, bool const value)
{
    if (METASTAKE_UNLIKELY(!authorizer.is_authorized(principal, action))) {
        return StakingError::Unauthorized;
    }
    if (METASTAKE_UNLIKELY(flag == value)) {
        return StakingError::InvalidParameter;
    }
    flag = value;
    return outcome::success();
}

METASTAKE_STAKING_ANONYMOUS_NAMESPACE_END

METASTAKE_STAKING_NAMESPACE_BEGIN

void RoleAuthorizer::grant(Address const &principal, AdminAction const action)
{
    roles_[static_cast<size_t>(action)].insert(principal);
}

void RoleAuthorizer::grant_all(Address const &principal)
{
    for (auto &holders : roles_) {
        holders.insert(principal);
    }
}

void RoleAuthorizer::revoke(Address const &principal, AdminAction const action)
{
    roles_[static_cast<size_t>(action)].erase(principal);
}

bool RoleAuthorizer::is_authorized(
    Address const &principal, AdminAction const action) const
{
    return roles_[static_cast<size_t>(action)].contains(principal);
}

PauseSwitches::PauseSwitches(Authorizer const &authorizer)
    : authorizer_{authorizer}
{
}

Result<void> PauseSwitches::pause_withdraw(Address const &principal)
{
    BOOST_OUTCOME_TRY(toggle(
        authorizer_,
        principal,
        AdminAction::PauseWithdraw,
        withdraw_paused_,
        true));
    LOG_INFO("withdraw paused by {}", to_hex(principal));
    return outcome::success();
}

Result<void> PauseSwitches::unpause_withdraw(Address const &principal)
{
    BOOST_OUTCOME_TRY(toggle(
        authorizer_,
        principal,
        AdminAction::PauseWithdraw,
        withdraw_paused_,
        false));
    LOG_INFO("withdraw unpaused by {}", to_hex(principal));
    return outcome::success();
}

Result<void> PauseSwitches::pause_claim(Address const &principal)
{
    BOOST_OUTCOME_TRY(toggle(
        authorizer_, principal, AdminAction::PauseClaim, claim_paused_, true));
    LOG_INFO("claim paused by {}", to_hex(principal));
    return outcome::success();
}

Result<void> PauseSwitches::unpause_claim(Address const &principal)
{
    BOOST_OUTCOME_TRY(toggle(
        authorizer_, principal, AdminAction::PauseClaim, claim_paused_, false));
    LOG_INFO("claim unpaused by {}", to_hex(principal));
    return outcome::success();
}

METASTAKE_STAKING_NAMESPACE_END
