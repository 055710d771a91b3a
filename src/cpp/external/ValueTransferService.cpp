/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/external/ValueTransferService.hpp"

#include "checked.hpp"

//-------------------------------------------------------------------------

namespace subledger::external
{

//-------------------------------------------------------------------------

InMemoryValueTransferService::InMemoryValueTransferService(PrincipalId custody) noexcept
    : m_custody{std::move(custody)}
{}

//-------------------------------------------------------------------------

bool InMemoryValueTransferService::transfer(const PrincipalId& to, Amount amount)
{
    return transferFrom(m_custody, to, amount);
}

//-------------------------------------------------------------------------

bool InMemoryValueTransferService::transferFrom(
    const PrincipalId& from, const PrincipalId& to, Amount amount)
{
    if (amount < 0 || balanceOf(from) < amount) {
        return false;
    }
    m_balances[from] -= amount;
    m_balances[to] = util::checkedAdd(m_balances[to], amount);
    return true;
}

//-------------------------------------------------------------------------

void InMemoryValueTransferService::mint(const PrincipalId& to, Amount amount)
{
    if (amount < 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot mint a negative amount {} for '{}'",
            std::source_location::current().function_name(), amount, to)};
    }
    m_balances[to] = util::checkedAdd(m_balances[to], amount);
}

//-------------------------------------------------------------------------

Amount InMemoryValueTransferService::balanceOf(const PrincipalId& principal) const noexcept
{
    auto it = m_balances.find(principal);
    return it != m_balances.end() ? it->second : Amount{};
}

//-------------------------------------------------------------------------

}  // namespace subledger::external

//-------------------------------------------------------------------------
