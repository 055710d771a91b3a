/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/accounting/EarningsCalculator.hpp"

#include "LedgerException.hpp"
#include "checked.hpp"

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

EarningsMap perSubscriberEarnings(const Provider& provider, Timestamp now)
{
    EarningsMap earnings;
    for (const SubscriberId id : provider.roster()) {
        earnings.emplace(id, provider.schedule().earningsFor(provider.accrualStart(id), now));
    }
    return earnings;
}

//-------------------------------------------------------------------------

Amount totalEarnings(const Provider& provider, Timestamp now)
{
    const EarningsMap earnings = perSubscriberEarnings(provider, now);
    return ranges::accumulate(
        earnings | views::values,
        Amount{},
        [](Amount lhs, Amount rhs) { return util::checkedAdd(lhs, rhs); });
}

//-------------------------------------------------------------------------

Amount earningsForOne(const Provider& provider, SubscriberId subscriberId, Timestamp now)
{
    if (!provider.roster().contains(subscriberId)) {
        throw StateError{fmt::format(
            "{}: Subscriber #{} is not subscribed to provider #{}",
            std::source_location::current().function_name(),
            subscriberId,
            provider.id())};
    }
    return provider.schedule().earningsFor(provider.accrualStart(subscriberId), now);
}

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
