/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "subledger/accounting/Provider.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

using EarningsMap = std::map<SubscriberId, Amount>;

[[nodiscard]] EarningsMap perSubscriberEarnings(const Provider& provider, Timestamp now);

[[nodiscard]] Amount totalEarnings(const Provider& provider, Timestamp now);

/**
 * Throws StateError when the subscriber is not on the provider's roster.
 */
[[nodiscard]] Amount earningsForOne(
    const Provider& provider, SubscriberId subscriberId, Timestamp now);

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
