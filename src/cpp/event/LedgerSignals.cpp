/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/event/LedgerSignals.hpp"

//-------------------------------------------------------------------------

namespace subledger::event
{

//-------------------------------------------------------------------------

LedgerSignals::LedgerSignals() noexcept
{
    auto count = [this](const auto&) { ++eventCounter; };

    providerRegistered.connect(count);
    providerRemoved.connect(count);
    providerStatusChanged.connect(count);
    providerFeeUpdated.connect(count);
    subscriberRegistered.connect(count);
    subscriberDeposited.connect(count);
    withdrawal.connect(count);
    cancellation.connect(count);
}

//-------------------------------------------------------------------------

}  // namespace subledger::event

//-------------------------------------------------------------------------
