/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "subledger/event/LedgerEvents.hpp"

//-------------------------------------------------------------------------

namespace subledger::event
{

//-------------------------------------------------------------------------

struct LedgerSignals
{
    UnsyncSignal<void(const ProviderRegisteredEvent&)> providerRegistered;
    UnsyncSignal<void(const ProviderRemovedEvent&)> providerRemoved;
    UnsyncSignal<void(const ProviderStatusChangedEvent&)> providerStatusChanged;
    UnsyncSignal<void(const ProviderFeeUpdatedEvent&)> providerFeeUpdated;
    UnsyncSignal<void(const SubscriberRegisteredEvent&)> subscriberRegistered;
    UnsyncSignal<void(const SubscriberDepositedEvent&)> subscriberDeposited;
    UnsyncSignal<void(const WithdrawalEvent&)> withdrawal;
    UnsyncSignal<void(const CancellationEvent&)> cancellation;
    uint64_t eventCounter{};

    LedgerSignals() noexcept;
};

//-------------------------------------------------------------------------

}  // namespace subledger::event

//-------------------------------------------------------------------------
