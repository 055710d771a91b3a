/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "subledger/external/DedupKeyStore.hpp"

#include <map>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::event
{

//-------------------------------------------------------------------------

struct ProviderRegisteredEvent
{
    Timestamp timestamp;
    ProviderId providerId;
    PrincipalId owner;
    std::string key;
    external::KeyHash keyHash;
    Amount fee;
};

struct ProviderRemovedEvent
{
    Timestamp timestamp;
    ProviderId providerId;
    PrincipalId removedBy;
    Amount residualPaid;
};

struct ProviderStatusChangedEvent
{
    Timestamp timestamp;
    ProviderId providerId;
    bool active;
};

struct ProviderFeeUpdatedEvent
{
    Timestamp timestamp;
    ProviderId providerId;
    Amount previousFee;
    Amount fee;
};

struct SubscriberRegisteredEvent
{
    Timestamp timestamp;
    SubscriberId subscriberId;
    PrincipalId owner;
    Amount deposit;
    std::string plan;
    std::vector<ProviderId> providerIds;
};

struct SubscriberDepositedEvent
{
    Timestamp timestamp;
    SubscriberId subscriberId;
    Amount amount;
    Amount balance;
};

struct WithdrawalEvent
{
    Timestamp timestamp;
    ProviderId providerId;
    PrincipalId owner;
    Amount amount;
    Amount forfeited;
};

struct CancellationEvent
{
    Timestamp timestamp;
    SubscriberId subscriberId;
    PrincipalId owner;
    Amount owed;
    Amount shortfall;
    std::map<ProviderId, Amount> payouts;
};

//-------------------------------------------------------------------------

}  // namespace subledger::event

//-------------------------------------------------------------------------
