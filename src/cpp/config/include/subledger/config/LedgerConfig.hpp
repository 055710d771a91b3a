/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Logging.hpp"
#include "common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace subledger::config
{

//-------------------------------------------------------------------------

/**
 * What a withdrawal does with a subscriber whose balance cannot cover its share.
 *
 * - clamp: debit what is available, pay the provider only that, forfeit the rest.
 * - reject: abort the withdrawal.
 * - allow: debit the full share; the balance may go negative.
 */
enum class OverdraftPolicy : uint32_t
{
    clamp,
    reject,
    allow
};

//-------------------------------------------------------------------------

struct LedgerConfig
{
    Amount minimalFee;
    size_t maxProviders{};
    size_t minProviders{2};
    size_t maxProvidersPerSubscriber{14};
    Amount depositPeriods{2};
    OverdraftPolicy overdraftPolicy{OverdraftPolicy::clamp};
    PrincipalId custody{"ledger"};
    PrincipalId admin;
    bool debug{};
    util::LoggingConfig logging;
};

[[nodiscard]] LedgerConfig makeLedgerConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace subledger::config

//-------------------------------------------------------------------------
