/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "common.hpp"
#include "subledger/accounting/EarningsCalculator.hpp"
#include "subledger/accounting/LedgerState.hpp"
#include "subledger/config/LedgerConfig.hpp"
#include "subledger/event/LedgerSignals.hpp"
#include "subledger/external/ValueTransferService.hpp"

#include <spdlog/spdlog.h>

#include <map>

//-------------------------------------------------------------------------

namespace subledger::settlement
{

//-------------------------------------------------------------------------

struct WithdrawalReceipt
{
    ProviderId providerId;
    Timestamp timestamp;
    Amount amount;
    Amount forfeited;
    accounting::EarningsMap debits;
};

struct CancellationReceipt
{
    SubscriberId subscriberId;
    Timestamp timestamp;
    Amount owed;
    Amount shortfall;
    Amount finalBalance;
    std::map<ProviderId, Amount> payouts;
};

//-------------------------------------------------------------------------

struct SettlementLedgerDesc
{
    const config::LedgerConfig* config;
    accounting::LedgerState* state;
    external::ValueTransferService* transfers;
    const Clock* clock;
    event::LedgerSignals* signals;
    spdlog::logger* logger;
};

//-------------------------------------------------------------------------

class SettlementLedger
{
public:
    explicit SettlementLedger(const SettlementLedgerDesc& desc) noexcept;

    /**
     * Pays the provider's owner everything accrued by its roster since the last
     * settlement and debits each member its own share. All or nothing.
     */
    WithdrawalReceipt withdraw(const CallerContext& ctx, ProviderId providerId);

    /**
     * Settles the subscriber's dues with every provider it is subscribed to, paying
     * each provider's owner directly, then leaves every roster and pauses the account.
     * A balance short of the dues is topped up from the owner; any excess is kept.
     */
    CancellationReceipt cancel(const CallerContext& ctx, SubscriberId subscriberId);

    // Settlement without the caller and active-flag checks, for provider removal.
    WithdrawalReceipt settleResidual(ProviderId providerId, Timestamp now);

private:
    WithdrawalReceipt settle(accounting::Provider& provider, Timestamp now);

    const config::LedgerConfig* m_config;
    accounting::LedgerState* m_state;
    external::ValueTransferService* m_transfers;
    const Clock* m_clock;
    event::LedgerSignals* m_signals;
    spdlog::logger* m_logger;
};

//-------------------------------------------------------------------------

}  // namespace subledger::settlement

//-------------------------------------------------------------------------
