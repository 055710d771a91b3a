/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "common.hpp"
#include "subledger/accounting/LedgerState.hpp"
#include "subledger/config/LedgerConfig.hpp"
#include "subledger/event/LedgerSignals.hpp"
#include "subledger/external/DedupKeyStore.hpp"
#include "subledger/external/IdAllocator.hpp"
#include "subledger/external/ValueTransferService.hpp"
#include "subledger/settlement/SettlementLedger.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <span>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::registry
{

//-------------------------------------------------------------------------

struct RegistryControllerDesc
{
    const config::LedgerConfig* config;
    accounting::LedgerState* state;
    settlement::SettlementLedger* settlement;
    external::ValueTransferService* transfers;
    external::DedupKeyStore* keys;
    std::unique_ptr<external::IdAllocator> providerIds;
    std::unique_ptr<external::IdAllocator> subscriberIds;
    const Clock* clock;
    event::LedgerSignals* signals;
    spdlog::logger* logger;
};

//-------------------------------------------------------------------------

class RegistryController
{
public:
    explicit RegistryController(RegistryControllerDesc desc) noexcept;

    ProviderId registerProvider(const CallerContext& ctx, std::string_view key, Amount fee);

    /**
     * Joins every listed provider that is currently active; unknown and inactive ids are
     * skipped. The deposit must cover `depositPeriods` fee periods of the joined
     * providers and is kept whole as the opening balance.
     */
    SubscriberId registerSubscriber(
        const CallerContext& ctx,
        Amount deposit,
        std::string plan,
        std::span<const ProviderId> providerIds);

    void setProviderStatus(
        const CallerContext& ctx,
        std::span<const ProviderId> ids,
        const std::vector<bool>& flags);

    settlement::WithdrawalReceipt removeProvider(const CallerContext& ctx, ProviderId id);

    void updateProviderFee(const CallerContext& ctx, ProviderId id, Amount fee);

    void deposit(const CallerContext& ctx, SubscriberId id, Amount amount);

    [[nodiscard]] ProviderId nextProviderId() const noexcept { return m_providerIds->peek(); }
    [[nodiscard]] SubscriberId nextSubscriberId() const noexcept { return m_subscriberIds->peek(); }

private:
    void checkFee(Amount fee, std::source_location sl) const;

    const config::LedgerConfig* m_config;
    accounting::LedgerState* m_state;
    settlement::SettlementLedger* m_settlement;
    external::ValueTransferService* m_transfers;
    external::DedupKeyStore* m_keys;
    std::unique_ptr<external::IdAllocator> m_providerIds;
    std::unique_ptr<external::IdAllocator> m_subscriberIds;
    const Clock* m_clock;
    event::LedgerSignals* m_signals;
    spdlog::logger* m_logger;
};

//-------------------------------------------------------------------------

}  // namespace subledger::registry

//-------------------------------------------------------------------------
