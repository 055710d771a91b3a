/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "JsonSerializable.hpp"
#include "common.hpp"
#include "subledger/accounting/LedgerState.hpp"
#include "subledger/config/LedgerConfig.hpp"
#include "subledger/event/LedgerSignals.hpp"
#include "subledger/external/DedupKeyStore.hpp"
#include "subledger/external/IdAllocator.hpp"
#include "subledger/external/ValueTransferService.hpp"
#include "subledger/ledger/EventLogger.hpp"
#include "subledger/registry/RegistryController.hpp"
#include "subledger/settlement/SettlementLedger.hpp"

#include <spdlog/spdlog.h>

#include <memory>

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

struct LedgerCollaborators
{
    external::ValueTransferService* transfers;
    external::DedupKeyStore* keys;
    const Clock* clock;
    std::unique_ptr<external::IdAllocator> providerIds{};
    std::unique_ptr<external::IdAllocator> subscriberIds{};
    std::unique_ptr<spdlog::logger> logger{};
};

//-------------------------------------------------------------------------

/**
 * Wires the state, the settlement engine and the registry around one set of
 * collaborators. Missing id allocators default to monotonic counters from 1 and a
 * missing logger is built from the logging configuration.
 */
class Ledger : public JsonSerializable
{
public:
    Ledger(config::LedgerConfig config, LedgerCollaborators collaborators);

    [[nodiscard]] const config::LedgerConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const accounting::LedgerState& state() const noexcept { return m_state; }
    [[nodiscard]] event::LedgerSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] registry::RegistryController& registry() noexcept { return *m_registry; }
    [[nodiscard]] settlement::SettlementLedger& settlement() noexcept { return *m_settlement; }
    [[nodiscard]] spdlog::logger& logger() noexcept { return *m_logger; }
    [[nodiscard]] const Clock& clock() const noexcept { return *m_clock; }
    [[nodiscard]] const EventLogger* eventLogger() const noexcept { return m_eventLogger.get(); }

    [[nodiscard]] Amount providerEarnings(ProviderId id) const;
    [[nodiscard]] Amount subscriberOwed(SubscriberId id) const;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const noexcept
    {
        if (m_config.debug) {
            fmt::println(fmt, std::forward<Args>(args)...);
        }
    }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    config::LedgerConfig m_config;
    std::unique_ptr<spdlog::logger> m_logger;
    const Clock* m_clock;
    accounting::LedgerState m_state;
    event::LedgerSignals m_signals;
    std::unique_ptr<settlement::SettlementLedger> m_settlement;
    std::unique_ptr<registry::RegistryController> m_registry;
    std::unique_ptr<EventLogger> m_eventLogger;
};

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
