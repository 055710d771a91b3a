/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/ledger/Ledger.hpp"

#include "checked.hpp"
#include "subledger/accounting/EarningsCalculator.hpp"

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

Ledger::Ledger(config::LedgerConfig config, LedgerCollaborators collaborators)
    : m_config{std::move(config)},
      m_logger{collaborators.logger
          ? std::move(collaborators.logger)
          : util::makeLogger(m_config.logging)},
      m_clock{collaborators.clock}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (collaborators.transfers == nullptr
        || collaborators.keys == nullptr
        || collaborators.clock == nullptr) {
        throw std::invalid_argument{fmt::format(
            "{}: Transfer service, key store and clock are all required", ctx)};
    }

    m_settlement = std::make_unique<settlement::SettlementLedger>(settlement::SettlementLedgerDesc{
        .config = &m_config,
        .state = &m_state,
        .transfers = collaborators.transfers,
        .clock = m_clock,
        .signals = &m_signals,
        .logger = m_logger.get()
    });

    auto orMonotonic = [](std::unique_ptr<external::IdAllocator> allocator)
        -> std::unique_ptr<external::IdAllocator> {
        if (allocator) return allocator;
        return std::make_unique<external::MonotonicIdAllocator>();
    };

    m_registry = std::make_unique<registry::RegistryController>(registry::RegistryControllerDesc{
        .config = &m_config,
        .state = &m_state,
        .settlement = m_settlement.get(),
        .transfers = collaborators.transfers,
        .keys = collaborators.keys,
        .providerIds = orMonotonic(std::move(collaborators.providerIds)),
        .subscriberIds = orMonotonic(std::move(collaborators.subscriberIds)),
        .clock = m_clock,
        .signals = &m_signals,
        .logger = m_logger.get()
    });

    if (!m_config.logging.eventLog.empty()) {
        m_eventLogger = std::make_unique<EventLogger>(m_config.logging.eventLog, m_signals);
    }

    logDebug(
        "Ledger configured: minimalFee {}, overdraft policy {}, custody '{}', admin '{}'",
        m_config.minimalFee,
        magic_enum::enum_name(m_config.overdraftPolicy),
        m_config.custody,
        m_config.admin);
}

//-------------------------------------------------------------------------

Amount Ledger::providerEarnings(ProviderId id) const
{
    return accounting::totalEarnings(m_state.provider(id), m_clock->now());
}

//-------------------------------------------------------------------------

Amount Ledger::subscriberOwed(SubscriberId id) const
{
    const Timestamp now = m_clock->now();
    const auto& subscriber = m_state.subscriber(id);
    Amount owed{};
    for (const ProviderId providerId : subscriber.subscriptions()) {
        owed = util::checkedAdd(
            owed, accounting::earningsForOne(m_state.provider(providerId), id, now));
    }
    return owed;
}

//-------------------------------------------------------------------------

void Ledger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("timestamp", rapidjson::Value{m_clock->now()}, allocator);
        rapidjson::Value configJson{rapidjson::kObjectType};
        configJson.AddMember("minimalFee", rapidjson::Value{m_config.minimalFee}, allocator);
        configJson.AddMember(
            "maxProviders", rapidjson::Value{static_cast<uint64_t>(m_config.maxProviders)}, allocator);
        configJson.AddMember(
            "overdraftPolicy",
            rapidjson::Value{
                std::string{magic_enum::enum_name(m_config.overdraftPolicy)}.c_str(), allocator},
            allocator);
        configJson.AddMember(
            "custody", rapidjson::Value{m_config.custody.c_str(), allocator}, allocator);
        json.AddMember("config", configJson, allocator);
        m_state.jsonSerialize(json, "state");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
