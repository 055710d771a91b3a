/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "LedgerException.hpp"
#include "common.hpp"
#include "subledger/external/DedupKeyStore.hpp"
#include "subledger/external/ValueTransferService.hpp"
#include "subledger/ledger/Ledger.hpp"

#include <pugixml.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

struct StepOutcome
{
    size_t index;
    std::string step;
    std::optional<ErrorKind> error;
    std::string message;
};

struct ScriptResult
{
    std::vector<StepOutcome> outcomes;

    [[nodiscard]] size_t failures() const noexcept;
};

//-------------------------------------------------------------------------

/**
 * Drives a ledger wired with in-memory collaborators from an XML script:
 *
 * <Ledger minimalFee="50" admin="root">
 *     <Script start="1700000000">
 *         <Fund principal="alice" amount="100000"/>
 *         <RegisterProvider caller="bob" key="bob-1" fee="100"/>
 *         <Advance hours="730"/>
 *         <Withdraw caller="bob" provider="1" expect="73000"/>
 *         <Cancel caller="alice" subscriber="1" expectError="State"/>
 *     </Script>
 * </Ledger>
 *
 * A step whose outcome differs from its expectation aborts the run with
 * std::runtime_error.
 */
class ScriptRunner
{
public:
    static constexpr Timestamp kDefaultStart = 1'700'000'000;

    ScriptRunner(config::LedgerConfig config, Timestamp start);

    [[nodiscard]] Ledger& ledger() noexcept { return *m_ledger; }
    [[nodiscard]] external::InMemoryValueTransferService& transfers() noexcept
    {
        return m_transfers;
    }
    [[nodiscard]] ManualClock& clock() noexcept { return m_clock; }

    ScriptResult run(pugi::xml_node script);

    [[nodiscard]] static std::unique_ptr<ScriptRunner> fromXML(pugi::xml_node ledgerNode);

private:
    void runStep(pugi::xml_node step);

    void fund(pugi::xml_node step);
    void advance(pugi::xml_node step);
    void registerProvider(pugi::xml_node step);
    void registerSubscriber(pugi::xml_node step);
    void updateFee(pugi::xml_node step);
    void setStatus(pugi::xml_node step);
    void withdraw(pugi::xml_node step);
    void deposit(pugi::xml_node step);
    void cancel(pugi::xml_node step);
    void removeProvider(pugi::xml_node step);

    external::InMemoryValueTransferService m_transfers;
    external::InMemoryDedupKeyStore m_keys;
    ManualClock m_clock;
    std::unique_ptr<Ledger> m_ledger;
};

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
