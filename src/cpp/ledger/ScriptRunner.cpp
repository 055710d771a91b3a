/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/ledger/ScriptRunner.hpp"

#include "util.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

namespace
{

pugi::xml_attribute requireAttr(pugi::xml_node node, const char* name)
{
    if (pugi::xml_attribute attr = node.attribute(name)) {
        return attr;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Step '{}' is missing required argument '{}'",
        std::source_location::current().function_name(), node.name(), name)};
}

CallerContext callerOf(pugi::xml_node step)
{
    return {.caller = requireAttr(step, "caller").as_string()};
}

void checkExpected(pugi::xml_node step, const char* what, Amount actual)
{
    pugi::xml_attribute attr = step.attribute("expect");
    if (!attr) return;
    if (const auto expected = static_cast<Amount>(attr.as_llong()); expected != actual) {
        throw std::runtime_error{fmt::format(
            "Step '{}': expected {} {}, got {}", step.name(), what, expected, actual)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

size_t ScriptResult::failures() const noexcept
{
    return static_cast<size_t>(ranges::count_if(outcomes, [](const StepOutcome& outcome) {
        return outcome.error.has_value();
    }));
}

//-------------------------------------------------------------------------

ScriptRunner::ScriptRunner(config::LedgerConfig config, Timestamp start)
    : m_transfers{config.custody}, m_clock{start}
{
    m_ledger = std::make_unique<Ledger>(
        std::move(config),
        LedgerCollaborators{
            .transfers = &m_transfers,
            .keys = &m_keys,
            .clock = &m_clock
        });
}

//-------------------------------------------------------------------------

ScriptResult ScriptRunner::run(pugi::xml_node script)
{
    ScriptResult result;
    size_t index{};
    for (pugi::xml_node step : script.children()) {
        if (step.type() != pugi::node_element) continue;

        StepOutcome outcome{.index = index++, .step = step.name()};
        const auto expectError = [&] -> std::optional<ErrorKind> {
            pugi::xml_attribute attr = step.attribute("expectError");
            if (!attr) return std::nullopt;
            if (auto kind = magic_enum::enum_cast<ErrorKind>(attr.as_string())) {
                return kind;
            }
            throw std::invalid_argument{fmt::format(
                "Step #{} '{}': unknown error kind '{}'",
                outcome.index, outcome.step, attr.as_string())};
        }();

        try {
            runStep(step);
        }
        catch (const LedgerException& exc) {
            if (expectError != exc.kind()) {
                throw std::runtime_error{fmt::format(
                    "Step #{} '{}' failed with {}: {}",
                    outcome.index, outcome.step, magic_enum::enum_name(exc.kind()), exc.what())};
            }
            outcome.error = exc.kind();
            outcome.message = exc.what();
        }

        if (expectError.has_value() && !outcome.error.has_value()) {
            throw std::runtime_error{fmt::format(
                "Step #{} '{}' succeeded but {} was expected",
                outcome.index, outcome.step, magic_enum::enum_name(*expectError))};
        }

        m_ledger->logDebug(
            "{} | step #{} {} -> {}",
            m_clock.now(), outcome.index, outcome.step,
            outcome.error ? magic_enum::enum_name(*outcome.error) : std::string_view{"ok"});
        result.outcomes.push_back(std::move(outcome));
    }
    return result;
}

//-------------------------------------------------------------------------

void ScriptRunner::runStep(pugi::xml_node step)
{
    using Handler = void (ScriptRunner::*)(pugi::xml_node);
    static const std::map<std::string_view, Handler> handlers{
        {"Fund", &ScriptRunner::fund},
        {"Advance", &ScriptRunner::advance},
        {"RegisterProvider", &ScriptRunner::registerProvider},
        {"RegisterSubscriber", &ScriptRunner::registerSubscriber},
        {"UpdateFee", &ScriptRunner::updateFee},
        {"SetStatus", &ScriptRunner::setStatus},
        {"Withdraw", &ScriptRunner::withdraw},
        {"Deposit", &ScriptRunner::deposit},
        {"Cancel", &ScriptRunner::cancel},
        {"RemoveProvider", &ScriptRunner::removeProvider}
    };

    auto it = handlers.find(step.name());
    if (it == handlers.end()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown step '{}'", std::source_location::current().function_name(), step.name())};
    }
    (this->*(it->second))(step);
}

//-------------------------------------------------------------------------

void ScriptRunner::fund(pugi::xml_node step)
{
    m_transfers.mint(
        requireAttr(step, "principal").as_string(),
        static_cast<Amount>(requireAttr(step, "amount").as_llong()));
}

//-------------------------------------------------------------------------

void ScriptRunner::advance(pugi::xml_node step)
{
    m_clock.advance(step.attribute("seconds").as_ullong());
    m_clock.advanceHours(step.attribute("hours").as_ullong());
}

//-------------------------------------------------------------------------

void ScriptRunner::registerProvider(pugi::xml_node step)
{
    const ProviderId id = m_ledger->registry().registerProvider(
        callerOf(step),
        requireAttr(step, "key").as_string(),
        static_cast<Amount>(requireAttr(step, "fee").as_llong()));
    checkExpected(step, "provider id", static_cast<Amount>(id));
}

//-------------------------------------------------------------------------

void ScriptRunner::registerSubscriber(pugi::xml_node step)
{
    const auto providerIds = util::parseList<ProviderId>(requireAttr(step, "providers").as_string());
    const SubscriberId id = m_ledger->registry().registerSubscriber(
        callerOf(step),
        static_cast<Amount>(requireAttr(step, "deposit").as_llong()),
        step.attribute("plan").as_string(),
        providerIds);
    checkExpected(step, "subscriber id", static_cast<Amount>(id));
}

//-------------------------------------------------------------------------

void ScriptRunner::updateFee(pugi::xml_node step)
{
    m_ledger->registry().updateProviderFee(
        callerOf(step),
        requireAttr(step, "provider").as_ullong(),
        static_cast<Amount>(requireAttr(step, "fee").as_llong()));
}

//-------------------------------------------------------------------------

void ScriptRunner::setStatus(pugi::xml_node step)
{
    const auto ids = util::parseList<ProviderId>(requireAttr(step, "ids").as_string());
    const auto flags = util::parseList<bool>(requireAttr(step, "flags").as_string());
    m_ledger->registry().setProviderStatus(callerOf(step), ids, flags);
}

//-------------------------------------------------------------------------

void ScriptRunner::withdraw(pugi::xml_node step)
{
    const auto receipt = m_ledger->settlement().withdraw(
        callerOf(step), requireAttr(step, "provider").as_ullong());
    checkExpected(step, "withdrawal", receipt.amount);
}

//-------------------------------------------------------------------------

void ScriptRunner::deposit(pugi::xml_node step)
{
    m_ledger->registry().deposit(
        callerOf(step),
        requireAttr(step, "subscriber").as_ullong(),
        static_cast<Amount>(requireAttr(step, "amount").as_llong()));
}

//-------------------------------------------------------------------------

void ScriptRunner::cancel(pugi::xml_node step)
{
    const auto receipt = m_ledger->settlement().cancel(
        callerOf(step), requireAttr(step, "subscriber").as_ullong());
    checkExpected(step, "owed", receipt.owed);
}

//-------------------------------------------------------------------------

void ScriptRunner::removeProvider(pugi::xml_node step)
{
    const auto receipt = m_ledger->registry().removeProvider(
        callerOf(step), requireAttr(step, "provider").as_ullong());
    checkExpected(step, "residual", receipt.amount);
}

//-------------------------------------------------------------------------

std::unique_ptr<ScriptRunner> ScriptRunner::fromXML(pugi::xml_node ledgerNode)
{
    return std::make_unique<ScriptRunner>(
        config::makeLedgerConfig(ledgerNode),
        ledgerNode.child("Script").attribute("start").as_ullong(kDefaultStart));
}

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
