/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/ledger/EventLogger.hpp"

#include "subledger/external/DedupKeyStore.hpp"

#include <fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <string>

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

namespace
{

// RFC 4180 quoting for free-form fields.
std::string csvField(std::string_view field)
{
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string res{"\""};
    for (const char c : field) {
        if (c == '"') res += '"';
        res += c;
    }
    res += '"';
    return res;
}

}  // namespace

//-------------------------------------------------------------------------

EventLogger::EventLogger(const fs::path& filepath, event::LedgerSignals& signals)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "EventLogger",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
    m_logger->trace(s_header);
    m_logger->flush();

    using namespace event;

    m_feeds.emplace_back(signals.providerRegistered.connect(
        [this](const ProviderRegisteredEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "ProviderRegistered",
                .providerId = ev.providerId,
                .principal = ev.owner,
                .amount = ev.fee,
                .detail = fmt::format("hash={}", external::toHex(ev.keyHash))
            });
        }));
    m_feeds.emplace_back(signals.providerRemoved.connect(
        [this](const ProviderRemovedEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "ProviderRemoved",
                .providerId = ev.providerId,
                .principal = ev.removedBy,
                .amount = ev.residualPaid
            });
        }));
    m_feeds.emplace_back(signals.providerStatusChanged.connect(
        [this](const ProviderStatusChangedEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "ProviderStatusChanged",
                .providerId = ev.providerId,
                .detail = ev.active ? "active" : "inactive"
            });
        }));
    m_feeds.emplace_back(signals.providerFeeUpdated.connect(
        [this](const ProviderFeeUpdatedEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "ProviderFeeUpdated",
                .providerId = ev.providerId,
                .amount = ev.fee,
                .detail = fmt::format("previous={}", ev.previousFee)
            });
        }));
    m_feeds.emplace_back(signals.subscriberRegistered.connect(
        [this](const SubscriberRegisteredEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "SubscriberRegistered",
                .subscriberId = ev.subscriberId,
                .principal = ev.owner,
                .amount = ev.deposit,
                .detail = fmt::format("plan={};providers={}", ev.plan, fmt::join(ev.providerIds, " "))
            });
        }));
    m_feeds.emplace_back(signals.subscriberDeposited.connect(
        [this](const SubscriberDepositedEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "SubscriberDeposited",
                .subscriberId = ev.subscriberId,
                .amount = ev.amount,
                .detail = fmt::format("balance={}", ev.balance)
            });
        }));
    m_feeds.emplace_back(signals.withdrawal.connect(
        [this](const WithdrawalEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "Withdrawal",
                .providerId = ev.providerId,
                .principal = ev.owner,
                .amount = ev.amount,
                .detail = fmt::format("forfeited={}", ev.forfeited)
            });
        }));
    m_feeds.emplace_back(signals.cancellation.connect(
        [this](const CancellationEvent& ev) {
            log({
                .timestamp = ev.timestamp,
                .event = "Cancellation",
                .subscriberId = ev.subscriberId,
                .principal = ev.owner,
                .amount = ev.owed,
                .detail = fmt::format("shortfall={}", ev.shortfall)
            });
        }));
}

//-------------------------------------------------------------------------

void EventLogger::log(const Row& row)
{
    m_logger->trace(
        "{},{},{},{},{},{},{}",
        row.timestamp,
        row.event,
        row.providerId ? std::to_string(*row.providerId) : std::string{},
        row.subscriberId ? std::to_string(*row.subscriberId) : std::string{},
        csvField(row.principal),
        row.amount,
        csvField(row.detail));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
