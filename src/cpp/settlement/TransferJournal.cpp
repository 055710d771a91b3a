/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/settlement/TransferJournal.hpp"

#include "LedgerException.hpp"

#include <fmt/ranges.h>

//-------------------------------------------------------------------------

namespace subledger::settlement
{

//-------------------------------------------------------------------------

TransferJournal::TransferJournal(
    external::ValueTransferService* service,
    PrincipalId custody,
    spdlog::logger* logger) noexcept
    : m_service{service}, m_custody{std::move(custody)}, m_logger{logger}
{}

//-------------------------------------------------------------------------

TransferJournal::~TransferJournal() noexcept
{
    if (m_committed || m_entries.empty()) return;
    m_logger->warn("Rolling back {} transfer(s) of an aborted operation", m_entries.size());
    for (const auto& unreconciled : compensate()) {
        m_logger->critical("Unreconciled transfer after abort: {}", unreconciled);
    }
}

//-------------------------------------------------------------------------

void TransferJournal::payOut(const PrincipalId& to, Amount amount, std::string_view purpose)
{
    Entry entry{
        .direction = Direction::OUT,
        .counterparty = to,
        .amount = amount,
        .purpose = std::string{purpose}
    };
    if (amount == 0) return;
    if (!m_service->transfer(to, amount)) {
        fail(entry);
    }
    m_logger->debug("Paid {} to '{}' ({})", amount, to, purpose);
    m_entries.push_back(std::move(entry));
}

//-------------------------------------------------------------------------

void TransferJournal::pullIn(const PrincipalId& from, Amount amount, std::string_view purpose)
{
    Entry entry{
        .direction = Direction::IN,
        .counterparty = from,
        .amount = amount,
        .purpose = std::string{purpose}
    };
    if (amount == 0) return;
    if (!m_service->transferFrom(from, m_custody, amount)) {
        fail(entry);
    }
    m_logger->debug("Pulled {} from '{}' ({})", amount, from, purpose);
    m_entries.push_back(std::move(entry));
}

//-------------------------------------------------------------------------

std::vector<std::string> TransferJournal::compensate() noexcept
{
    std::vector<std::string> unreconciled;
    for (const auto& entry : m_entries | views::reverse) {
        const auto description = fmt::format(
            "{} {} {} '{}' ({})",
            entry.direction == Direction::OUT ? "paid" : "pulled",
            entry.amount,
            entry.direction == Direction::OUT ? "to" : "from",
            entry.counterparty,
            entry.purpose);
        bool reversed{};
        try {
            reversed = entry.direction == Direction::OUT
                ? m_service->transferFrom(entry.counterparty, m_custody, entry.amount)
                : m_service->transfer(entry.counterparty, entry.amount);
        }
        catch (const std::exception& exc) {
            m_logger->error("Compensating '{}' threw: {}", description, exc.what());
        }
        if (!reversed) {
            unreconciled.push_back(description);
        }
    }
    m_entries.clear();
    return unreconciled;
}

//-------------------------------------------------------------------------

void TransferJournal::fail(const Entry& failed)
{
    const auto unreconciled = compensate();
    for (const auto& description : unreconciled) {
        m_logger->critical("Unreconciled transfer after failure: {}", description);
    }
    throw TransferFailure{fmt::format(
        "{}: Transfer of {} {} '{}' ({}) was declined{}",
        std::source_location::current().function_name(),
        failed.amount,
        failed.direction == Direction::OUT ? "to" : "from",
        failed.counterparty,
        failed.purpose,
        unreconciled.empty()
            ? std::string{}
            : fmt::format("; unreconciled: {}", fmt::join(unreconciled, "; ")))};
}

//-------------------------------------------------------------------------

}  // namespace subledger::settlement

//-------------------------------------------------------------------------
