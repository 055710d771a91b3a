/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "subledger/external/ValueTransferService.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::settlement
{

//-------------------------------------------------------------------------

/**
 * Records the external transfers made on behalf of one ledger operation.
 *
 * A failed transfer compensates every transfer already recorded, newest first, and
 * throws TransferFailure. A journal destroyed without commit() compensates as well.
 * A compensation that fails cannot be undone here: it is logged as critical and named
 * in the thrown error.
 */
class TransferJournal
{
public:
    TransferJournal(
        external::ValueTransferService* service,
        PrincipalId custody,
        spdlog::logger* logger) noexcept;

    ~TransferJournal() noexcept;

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    // custody -> to
    void payOut(const PrincipalId& to, Amount amount, std::string_view purpose);
    // from -> custody
    void pullIn(const PrincipalId& from, Amount amount, std::string_view purpose);

    void commit() noexcept { m_committed = true; }

    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }

private:
    enum class Direction : uint32_t
    {
        OUT,
        IN
    };

    struct Entry
    {
        Direction direction;
        PrincipalId counterparty;
        Amount amount;
        std::string purpose;
    };

    [[nodiscard]] std::vector<std::string> compensate() noexcept;
    [[noreturn]] void fail(const Entry& failed);

    external::ValueTransferService* m_service;
    PrincipalId m_custody;
    spdlog::logger* m_logger;
    std::vector<Entry> m_entries;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace subledger::settlement

//-------------------------------------------------------------------------
