/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "subledger/event/LedgerSignals.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::ledger
{

//-------------------------------------------------------------------------

class EventLogger
{
public:
    EventLogger(const fs::path& filepath, event::LedgerSignals& signals);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    static constexpr std::string_view s_header =
        "Timestamp,Event,ProviderId,SubscriberId,Principal,Amount,Detail";

private:
    struct Row
    {
        Timestamp timestamp;
        std::string_view event;
        std::optional<ProviderId> providerId;
        std::optional<SubscriberId> subscriberId;
        std::string_view principal;
        Amount amount;
        std::string detail;
    };

    void log(const Row& row);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    std::vector<bs2::scoped_connection> m_feeds;
};

//-------------------------------------------------------------------------

}  // namespace subledger::ledger

//-------------------------------------------------------------------------
