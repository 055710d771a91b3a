/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Clock.hpp"

#include <date/date.h>
#include <fmt/format.h>

#include <chrono>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace subledger
{

//-------------------------------------------------------------------------

CalendarMonth Clock::calendar(Timestamp time) noexcept
{
    const date::sys_seconds tp{std::chrono::seconds{static_cast<int64_t>(time)}};
    const date::year_month_day ymd{date::floor<date::days>(tp)};
    return {
        .year = static_cast<int32_t>(ymd.year()),
        .month = static_cast<uint32_t>(ymd.month())
    };
}

//-------------------------------------------------------------------------

ManualClock::ManualClock(Timestamp start)
    : m_current{start}
{
    if (start == TIMESTAMP_INVALID) {
        throw std::invalid_argument{fmt::format(
            "{}: Clock cannot start at the invalid timestamp",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

void ManualClock::set(Timestamp time)
{
    if (time < m_current) {
        throw std::invalid_argument{fmt::format(
            "{}: Clock cannot move backwards from {} to {}",
            std::source_location::current().function_name(), m_current, time)};
    }
    m_current = time;
}

//-------------------------------------------------------------------------

Timestamp SystemClock::now() const
{
    return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

//-------------------------------------------------------------------------

}  // namespace subledger

//-------------------------------------------------------------------------
