/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"

#include <compare>
#include <cstdint>

//-------------------------------------------------------------------------

namespace subledger
{

//-------------------------------------------------------------------------

struct CalendarMonth
{
    int32_t year;
    uint32_t month;

    auto operator<=>(const CalendarMonth&) const noexcept = default;
};

//-------------------------------------------------------------------------

class Clock
{
public:
    virtual ~Clock() noexcept = default;

    [[nodiscard]] virtual Timestamp now() const = 0;

    // Reporting only; accrual never looks at the calendar.
    [[nodiscard]] static CalendarMonth calendar(Timestamp time) noexcept;
};

//-------------------------------------------------------------------------

class ManualClock : public Clock
{
public:
    explicit ManualClock(Timestamp start);

    [[nodiscard]] Timestamp now() const override { return m_current; }

    void advance(Timestamp delta) noexcept { m_current += delta; }
    void advanceHours(uint64_t hours) noexcept { m_current += hours * kSecondsPerHour; }
    void set(Timestamp time);

private:
    Timestamp m_current;
};

//-------------------------------------------------------------------------

class SystemClock : public Clock
{
public:
    [[nodiscard]] Timestamp now() const override;
};

//-------------------------------------------------------------------------

}  // namespace subledger

//-------------------------------------------------------------------------
