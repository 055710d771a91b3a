/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

#include <deque>

//-------------------------------------------------------------------------

namespace subledger::schedule
{

//-------------------------------------------------------------------------

/**
 * Charge rate per accrual unit over the half-open interval [start, end).
 */
struct FeeEntry
{
    Timestamp start;
    Timestamp end;
    Amount amount;

    [[nodiscard]] bool isOpen() const noexcept { return end == TIMESTAMP_FAR_FUTURE; }

    bool operator==(const FeeEntry&) const noexcept = default;
};

//-------------------------------------------------------------------------

/**
 * Ordered history of a provider's rate. The last entry is always open-ended.
 *
 * Entries entirely before the latest settlement point are pruned, so the history is
 * bounded by the number of rate changes since then.
 */
class FeeSchedule : public JsonSerializable
{
public:
    static constexpr Timestamp kAccrualUnit = kSecondsPerHour;

    FeeSchedule(Amount fee, Timestamp start);

    [[nodiscard]] Amount currentRate() const noexcept { return m_entries.back().amount; }
    [[nodiscard]] const std::deque<FeeEntry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }

    void appendRate(Amount amount, Timestamp now);
    size_t pruneBefore(Timestamp timestamp) noexcept;

    /**
     * Sum over every retained entry of (whole units of overlap with [joinedAt, until))
     * times the entry rate. A partial unit within a slice contributes nothing.
     */
    [[nodiscard]] Amount earningsFor(Timestamp joinedAt, Timestamp until) const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    std::deque<FeeEntry> m_entries;
};

//-------------------------------------------------------------------------

}  // namespace subledger::schedule

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<subledger::schedule::FeeEntry>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const subledger::schedule::FeeEntry& entry, FormatContext& ctx) const
    {
        if (entry.isOpen()) {
            return fmt::format_to(ctx.out(), "[{}, inf) @ {}", entry.start, entry.amount);
        }
        return fmt::format_to(
            ctx.out(), "[{}, {}) @ {}", entry.start, entry.end, entry.amount);
    }
};

//-------------------------------------------------------------------------
