/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/schedule/FeeSchedule.hpp"

#include "LedgerException.hpp"
#include "checked.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace subledger::schedule
{

//-------------------------------------------------------------------------

FeeSchedule::FeeSchedule(Amount fee, Timestamp start)
{
    if (fee < 0) {
        throw ValidationError{fmt::format(
            "{}: Fee must be non-negative, was {}",
            std::source_location::current().function_name(), fee)};
    }
    m_entries.push_back({.start = start, .end = TIMESTAMP_FAR_FUTURE, .amount = fee});
}

//-------------------------------------------------------------------------

void FeeSchedule::appendRate(Amount amount, Timestamp now)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (amount < 0) {
        throw ValidationError{fmt::format("{}: Fee must be non-negative, was {}", ctx, amount)};
    }

    FeeEntry& open = m_entries.back();
    if (now < open.start) {
        throw ValidationError{fmt::format(
            "{}: Rate change at {} precedes the open entry {}", ctx, now, open)};
    }
    if (now == open.start) {
        open.amount = amount;
        return;
    }
    open.end = now;
    m_entries.push_back({.start = now, .end = TIMESTAMP_FAR_FUTURE, .amount = amount});
}

//-------------------------------------------------------------------------

size_t FeeSchedule::pruneBefore(Timestamp timestamp) noexcept
{
    size_t pruned{};
    while (m_entries.size() > 1 && m_entries.front().end <= timestamp) {
        m_entries.pop_front();
        ++pruned;
    }
    return pruned;
}

//-------------------------------------------------------------------------

Amount FeeSchedule::earningsFor(Timestamp joinedAt, Timestamp until) const
{
    Amount earnings{};
    if (until <= joinedAt) {
        return earnings;
    }

    auto it = std::ranges::partition_point(
        m_entries, [joinedAt](const FeeEntry& entry) { return entry.end <= joinedAt; });

    for (; it != m_entries.end() && it->start < until; ++it) {
        const Timestamp sliceBegin = std::max(joinedAt, it->start);
        const Timestamp sliceEnd = std::min(until, it->end);
        if (sliceEnd <= sliceBegin) continue;
        const auto units = static_cast<Amount>((sliceEnd - sliceBegin) / kAccrualUnit);
        earnings = util::checkedAdd(earnings, util::checkedMul(units, it->amount));
    }

    return earnings;
}

//-------------------------------------------------------------------------

void FeeSchedule::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const auto& entry : m_entries) {
            rapidjson::Value entryJson{rapidjson::kObjectType};
            entryJson.AddMember("start", rapidjson::Value{entry.start}, allocator);
            entryJson.AddMember(
                "end",
                entry.isOpen() ? rapidjson::Value{}.SetNull() : rapidjson::Value{entry.end}.Move(),
                allocator);
            entryJson.AddMember("amount", rapidjson::Value{entry.amount}, allocator);
            json.PushBack(entryJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::schedule

//-------------------------------------------------------------------------
