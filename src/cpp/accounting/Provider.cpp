/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/accounting/Provider.hpp"

#include "authorization.hpp"
#include "checked.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

Provider::Provider(
    ProviderId id,
    PrincipalId owner,
    PrincipalId operatorId,
    Amount fee,
    Timestamp now)
    : m_id{id},
      m_owner{std::move(owner)},
      m_operator{std::move(operatorId)},
      m_registeredAt{now},
      m_schedule{fee, now}
{}

//-------------------------------------------------------------------------

Timestamp Provider::accrualStart(SubscriberId id) const
{
    return std::max(m_roster.joinedAt(id), m_lastWithdrawal.timestamp);
}

//-------------------------------------------------------------------------

void Provider::admit(const PrincipalId& operatorId, SubscriberId id, Timestamp now)
{
    util::requireCaller({operatorId}, {m_operator}, "admit subscribers");
    m_roster.add(id, now);
}

//-------------------------------------------------------------------------

void Provider::release(const PrincipalId& operatorId, SubscriberId id)
{
    util::requireCaller({operatorId}, {m_operator}, "release subscribers");
    m_roster.remove(id);
}

//-------------------------------------------------------------------------

Provider::StagedWithdrawal Provider::stageWithdrawal(Timestamp now, Amount amount) const
{
    const CalendarMonth month = Clock::calendar(now);
    const auto it = m_monthlyWithdrawals.find(month);
    const Amount total = util::checkedAdd(
        it != m_monthlyWithdrawals.end() ? it->second : Amount{}, amount);

    MonthlyWithdrawals entry{{month, total}};
    return {
        .withdrawal = {.timestamp = now, .amount = amount},
        .monthly = entry.extract(entry.begin())
    };
}

//-------------------------------------------------------------------------

void Provider::commitWithdrawal(StagedWithdrawal staged) noexcept
{
    if (auto it = m_monthlyWithdrawals.find(staged.monthly.key()); it != m_monthlyWithdrawals.end()) {
        it->second = staged.monthly.mapped();
    } else {
        m_monthlyWithdrawals.insert(std::move(staged.monthly));
    }
    m_lastWithdrawal = staged.withdrawal;
    m_schedule.pruneBefore(staged.withdrawal.timestamp);
}

//-------------------------------------------------------------------------

void Provider::recordWithdrawal(Timestamp now, Amount amount)
{
    commitWithdrawal(stageWithdrawal(now, amount));
}

//-------------------------------------------------------------------------

void Provider::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("providerId", rapidjson::Value{m_id}, allocator);
        json.AddMember("owner", rapidjson::Value{m_owner.c_str(), allocator}, allocator);
        json.AddMember("operator", rapidjson::Value{m_operator.c_str(), allocator}, allocator);
        json.AddMember("active", rapidjson::Value{m_active}, allocator);
        json.AddMember("fee", rapidjson::Value{fee()}, allocator);
        m_schedule.jsonSerialize(json, "schedule");
        m_roster.jsonSerialize(json, "roster");
        rapidjson::Value lastJson{rapidjson::kObjectType};
        lastJson.AddMember("timestamp", rapidjson::Value{m_lastWithdrawal.timestamp}, allocator);
        lastJson.AddMember("amount", rapidjson::Value{m_lastWithdrawal.amount}, allocator);
        json.AddMember("lastWithdrawal", lastJson, allocator);
        rapidjson::Value monthlyJson{rapidjson::kObjectType};
        for (const auto& [month, amount] : m_monthlyWithdrawals) {
            monthlyJson.AddMember(
                rapidjson::Value{
                    fmt::format("{:04}-{:02}", month.year, month.month).c_str(), allocator},
                rapidjson::Value{amount},
                allocator);
        }
        json.AddMember("monthlyWithdrawals", monthlyJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
