/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/accounting/Subscriber.hpp"

#include "LedgerException.hpp"
#include "checked.hpp"

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

Subscriber::Subscriber(SubscriberId id, PrincipalId owner, Amount balance, std::string plan)
    : m_id{id}, m_owner{std::move(owner)}, m_balance{balance}, m_plan{std::move(plan)}
{
    if (balance < 0) {
        throw ValidationError{fmt::format(
            "{}: Initial balance must be non-negative, was {}",
            std::source_location::current().function_name(),
            balance)};
    }
}

//-------------------------------------------------------------------------

void Subscriber::credit(Amount amount)
{
    if (amount < 0) {
        throw ValidationError{fmt::format(
            "{}: Credit amount cannot be negative {} | {}",
            std::source_location::current().function_name(), amount, *this)};
    }
    m_balance = util::checkedAdd(m_balance, amount);
}

//-------------------------------------------------------------------------

void Subscriber::debit(Amount amount)
{
    m_balance = balanceAfterDebit(amount);
}

//-------------------------------------------------------------------------

Amount Subscriber::balanceAfterDebit(Amount amount) const
{
    if (amount < 0) {
        throw ValidationError{fmt::format(
            "{}: Debit amount cannot be negative {} | {}",
            std::source_location::current().function_name(), amount, *this)};
    }
    return util::checkedAdd(m_balance, -amount);
}

//-------------------------------------------------------------------------

void Subscriber::close(Amount finalBalance) noexcept
{
    m_balance = finalBalance;
    m_subscriptions.clear();
    m_paused = true;
}

//-------------------------------------------------------------------------

void Subscriber::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("subscriberId", rapidjson::Value{m_id}, allocator);
        json.AddMember("owner", rapidjson::Value{m_owner.c_str(), allocator}, allocator);
        json.AddMember("balance", rapidjson::Value{m_balance}, allocator);
        json.AddMember("plan", rapidjson::Value{m_plan.c_str(), allocator}, allocator);
        json.AddMember("paused", rapidjson::Value{m_paused}, allocator);
        rapidjson::Value subsJson{rapidjson::kArrayType};
        for (const ProviderId id : m_subscriptions) {
            subsJson.PushBack(rapidjson::Value{id}, allocator);
        }
        json.AddMember("subscriptions", subsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
