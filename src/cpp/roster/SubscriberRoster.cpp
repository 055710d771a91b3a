/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/roster/SubscriberRoster.hpp"

#include "LedgerException.hpp"

//-------------------------------------------------------------------------

namespace subledger::roster
{

//-------------------------------------------------------------------------

bool SubscriberRoster::contains(SubscriberId id) const noexcept
{
    return m_subscriptions.contains(id);
}

//-------------------------------------------------------------------------

const Subscription& SubscriberRoster::at(SubscriberId id) const
{
    auto it = m_subscriptions.find(id);
    if (it == m_subscriptions.end()) {
        throw StateError{fmt::format(
            "{}: Subscriber #{} is not a member",
            std::source_location::current().function_name(), id)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

Timestamp SubscriberRoster::joinedAt(SubscriberId id) const
{
    return at(id).joinedAt;
}

//-------------------------------------------------------------------------

void SubscriberRoster::add(SubscriberId id, Timestamp now)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (now == TIMESTAMP_INVALID) {
        throw ValidationError{fmt::format(
            "{}: Subscriber #{} cannot join at the invalid timestamp", ctx, id)};
    }
    if (m_subscriptions.contains(id)) {
        throw StateError{fmt::format("{}: Subscriber #{} is already a member", ctx, id)};
    }

    m_members.push_back(id);
    m_subscriptions.insert({id, Subscription{.index = m_members.size() - 1, .joinedAt = now}});
}

//-------------------------------------------------------------------------

void SubscriberRoster::remove(SubscriberId id)
{
    auto it = m_subscriptions.find(id);
    if (it == m_subscriptions.end()) {
        throw StateError{fmt::format(
            "{}: Subscriber #{} is not a member",
            std::source_location::current().function_name(), id)};
    }

    const size_t index = it->second.index;
    const SubscriberId last = m_members.back();
    if (last != id) {
        m_members[index] = last;
        m_subscriptions.at(last).index = index;
    }
    m_members.pop_back();
    m_subscriptions.erase(it);
}

//-------------------------------------------------------------------------

void SubscriberRoster::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetArray();
        auto& allocator = json.GetAllocator();
        for (const SubscriberId id : m_members) {
            const auto& sub = m_subscriptions.at(id);
            rapidjson::Value subJson{rapidjson::kObjectType};
            subJson.AddMember("subscriberId", rapidjson::Value{id}, allocator);
            subJson.AddMember("index", rapidjson::Value{static_cast<uint64_t>(sub.index)}, allocator);
            subJson.AddMember("joinedAt", rapidjson::Value{sub.joinedAt}, allocator);
            json.PushBack(subJson, allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::roster

//-------------------------------------------------------------------------
