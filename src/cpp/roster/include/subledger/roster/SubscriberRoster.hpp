/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

#include <span>
#include <unordered_map>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::roster
{

//-------------------------------------------------------------------------

struct Subscription
{
    size_t index;
    Timestamp joinedAt;
};

//-------------------------------------------------------------------------

/**
 * Dense member array plus an id -> slot map. Removal swaps the last member into the
 * vacated slot, so member order carries no meaning.
 */
class SubscriberRoster : public JsonSerializable
{
public:
    SubscriberRoster() noexcept = default;

    [[nodiscard]] std::span<const SubscriberId> members() const noexcept { return m_members; }
    [[nodiscard]] size_t size() const noexcept { return m_members.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_members.empty(); }
    [[nodiscard]] bool contains(SubscriberId id) const noexcept;
    [[nodiscard]] const Subscription& at(SubscriberId id) const;
    [[nodiscard]] Timestamp joinedAt(SubscriberId id) const;

    void add(SubscriberId id, Timestamp now);
    void remove(SubscriberId id);

    auto begin() const noexcept { return m_members.begin(); }
    auto end() const noexcept { return m_members.end(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    std::vector<SubscriberId> m_members;
    std::unordered_map<SubscriberId, Subscription> m_subscriptions;
};

//-------------------------------------------------------------------------

}  // namespace subledger::roster

//-------------------------------------------------------------------------
