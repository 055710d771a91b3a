/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

#include <set>

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

class Subscriber : public JsonSerializable
{
public:
    Subscriber(SubscriberId id, PrincipalId owner, Amount balance, std::string plan);

    [[nodiscard]] SubscriberId id() const noexcept { return m_id; }
    [[nodiscard]] const PrincipalId& owner() const noexcept { return m_owner; }
    [[nodiscard]] Amount balance() const noexcept { return m_balance; }
    [[nodiscard]] const std::string& plan() const noexcept { return m_plan; }
    [[nodiscard]] bool paused() const noexcept { return m_paused; }
    [[nodiscard]] const std::set<ProviderId>& subscriptions() const noexcept
    {
        return m_subscriptions;
    }
    [[nodiscard]] bool isSubscribedTo(ProviderId id) const noexcept
    {
        return m_subscriptions.contains(id);
    }

    void credit(Amount amount);
    void debit(Amount amount);
    [[nodiscard]] Amount balanceAfterDebit(Amount amount) const;
    void assignBalance(Amount balance) noexcept { m_balance = balance; }
    void subscribe(ProviderId id) { m_subscriptions.insert(id); }
    void unsubscribe(ProviderId id) noexcept { m_subscriptions.erase(id); }

    // Clears every subscription and pauses the account; the record and its balance stay.
    void close(Amount finalBalance) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    SubscriberId m_id;
    PrincipalId m_owner;
    Amount m_balance;
    std::string m_plan;
    bool m_paused{false};
    std::set<ProviderId> m_subscriptions;
};

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<subledger::accounting::Subscriber>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const subledger::accounting::Subscriber& sub, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Subscriber #{} (owner {}, balance {}, {} subscriptions{})",
            sub.id(),
            sub.owner(),
            sub.balance(),
            sub.subscriptions().size(),
            sub.paused() ? ", paused" : "");
    }
};

//-------------------------------------------------------------------------
