/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Clock.hpp"
#include "JsonSerializable.hpp"
#include "common.hpp"
#include "subledger/roster/SubscriberRoster.hpp"
#include "subledger/schedule/FeeSchedule.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

/**
 * Settlement point of a provider: everything accrued before `timestamp` has been paid.
 */
struct Withdrawal
{
    Timestamp timestamp{TIMESTAMP_INVALID};
    Amount amount{};
};

//-------------------------------------------------------------------------

class Provider : public JsonSerializable
{
public:
    using MonthlyWithdrawals = std::map<CalendarMonth, Amount>;

    /**
     * A withdrawal checked against the running monthly total but not yet applied.
     * `monthly` carries the updated month entry so that committing never allocates.
     */
    struct StagedWithdrawal
    {
        Withdrawal withdrawal;
        MonthlyWithdrawals::node_type monthly;
    };

    Provider(
        ProviderId id,
        PrincipalId owner,
        PrincipalId operatorId,
        Amount fee,
        Timestamp now);

    [[nodiscard]] ProviderId id() const noexcept { return m_id; }
    [[nodiscard]] const PrincipalId& owner() const noexcept { return m_owner; }
    [[nodiscard]] const PrincipalId& operatorId() const noexcept { return m_operator; }
    [[nodiscard]] bool active() const noexcept { return m_active; }
    [[nodiscard]] Timestamp registeredAt() const noexcept { return m_registeredAt; }

    [[nodiscard]] schedule::FeeSchedule& schedule() noexcept { return m_schedule; }
    [[nodiscard]] const schedule::FeeSchedule& schedule() const noexcept { return m_schedule; }
    [[nodiscard]] const roster::SubscriberRoster& roster() const noexcept { return m_roster; }

    [[nodiscard]] const Withdrawal& lastWithdrawal() const noexcept { return m_lastWithdrawal; }
    [[nodiscard]] const MonthlyWithdrawals& monthlyWithdrawals() const noexcept
    {
        return m_monthlyWithdrawals;
    }

    [[nodiscard]] Amount fee() const noexcept { return m_schedule.currentRate(); }

    // Earliest instant a member's accrual may start from: its join time, or the last
    // settlement if that is later.
    [[nodiscard]] Timestamp accrualStart(SubscriberId id) const;

    // Roster mutations are reserved to the operator that created the provider.
    void admit(const PrincipalId& operatorId, SubscriberId id, Timestamp now);
    void release(const PrincipalId& operatorId, SubscriberId id);

    void setActive(bool flag) noexcept { m_active = flag; }
    [[nodiscard]] StagedWithdrawal stageWithdrawal(Timestamp now, Amount amount) const;
    void commitWithdrawal(StagedWithdrawal staged) noexcept;
    void recordWithdrawal(Timestamp now, Amount amount);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ProviderId m_id;
    PrincipalId m_owner;
    PrincipalId m_operator;
    bool m_active{true};
    Timestamp m_registeredAt;
    schedule::FeeSchedule m_schedule;
    roster::SubscriberRoster m_roster;
    Withdrawal m_lastWithdrawal;
    MonthlyWithdrawals m_monthlyWithdrawals;
};

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<subledger::accounting::Provider>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const subledger::accounting::Provider& provider, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Provider #{} (owner {}, fee {}, {} members, {})",
            provider.id(),
            provider.owner(),
            provider.fee(),
            provider.roster().size(),
            provider.active() ? "active" : "inactive");
    }
};

//-------------------------------------------------------------------------
