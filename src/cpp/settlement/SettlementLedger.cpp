/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/settlement/SettlementLedger.hpp"

#include "LedgerException.hpp"
#include "authorization.hpp"
#include "checked.hpp"
#include "subledger/settlement/TransferJournal.hpp"

#include <algorithm>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::settlement
{

//-------------------------------------------------------------------------

SettlementLedger::SettlementLedger(const SettlementLedgerDesc& desc) noexcept
    : m_config{desc.config},
      m_state{desc.state},
      m_transfers{desc.transfers},
      m_clock{desc.clock},
      m_signals{desc.signals},
      m_logger{desc.logger}
{}

//-------------------------------------------------------------------------

WithdrawalReceipt SettlementLedger::withdraw(const CallerContext& ctx, ProviderId providerId)
{
    auto& provider = m_state->provider(providerId);
    util::requireCaller(ctx, {provider.owner()}, fmt::format("withdraw for provider #{}", providerId));

    if (!provider.active()) {
        throw StateError{fmt::format(
            "{}: Provider #{} is inactive",
            std::source_location::current().function_name(), providerId)};
    }

    return settle(provider, m_clock->now());
}

//-------------------------------------------------------------------------

WithdrawalReceipt SettlementLedger::settleResidual(ProviderId providerId, Timestamp now)
{
    return settle(m_state->provider(providerId), now);
}

//-------------------------------------------------------------------------

WithdrawalReceipt SettlementLedger::settle(accounting::Provider& provider, Timestamp now)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto earnings = accounting::perSubscriberEarnings(provider, now);

    WithdrawalReceipt receipt{
        .providerId = provider.id(),
        .timestamp = now,
        .amount = 0,
        .forfeited = 0
    };
    Amount gross{};
    std::vector<std::pair<accounting::Subscriber*, Amount>> balances;
    balances.reserve(earnings.size());

    for (const auto& [subscriberId, owed] : earnings) {
        auto& subscriber = m_state->subscriber(subscriberId);
        gross = util::checkedAdd(gross, owed);

        Amount debit = owed;
        switch (m_config->overdraftPolicy) {
            case config::OverdraftPolicy::clamp:
                debit = std::min(owed, std::max(subscriber.balance(), Amount{}));
                break;
            case config::OverdraftPolicy::reject:
                if (owed > subscriber.balance()) {
                    throw StateError{fmt::format(
                        "{}: Subscriber #{} cannot cover {} owed to provider #{} | {}",
                        ctx, subscriberId, owed, provider.id(), subscriber)};
                }
                break;
            case config::OverdraftPolicy::allow:
                break;
        }

        if (debit < owed) {
            m_logger->warn(
                "{} | Subscriber #{} covers {} of {} owed to provider #{}; {} forfeited",
                now, subscriberId, debit, owed, provider.id(), owed - debit);
        }
        receipt.amount = util::checkedAdd(receipt.amount, debit);
        receipt.forfeited = util::checkedAdd(receipt.forfeited, owed - debit);
        receipt.debits.emplace(subscriberId, debit);
        balances.emplace_back(&subscriber, subscriber.balanceAfterDebit(debit));
    }

    if (gross == 0) {
        return receipt;
    }

    auto staged = provider.stageWithdrawal(now, receipt.amount);

    // Nothing past the payout may throw.
    TransferJournal journal{m_transfers, m_config->custody, m_logger};
    journal.payOut(provider.owner(), receipt.amount, fmt::format("withdrawal #{}", provider.id()));

    for (const auto& [subscriber, balance] : balances) {
        subscriber->assignBalance(balance);
    }
    provider.commitWithdrawal(std::move(staged));
    journal.commit();

    m_logger->info(
        "{} | Provider #{} withdrew {} from {} subscriber(s)",
        now, provider.id(), receipt.amount, receipt.debits.size());

    m_signals->withdrawal({
        .timestamp = now,
        .providerId = provider.id(),
        .owner = provider.owner(),
        .amount = receipt.amount,
        .forfeited = receipt.forfeited
    });

    return receipt;
}

//-------------------------------------------------------------------------

CancellationReceipt SettlementLedger::cancel(const CallerContext& ctx, SubscriberId subscriberId)
{
    auto& subscriber = m_state->subscriber(subscriberId);
    util::requireCaller(
        ctx, {subscriber.owner()}, fmt::format("cancel subscriber #{}", subscriberId));

    if (subscriber.paused()) {
        throw StateError{fmt::format(
            "{}: Subscriber #{} is already cancelled",
            std::source_location::current().function_name(), subscriberId)};
    }

    const Timestamp now = m_clock->now();

    CancellationReceipt receipt{
        .subscriberId = subscriberId,
        .timestamp = now,
        .owed = 0,
        .shortfall = 0,
        .finalBalance = 0
    };

    for (const ProviderId providerId : subscriber.subscriptions()) {
        const auto& provider = m_state->provider(providerId);
        const Amount share = accounting::earningsForOne(provider, subscriberId, now);
        receipt.payouts.emplace(providerId, share);
        receipt.owed = util::checkedAdd(receipt.owed, share);
    }

    if (receipt.owed > subscriber.balance()) {
        receipt.shortfall = receipt.owed - subscriber.balance();
        receipt.finalBalance = 0;
    } else {
        receipt.finalBalance = subscriber.balance() - receipt.owed;
    }

    TransferJournal journal{m_transfers, m_config->custody, m_logger};
    journal.pullIn(
        subscriber.owner(), receipt.shortfall, fmt::format("shortfall #{}", subscriberId));
    for (const auto& [providerId, share] : receipt.payouts) {
        journal.payOut(
            m_state->provider(providerId).owner(),
            share,
            fmt::format("cancellation #{} -> provider #{}", subscriberId, providerId));
    }

    for (const ProviderId providerId : receipt.payouts | views::keys) {
        m_state->provider(providerId).release(m_config->custody, subscriberId);
    }
    subscriber.close(receipt.finalBalance);
    journal.commit();

    m_logger->info(
        "{} | Subscriber #{} cancelled: owed {}, shortfall {}, {} provider(s) paid",
        now, subscriberId, receipt.owed, receipt.shortfall, receipt.payouts.size());

    m_signals->cancellation({
        .timestamp = now,
        .subscriberId = subscriberId,
        .owner = subscriber.owner(),
        .owed = receipt.owed,
        .shortfall = receipt.shortfall,
        .payouts = receipt.payouts
    });

    return receipt;
}

//-------------------------------------------------------------------------

}  // namespace subledger::settlement

//-------------------------------------------------------------------------
