/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/registry/RegistryController.hpp"

#include "LedgerException.hpp"
#include "authorization.hpp"
#include "checked.hpp"
#include "subledger/settlement/TransferJournal.hpp"

#include <fmt/ranges.h>

#include <set>

//-------------------------------------------------------------------------

namespace subledger::registry
{

//-------------------------------------------------------------------------

RegistryController::RegistryController(RegistryControllerDesc desc) noexcept
    : m_config{desc.config},
      m_state{desc.state},
      m_settlement{desc.settlement},
      m_transfers{desc.transfers},
      m_keys{desc.keys},
      m_providerIds{std::move(desc.providerIds)},
      m_subscriberIds{std::move(desc.subscriberIds)},
      m_clock{desc.clock},
      m_signals{desc.signals},
      m_logger{desc.logger}
{}

//-------------------------------------------------------------------------

ProviderId RegistryController::registerProvider(
    const CallerContext& ctx, std::string_view key, Amount fee)
{
    static constexpr auto sl = std::source_location::current();

    checkFee(fee, sl);

    if (m_config->maxProviders > 0 && m_state->providers().size() >= m_config->maxProviders) {
        throw ValidationError{fmt::format(
            "{}: Provider capacity of {} reached", sl.function_name(), m_config->maxProviders)};
    }

    const auto keyHash = external::hashKey(key);
    if (m_keys->contains(keyHash)) {
        throw ValidationError{fmt::format(
            "{}: Registration key {} was already used",
            sl.function_name(), external::toHex(keyHash))};
    }

    const Timestamp now = m_clock->now();
    const ProviderId id = m_providerIds->next();

    m_state->insertProvider(accounting::Provider{id, ctx.caller, m_config->custody, fee, now});
    try {
        m_keys->insert(keyHash);
    }
    catch (...) {
        m_state->eraseProvider(id);
        throw;
    }

    m_logger->info("{} | Provider #{} registered by '{}' with fee {}", now, id, ctx.caller, fee);

    m_signals->providerRegistered({
        .timestamp = now,
        .providerId = id,
        .owner = ctx.caller,
        .key = std::string{key},
        .keyHash = keyHash,
        .fee = fee
    });

    return id;
}

//-------------------------------------------------------------------------

SubscriberId RegistryController::registerSubscriber(
    const CallerContext& ctx,
    Amount deposit,
    std::string plan,
    std::span<const ProviderId> providerIds)
{
    static constexpr auto ctxName = std::source_location::current().function_name();

    if (providerIds.size() <= m_config->minProviders
        || providerIds.size() > m_config->maxProvidersPerSubscriber) {
        throw ValidationError{fmt::format(
            "{}: Expected more than {} and at most {} providers, got {}",
            ctxName,
            m_config->minProviders,
            m_config->maxProvidersPerSubscriber,
            providerIds.size())};
    }
    if (deposit < 0) {
        throw ValidationError{fmt::format(
            "{}: Deposit cannot be negative, was {}", ctxName, deposit)};
    }
    if (std::set<ProviderId>(providerIds.begin(), providerIds.end()).size() != providerIds.size()) {
        throw ValidationError{fmt::format(
            "{}: Provider list contains duplicates: {}", ctxName, providerIds)};
    }

    const Timestamp now = m_clock->now();

    std::vector<ProviderId> joined;
    Amount working = deposit;
    for (const ProviderId providerId : providerIds) {
        const auto* provider = m_state->findProvider(providerId);
        if (provider == nullptr || !provider->active()) {
            m_logger->debug("{} | Skipping unavailable provider #{}", now, providerId);
            continue;
        }
        working = util::checkedAdd(
            working, -util::checkedMul(m_config->depositPeriods, provider->fee()));
        joined.push_back(providerId);
    }

    if (working < 0) {
        throw ValidationError{fmt::format(
            "{}: Deposit {} does not cover {} fee period(s) of the selected providers ({} short)",
            ctxName, deposit, m_config->depositPeriods, -working)};
    }

    settlement::TransferJournal journal{m_transfers, m_config->custody, m_logger};
    journal.pullIn(ctx.caller, deposit, "subscriber deposit");

    const SubscriberId id = m_subscriberIds->next();
    auto& subscriber =
        m_state->insertSubscriber(accounting::Subscriber{id, ctx.caller, deposit, std::move(plan)});
    for (const ProviderId providerId : joined) {
        m_state->provider(providerId).admit(m_config->custody, id, now);
        subscriber.subscribe(providerId);
    }
    journal.commit();

    m_logger->info(
        "{} | Subscriber #{} registered by '{}' with deposit {} across providers {}",
        now, id, ctx.caller, deposit, joined);

    m_signals->subscriberRegistered({
        .timestamp = now,
        .subscriberId = id,
        .owner = ctx.caller,
        .deposit = deposit,
        .plan = subscriber.plan(),
        .providerIds = joined
    });

    return id;
}

//-------------------------------------------------------------------------

void RegistryController::setProviderStatus(
    const CallerContext& ctx,
    std::span<const ProviderId> ids,
    const std::vector<bool>& flags)
{
    static constexpr auto ctxName = std::source_location::current().function_name();

    util::requireCaller(ctx, {m_config->admin}, "set provider status");

    if (ids.size() != flags.size()) {
        throw ValidationError{fmt::format(
            "{}: Got {} ids but {} flags", ctxName, ids.size(), flags.size())};
    }
    for (const ProviderId id : ids) {
        if (!m_state->containsProvider(id)) {
            throw StateError{fmt::format("{}: Unknown provider #{}", ctxName, id)};
        }
    }

    const Timestamp now = m_clock->now();
    for (size_t i = 0; i < ids.size(); ++i) {
        auto& provider = m_state->provider(ids[i]);
        if (provider.active() == flags[i]) continue;
        provider.setActive(flags[i]);
        m_logger->info(
            "{} | Provider #{} is now {}", now, ids[i], flags[i] ? "active" : "inactive");
        m_signals->providerStatusChanged({
            .timestamp = now,
            .providerId = ids[i],
            .active = flags[i]
        });
    }
}

//-------------------------------------------------------------------------

settlement::WithdrawalReceipt RegistryController::removeProvider(
    const CallerContext& ctx, ProviderId id)
{
    const auto& provider = m_state->provider(id);
    util::requireCaller(
        ctx, {provider.owner(), m_config->admin}, fmt::format("remove provider #{}", id));

    const Timestamp now = m_clock->now();
    auto receipt = m_settlement->settleResidual(id, now);

    for (const SubscriberId subscriberId : provider.roster()) {
        m_state->subscriber(subscriberId).unsubscribe(id);
    }
    m_state->eraseProvider(id);

    m_logger->info(
        "{} | Provider #{} removed by '{}', residual {} paid", now, id, ctx.caller, receipt.amount);

    m_signals->providerRemoved({
        .timestamp = now,
        .providerId = id,
        .removedBy = ctx.caller,
        .residualPaid = receipt.amount
    });

    return receipt;
}

//-------------------------------------------------------------------------

void RegistryController::updateProviderFee(const CallerContext& ctx, ProviderId id, Amount fee)
{
    static constexpr auto sl = std::source_location::current();

    auto& provider = m_state->provider(id);
    util::requireCaller(ctx, {provider.owner()}, fmt::format("update fee of provider #{}", id));
    checkFee(fee, sl);

    const Timestamp now = m_clock->now();
    const Amount previousFee = provider.fee();
    provider.schedule().appendRate(fee, now);

    m_logger->info("{} | Provider #{} fee {} -> {}", now, id, previousFee, fee);

    m_signals->providerFeeUpdated({
        .timestamp = now,
        .providerId = id,
        .previousFee = previousFee,
        .fee = fee
    });
}

//-------------------------------------------------------------------------

void RegistryController::deposit(const CallerContext& ctx, SubscriberId id, Amount amount)
{
    static constexpr auto ctxName = std::source_location::current().function_name();

    auto& subscriber = m_state->subscriber(id);
    util::requireCaller(ctx, {subscriber.owner()}, fmt::format("deposit for subscriber #{}", id));

    if (amount <= 0) {
        throw ValidationError{fmt::format(
            "{}: Deposit amount must be positive, was {}", ctxName, amount)};
    }
    if (subscriber.paused()) {
        throw StateError{fmt::format("{}: Subscriber #{} is cancelled", ctxName, id)};
    }

    const Timestamp now = m_clock->now();

    settlement::TransferJournal journal{m_transfers, m_config->custody, m_logger};
    journal.pullIn(subscriber.owner(), amount, fmt::format("deposit #{}", id));
    subscriber.credit(amount);
    journal.commit();

    m_logger->info("{} | Subscriber #{} deposited {}, balance {}", now, id, amount, subscriber.balance());

    m_signals->subscriberDeposited({
        .timestamp = now,
        .subscriberId = id,
        .amount = amount,
        .balance = subscriber.balance()
    });
}

//-------------------------------------------------------------------------

void RegistryController::checkFee(Amount fee, std::source_location sl) const
{
    if (fee < m_config->minimalFee) {
        throw ValidationError{fmt::format(
            "{}: Fee {} is below the minimal fee {}",
            sl.function_name(), fee, m_config->minimalFee)};
    }
}

//-------------------------------------------------------------------------

}  // namespace subledger::registry

//-------------------------------------------------------------------------
