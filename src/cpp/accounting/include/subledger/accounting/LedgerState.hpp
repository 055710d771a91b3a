/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "subledger/accounting/Provider.hpp"
#include "subledger/accounting/Subscriber.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

class LedgerState : public JsonSerializable
{
public:
    using ProviderContainer = std::map<ProviderId, Provider>;
    using SubscriberContainer = std::map<SubscriberId, Subscriber>;

    [[nodiscard]] Provider& provider(ProviderId id);
    [[nodiscard]] const Provider& provider(ProviderId id) const;
    [[nodiscard]] Subscriber& subscriber(SubscriberId id);
    [[nodiscard]] const Subscriber& subscriber(SubscriberId id) const;

    [[nodiscard]] Provider* findProvider(ProviderId id) noexcept;
    [[nodiscard]] const Provider* findProvider(ProviderId id) const noexcept;

    [[nodiscard]] bool containsProvider(ProviderId id) const noexcept;
    [[nodiscard]] bool containsSubscriber(SubscriberId id) const noexcept;

    [[nodiscard]] const ProviderContainer& providers() const noexcept { return m_providers; }
    [[nodiscard]] const SubscriberContainer& subscribers() const noexcept { return m_subscribers; }

    Provider& insertProvider(Provider provider);
    Subscriber& insertSubscriber(Subscriber subscriber);
    void eraseProvider(ProviderId id);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ProviderContainer m_providers;
    SubscriberContainer m_subscribers;
};

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
