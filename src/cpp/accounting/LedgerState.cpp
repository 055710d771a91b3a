/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/accounting/LedgerState.hpp"

#include "LedgerException.hpp"

//-------------------------------------------------------------------------

namespace subledger::accounting
{

//-------------------------------------------------------------------------

Provider& LedgerState::provider(ProviderId id)
{
    return const_cast<Provider&>(std::as_const(*this).provider(id));
}

//-------------------------------------------------------------------------

const Provider& LedgerState::provider(ProviderId id) const
{
    auto it = m_providers.find(id);
    if (it == m_providers.end()) {
        throw StateError{fmt::format(
            "{}: Unknown provider #{}", std::source_location::current().function_name(), id)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

Subscriber& LedgerState::subscriber(SubscriberId id)
{
    return const_cast<Subscriber&>(std::as_const(*this).subscriber(id));
}

//-------------------------------------------------------------------------

const Subscriber& LedgerState::subscriber(SubscriberId id) const
{
    auto it = m_subscribers.find(id);
    if (it == m_subscribers.end()) {
        throw StateError{fmt::format(
            "{}: Unknown subscriber #{}", std::source_location::current().function_name(), id)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

Provider* LedgerState::findProvider(ProviderId id) noexcept
{
    auto it = m_providers.find(id);
    return it != m_providers.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

const Provider* LedgerState::findProvider(ProviderId id) const noexcept
{
    auto it = m_providers.find(id);
    return it != m_providers.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

bool LedgerState::containsProvider(ProviderId id) const noexcept
{
    return m_providers.contains(id);
}

//-------------------------------------------------------------------------

bool LedgerState::containsSubscriber(SubscriberId id) const noexcept
{
    return m_subscribers.contains(id);
}

//-------------------------------------------------------------------------

Provider& LedgerState::insertProvider(Provider provider)
{
    const ProviderId id = provider.id();
    auto [it, inserted] = m_providers.try_emplace(id, std::move(provider));
    if (!inserted) {
        throw StateError{fmt::format(
            "{}: Provider #{} already exists", std::source_location::current().function_name(), id)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

Subscriber& LedgerState::insertSubscriber(Subscriber subscriber)
{
    const SubscriberId id = subscriber.id();
    auto [it, inserted] = m_subscribers.try_emplace(id, std::move(subscriber));
    if (!inserted) {
        throw StateError{fmt::format(
            "{}: Subscriber #{} already exists",
            std::source_location::current().function_name(), id)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

void LedgerState::eraseProvider(ProviderId id)
{
    if (m_providers.erase(id) == 0) {
        throw StateError{fmt::format(
            "{}: Unknown provider #{}", std::source_location::current().function_name(), id)};
    }
}

//-------------------------------------------------------------------------

void LedgerState::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        rapidjson::Document providersJson{rapidjson::kArrayType, &allocator};
        for (const auto& provider : m_providers | views::values) {
            rapidjson::Document providerJson{&allocator};
            provider.jsonSerialize(providerJson);
            providersJson.PushBack(providerJson, allocator);
        }
        json.AddMember("providers", providersJson, allocator);
        rapidjson::Document subscribersJson{rapidjson::kArrayType, &allocator};
        for (const auto& subscriber : m_subscribers | views::values) {
            rapidjson::Document subscriberJson{&allocator};
            subscriber.jsonSerialize(subscriberJson);
            subscribersJson.PushBack(subscriberJson, allocator);
        }
        json.AddMember("subscribers", subscribersJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace subledger::accounting

//-------------------------------------------------------------------------
