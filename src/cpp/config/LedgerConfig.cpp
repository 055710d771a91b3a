/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/config/LedgerConfig.hpp"

#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace subledger::config
{

//-------------------------------------------------------------------------

LedgerConfig makeLedgerConfig(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [](pugi::xml_node node, const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return attr;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required argument '{}'", ctx, name)};
    };

    const auto minimalFee = static_cast<Amount>(getAttr(node, "minimalFee").as_llong());
    if (minimalFee <= 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'minimalFee' should be positive, was {}", ctx, minimalFee)};
    }

    const std::string admin = getAttr(node, "admin").as_string();
    if (admin.empty()) {
        throw std::invalid_argument{fmt::format("{}: 'admin' cannot be empty", ctx)};
    }

    const std::string custody = node.attribute("custody").as_string("ledger");
    if (custody.empty() || custody == admin) {
        throw std::invalid_argument{fmt::format(
            "{}: 'custody' must be non-empty and distinct from 'admin', was '{}'",
            ctx, custody)};
    }

    const auto minProviders = static_cast<size_t>(node.attribute("minProviders").as_ullong(2));
    const auto maxProvidersPerSubscriber =
        static_cast<size_t>(node.attribute("maxProvidersPerSubscriber").as_ullong(14));
    if (minProviders >= maxProvidersPerSubscriber) {
        throw std::invalid_argument{fmt::format(
            "{}: 'minProviders' {} must be less than 'maxProvidersPerSubscriber' {}",
            ctx, minProviders, maxProvidersPerSubscriber)};
    }

    const auto depositPeriods = static_cast<Amount>(node.attribute("depositPeriods").as_llong(2));
    if (depositPeriods < 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'depositPeriods' cannot be negative, was {}", ctx, depositPeriods)};
    }

    const auto overdraftPolicy = [&] {
        pugi::xml_attribute attr = node.attribute("overdraftPolicy");
        if (!attr) return OverdraftPolicy::clamp;
        if (auto policy = magic_enum::enum_cast<OverdraftPolicy>(attr.as_string())) {
            return *policy;
        }
        throw std::invalid_argument{fmt::format(
            "{}: Unknown 'overdraftPolicy' '{}'", ctx, attr.as_string())};
    }();

    return {
        .minimalFee = minimalFee,
        .maxProviders = static_cast<size_t>(node.attribute("maxProviders").as_ullong()),
        .minProviders = minProviders,
        .maxProvidersPerSubscriber = maxProvidersPerSubscriber,
        .depositPeriods = depositPeriods,
        .overdraftPolicy = overdraftPolicy,
        .custody = custody,
        .admin = admin,
        .debug = node.attribute("debug").as_bool(),
        .logging = util::LoggingConfig::fromXML(node.child("Logging"))
    };
}

//-------------------------------------------------------------------------

}  // namespace subledger::config

//-------------------------------------------------------------------------
