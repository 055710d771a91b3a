/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerException.hpp"
#include "common.hpp"

#include <initializer_list>

//-------------------------------------------------------------------------

namespace subledger::util
{

inline void requireCaller(
    const CallerContext& ctx,
    std::initializer_list<std::reference_wrapper<const PrincipalId>> allowed,
    std::string_view action,
    std::source_location sl = std::source_location::current())
{
    for (const PrincipalId& principal : allowed) {
        if (ctx.caller == principal) return;
    }
    throw AuthorizationError{fmt::format(
        "{}: '{}' is not allowed to {}", sl.function_name(), ctx.caller, action)};
}

}  // namespace subledger::util

//-------------------------------------------------------------------------
