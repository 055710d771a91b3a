/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace subledger::util
{

template<std::integral T>
[[nodiscard]] T checkedAdd(T lhs, T rhs, std::source_location sl = std::source_location::current())
{
    T res;
    if (__builtin_add_overflow(lhs, rhs, &res)) {
        throw std::overflow_error{fmt::format("{}: {} + {} overflows", sl.function_name(), lhs, rhs)};
    }
    return res;
}

template<std::integral T>
[[nodiscard]] T checkedMul(T lhs, T rhs, std::source_location sl = std::source_location::current())
{
    T res;
    if (__builtin_mul_overflow(lhs, rhs, &res)) {
        throw std::overflow_error{fmt::format("{}: {} * {} overflows", sl.function_name(), lhs, rhs)};
    }
    return res;
}

}  // namespace subledger::util

//-------------------------------------------------------------------------
