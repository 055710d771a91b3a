/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <limits>

//-------------------------------------------------------------------------

using Timestamp = uint64_t;

inline constexpr Timestamp TIMESTAMP_INVALID = 0;
inline constexpr Timestamp TIMESTAMP_FAR_FUTURE = std::numeric_limits<Timestamp>::max();

inline constexpr Timestamp kSecondsPerHour = 3600;

//-------------------------------------------------------------------------
