/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

namespace subledger::external
{

//-------------------------------------------------------------------------

struct IdAllocator
{
    virtual ~IdAllocator() noexcept = default;

    [[nodiscard]] virtual uint64_t peek() const noexcept = 0;
    virtual uint64_t next() noexcept = 0;
};

//-------------------------------------------------------------------------

class MonotonicIdAllocator : public IdAllocator
{
public:
    explicit MonotonicIdAllocator(uint64_t first = 1) noexcept : m_next{first} {}

    [[nodiscard]] uint64_t peek() const noexcept override { return m_next; }
    uint64_t next() noexcept override { return m_next++; }

private:
    uint64_t m_next;
};

//-------------------------------------------------------------------------

}  // namespace subledger::external

//-------------------------------------------------------------------------
