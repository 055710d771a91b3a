/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <map>

//-------------------------------------------------------------------------

namespace subledger::external
{

//-------------------------------------------------------------------------

/**
 * Moves value between principals. `transfer` pays out of the ledger's custody
 * account; `transferFrom` pulls from an arbitrary principal. A `false` return
 * means the transfer did not happen.
 */
struct ValueTransferService
{
    virtual ~ValueTransferService() noexcept = default;

    [[nodiscard]] virtual bool transfer(const PrincipalId& to, Amount amount) = 0;
    [[nodiscard]] virtual bool transferFrom(
        const PrincipalId& from, const PrincipalId& to, Amount amount) = 0;
};

//-------------------------------------------------------------------------

class InMemoryValueTransferService : public ValueTransferService
{
public:
    explicit InMemoryValueTransferService(PrincipalId custody) noexcept;

    [[nodiscard]] bool transfer(const PrincipalId& to, Amount amount) override;
    [[nodiscard]] bool transferFrom(
        const PrincipalId& from, const PrincipalId& to, Amount amount) override;

    void mint(const PrincipalId& to, Amount amount);

    [[nodiscard]] Amount balanceOf(const PrincipalId& principal) const noexcept;
    [[nodiscard]] const PrincipalId& custody() const noexcept { return m_custody; }

private:
    PrincipalId m_custody;
    std::map<PrincipalId, Amount> m_balances;
};

//-------------------------------------------------------------------------

}  // namespace subledger::external

//-------------------------------------------------------------------------
