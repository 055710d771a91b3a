/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "subledger/external/ValueTransferService.hpp"

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace subledger::test
{

//-------------------------------------------------------------------------

struct MockValueTransferService : external::ValueTransferService
{
    MOCK_METHOD(bool, transfer, (const PrincipalId&, Amount), (override));
    MOCK_METHOD(bool, transferFrom, (const PrincipalId&, const PrincipalId&, Amount), (override));
};

//-------------------------------------------------------------------------

}  // namespace subledger::test

//-------------------------------------------------------------------------
