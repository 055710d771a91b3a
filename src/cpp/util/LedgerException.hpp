/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace subledger
{

//-------------------------------------------------------------------------

enum class ErrorKind : uint32_t
{
    Authorization,
    Validation,
    State,
    TransferFailure
};

//-------------------------------------------------------------------------

class LedgerException : public std::runtime_error
{
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind{kind}
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

//-------------------------------------------------------------------------

class AuthorizationError : public LedgerException
{
public:
    explicit AuthorizationError(const std::string& message)
        : LedgerException{ErrorKind::Authorization, message}
    {}
};

class ValidationError : public LedgerException
{
public:
    explicit ValidationError(const std::string& message)
        : LedgerException{ErrorKind::Validation, message}
    {}
};

class StateError : public LedgerException
{
public:
    explicit StateError(const std::string& message)
        : LedgerException{ErrorKind::State, message}
    {}
};

class TransferFailure : public LedgerException
{
public:
    explicit TransferFailure(const std::string& message)
        : LedgerException{ErrorKind::TransferFailure, message}
    {}
};

//-------------------------------------------------------------------------

}  // namespace subledger

//-------------------------------------------------------------------------
