/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <set>
#include <span>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace subledger::external
{

//-------------------------------------------------------------------------

using KeyHash = std::array<uint8_t, 32>;

// SHA-256 of the raw key bytes.
[[nodiscard]] KeyHash hashKey(std::span<const std::byte> key);
[[nodiscard]] KeyHash hashKey(std::string_view key);

[[nodiscard]] std::string toHex(const KeyHash& hash);

//-------------------------------------------------------------------------

struct DedupKeyStore
{
    virtual ~DedupKeyStore() noexcept = default;

    [[nodiscard]] virtual bool contains(const KeyHash& hash) const = 0;
    virtual void insert(const KeyHash& hash) = 0;
};

//-------------------------------------------------------------------------

class InMemoryDedupKeyStore : public DedupKeyStore
{
public:
    [[nodiscard]] bool contains(const KeyHash& hash) const override;
    void insert(const KeyHash& hash) override;

    [[nodiscard]] size_t size() const noexcept { return m_consumed.size(); }

private:
    std::set<KeyHash> m_consumed;
};

//-------------------------------------------------------------------------

}  // namespace subledger::external

//-------------------------------------------------------------------------
