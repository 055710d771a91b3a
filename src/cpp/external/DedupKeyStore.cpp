/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/external/DedupKeyStore.hpp"

#include <fmt/format.h>
#include <openssl/sha.h>

#include <cstddef>
#include <iterator>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace subledger::external
{

//-------------------------------------------------------------------------

KeyHash hashKey(std::span<const std::byte> key)
{
    KeyHash hash;
    // OpenSSL takes unsigned char buffers.
    SHA256(reinterpret_cast<const unsigned char*>(key.data()), key.size(), hash.data());
    return hash;
}

//-------------------------------------------------------------------------

KeyHash hashKey(std::string_view key)
{
    return hashKey(std::as_bytes(std::span{key}));
}

//-------------------------------------------------------------------------

std::string toHex(const KeyHash& hash)
{
    std::string hex;
    hex.reserve(hash.size() * 2);
    for (const uint8_t byte : hash) {
        fmt::format_to(std::back_inserter(hex), "{:02x}", byte);
    }
    return hex;
}

//-------------------------------------------------------------------------

bool InMemoryDedupKeyStore::contains(const KeyHash& hash) const
{
    return m_consumed.contains(hash);
}

//-------------------------------------------------------------------------

void InMemoryDedupKeyStore::insert(const KeyHash& hash)
{
    if (!m_consumed.insert(hash).second) {
        throw std::logic_error{fmt::format(
            "{}: Key {} was already consumed",
            std::source_location::current().function_name(), toHex(hash))};
    }
}

//-------------------------------------------------------------------------

}  // namespace subledger::external

//-------------------------------------------------------------------------
