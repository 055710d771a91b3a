/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <pugixml.hpp>

#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

//-------------------------------------------------------------------------

namespace subledger::util
{

//-------------------------------------------------------------------------

[[nodiscard]] std::vector<std::string> split(std::string_view str, char delim) noexcept;

struct Nodes
{
    pugi::xml_document doc;
    pugi::xml_node ledger;
    pugi::xml_node script;
};

[[nodiscard]] std::unique_ptr<Nodes> parseLedgerFile(const fs::path& path);
[[nodiscard]] std::unique_ptr<Nodes> parseLedgerString(std::string_view xml);

template<typename T>
[[nodiscard]] std::vector<T> parseList(std::string_view str)
{
    std::vector<T> res;
    for (const auto& token : split(str, ',')) {
        if (token.empty()) continue;
        if constexpr (std::same_as<T, bool>) {
            if (token == "1" || token == "true") {
                res.push_back(true);
            } else if (token == "0" || token == "false") {
                res.push_back(false);
            } else {
                throw std::invalid_argument{fmt::format(
                    "{}: Unrecognised flag '{}' in '{}'",
                    std::source_location::current().function_name(), token, str)};
            }
        } else {
            res.push_back(static_cast<T>(std::stoull(token)));
        }
    }
    return res;
}

//-------------------------------------------------------------------------

}  // namespace subledger::util

//-------------------------------------------------------------------------
