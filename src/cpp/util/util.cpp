/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

//-------------------------------------------------------------------------

namespace subledger::util
{

//-------------------------------------------------------------------------

std::vector<std::string> split(std::string_view str, char delim) noexcept
{
    std::vector<std::string> res;
    boost::split(res, str, [delim](auto c) { return c == delim; });
    for (auto& token : res) {
        boost::trim(token);
    }
    return res;
}

//-------------------------------------------------------------------------

namespace
{

void locateNodes(Nodes& nodes, std::string_view origin)
{
    nodes.ledger = nodes.doc.child("Ledger");
    if (!nodes.ledger) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing root node 'Ledger' in {}",
            std::source_location::current().function_name(), origin)};
    }
    nodes.script = nodes.ledger.child("Script");
}

}  // namespace

//-------------------------------------------------------------------------

std::unique_ptr<Nodes> parseLedgerFile(const fs::path& path)
{
    auto nodes = std::make_unique<Nodes>();
    pugi::xml_parse_result result = nodes->doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing '{}': {}",
            std::source_location::current().function_name(),
            path.generic_string(),
            result.description())};
    }
    locateNodes(*nodes, path.generic_string());
    return nodes;
}

//-------------------------------------------------------------------------

std::unique_ptr<Nodes> parseLedgerString(std::string_view xml)
{
    auto nodes = std::make_unique<Nodes>();
    pugi::xml_parse_result result = nodes->doc.load_buffer(xml.data(), xml.size());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing ledger document: {}",
            std::source_location::current().function_name(),
            result.description())};
    }
    locateNodes(*nodes, "<string>");
    return nodes;
}

//-------------------------------------------------------------------------

}  // namespace subledger::util

//-------------------------------------------------------------------------
