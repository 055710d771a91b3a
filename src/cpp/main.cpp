/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "subledger/ledger/ScriptRunner.hpp"
#include "common.hpp"
#include "json_util.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    CLI::App app{"SubscriptionLedger v1.0"};

    fs::path config;
    app.add_option("-f,--config-file", config, "Ledger config and script file")
        ->required()
        ->check(CLI::ExistingFile);

    bool pretty{};
    app.add_flag("--pretty", pretty, "Indent the final ledger state");

    fs::path output;
    app.add_option("-o,--output", output, "Write the final ledger state to a file");

    CLI11_PARSE(app, argc, argv);

    fmt::println("{}", app.get_description());

    const auto nodes = subledger::util::parseLedgerFile(config);
    auto runner = subledger::ledger::ScriptRunner::fromXML(nodes->ledger);
    const auto result = runner->run(nodes->script);

    fmt::println(
        " - script finished: {} steps, {} expected failures",
        result.outcomes.size(), result.failures());

    rapidjson::Document json;
    runner->ledger().jsonSerialize(json);
    const subledger::json::FormatOptions formatOptions{
        .indent = pretty
            ? std::make_optional(subledger::json::IndentOptions{})
            : std::nullopt
    };
    if (output.empty()) {
        fmt::println("{}", subledger::json::json2str(json, formatOptions));
    } else {
        std::ofstream ofs{output};
        subledger::json::dumpJson(json, ofs, formatOptions);
    }

    return 0;
}

//-------------------------------------------------------------------------
