/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <spdlog/spdlog.h>

#include <memory>

//-------------------------------------------------------------------------

namespace subledger::util
{

//-------------------------------------------------------------------------

struct LoggingConfig
{
    spdlog::level::level_enum level = spdlog::level::info;
    fs::path file;
    fs::path eventLog;
    bool console = true;

    [[nodiscard]] static LoggingConfig fromXML(pugi::xml_node node);
};

[[nodiscard]] std::unique_ptr<spdlog::logger> makeLogger(const LoggingConfig& config);
[[nodiscard]] std::unique_ptr<spdlog::logger> makeNullLogger();

//-------------------------------------------------------------------------

}  // namespace subledger::util

//-------------------------------------------------------------------------
