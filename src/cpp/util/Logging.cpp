/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

namespace subledger::util
{

//-------------------------------------------------------------------------

LoggingConfig LoggingConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    LoggingConfig config;
    if (!node) {
        return config;
    }

    if (pugi::xml_attribute attr = node.attribute("level")) {
        const auto level = spdlog::level::from_str(attr.as_string());
        if (level == spdlog::level::off && std::string_view{attr.as_string()} != "off") {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown log level '{}'", ctx, attr.as_string())};
        }
        config.level = level;
    }
    config.file = node.attribute("file").as_string();
    config.eventLog = node.attribute("eventLog").as_string();
    config.console = node.attribute("console").as_bool(true);

    return config;
}

//-------------------------------------------------------------------------

std::unique_ptr<spdlog::logger> makeLogger(const LoggingConfig& config)
{
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_st>());
    }
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_st>(config.file.string()));
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_st>());
    }

    auto logger = std::make_unique<spdlog::logger>("subledger", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    return logger;
}

//-------------------------------------------------------------------------

std::unique_ptr<spdlog::logger> makeNullLogger()
{
    auto logger = std::make_unique<spdlog::logger>(
        "subledger", std::make_shared<spdlog::sinks::null_sink_st>());
    logger->set_level(spdlog::level::off);
    return logger;
}

//-------------------------------------------------------------------------

}  // namespace subledger::util

//-------------------------------------------------------------------------
