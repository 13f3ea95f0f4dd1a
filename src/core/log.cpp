// lumen - direct-illumination ray caster
// Copyright (c) 2025 lumen Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "lumen/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace lumen::log
{

static std::shared_ptr<spdlog::logger> s_logger;

void init(spdlog::level::level_enum level)
{
    if (!s_logger)
    {
        s_logger = spdlog::get("lumen");
    }
    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("lumen");
        s_logger->set_pattern("[%T] [%^%l%$] %v");
    }
    s_logger->set_level(level);

    s_logger->debug("lumen logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    if (!s_logger)
    {
        init();
    }
    return s_logger;
}

} // namespace lumen::log
