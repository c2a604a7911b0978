// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace raycast::log
{

static std::shared_ptr<spdlog::logger> s_logger;

void init(spdlog::level::level_enum level)
{
    if (s_logger)
    {
        s_logger->set_level(level);
        return;
    }

    s_logger = spdlog::get("raycast");
    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("raycast");
    }
    s_logger->set_level(level);
    s_logger->set_pattern("[%T] [%^%l%$] %v");

    s_logger->debug("raycast logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    if (!s_logger)
    {
        init();
    }
    return s_logger;
}

} // namespace raycast::log
