// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace raycast::log {

/**
 * @brief Initialize the logging system
 *
 * Safe to call more than once; later calls only change the level.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace raycast::log

// Convenience macros
#define RAYCAST_LOG_TRACE(...) ::raycast::log::get_logger()->trace(__VA_ARGS__)
#define RAYCAST_LOG_DEBUG(...) ::raycast::log::get_logger()->debug(__VA_ARGS__)
#define RAYCAST_LOG_INFO(...)  ::raycast::log::get_logger()->info(__VA_ARGS__)
#define RAYCAST_LOG_WARN(...)  ::raycast::log::get_logger()->warn(__VA_ARGS__)
#define RAYCAST_LOG_ERROR(...) ::raycast::log::get_logger()->error(__VA_ARGS__)
#define RAYCAST_LOG_CRITICAL(...) ::raycast::log::get_logger()->critical(__VA_ARGS__)
