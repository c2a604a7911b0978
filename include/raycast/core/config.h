// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include <spdlog/common.h>

#include "raycast/exporter/export_options.h"

namespace raycast::config {

struct AppConfig {
    exporter::ExportOptions export_options{};
    uint32_t render_width = 1920;
    uint32_t render_height = 1080;
    int json_indent = 2; // -1 writes the document on a single line
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::filesystem::path config_path;
};

AppConfig load_from_file(const std::filesystem::path& path);

spdlog::level::level_enum parse_log_level(const std::string& value);

} // namespace raycast::config
