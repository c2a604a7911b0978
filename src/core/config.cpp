// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/core/config.h"

#include <fstream>
#include <iostream>
#include <cctype>

#include <nlohmann/json.hpp>

namespace raycast::config {

spdlog::level::level_enum parse_log_level(const std::string& value) {
    const auto lowered = [&]() {
        std::string tmp = value;
        for (char& c : tmp) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return tmp;
    }();

    if (lowered == "trace") return spdlog::level::trace;
    if (lowered == "debug") return spdlog::level::debug;
    if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
    if (lowered == "error") return spdlog::level::err;
    if (lowered == "critical" || lowered == "fatal") return spdlog::level::critical;
    if (lowered == "off") return spdlog::level::off;
    return spdlog::level::info;
}

AppConfig load_from_file(const std::filesystem::path& path) {
    AppConfig config{};
    config.config_path = path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return config; // defaults
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Failed to open config file: " << path << "\n";
            return config;
        }

        nlohmann::json json;
        file >> json;

        if (auto exportSection = json.find("export"); exportSection != json.end()) {
            if (exportSection->contains("meshes")) {
                config.export_options.ExportMeshes = (*exportSection)["meshes"].get<bool>();
            }
            if (exportSection->contains("lights")) {
                config.export_options.ExportLights = (*exportSection)["lights"].get<bool>();
            }
            if (exportSection->contains("materials")) {
                config.export_options.ExportMaterials = (*exportSection)["materials"].get<bool>();
            }
        }

        if (auto render = json.find("render"); render != json.end()) {
            if (render->contains("width")) {
                config.render_width = (*render)["width"].get<uint32_t>();
            }
            if (render->contains("height")) {
                config.render_height = (*render)["height"].get<uint32_t>();
            }
        }

        if (auto output = json.find("output"); output != json.end()) {
            if (output->contains("indent")) {
                config.json_indent = (*output)["indent"].get<int>();
            }
        }

        if (auto logging = json.find("logging"); logging != json.end()) {
            if (logging->contains("level")) {
                config.log_level = parse_log_level((*logging)["level"].get<std::string>());
            }
        }
    } catch (const std::exception& err) {
        std::cerr << "Error parsing config file: " << path << " -> " << err.what() << "\n";
    }

    return config;
}

} // namespace raycast::config
