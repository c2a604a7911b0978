// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include <raycast/core/config.h>
#include <raycast/core/log.h>
#include <raycast/document/json_io.h>
#include <raycast/exporter/scene_serializer.h>
#include <raycast/gltf/gltf_scene_loader.h>

#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <string>

using namespace raycast;

/**
 * raycast_export - write a glTF scene as a RayCast scene document
 */
int main(int argc, char** argv) {
    CLI::App app{"raycast_export - RayCast scene exporter"};

    std::filesystem::path scenePath;
    std::filesystem::path outputPath;
    std::filesystem::path configPath = "raycast.json";
    uint32_t width = 0;
    uint32_t height = 0;
    int indent = 2;
    std::string activeObject;
    std::string logLevel;
    bool noMeshes = false;
    bool noLights = false;
    bool noMaterials = false;
    bool verify = false;

    app.add_option("--scene", scenePath, "Path to the scene file (glTF or GLB)")
        ->required()
        ->check(CLI::ExistingFile);

    app.add_option("-o,--output", outputPath, "Destination document (default: <scene>_raycast.json)");
    app.add_option("--config", configPath, "Export configuration file");
    auto* widthOption = app.add_option("--width", width, "Render width in pixels");
    auto* heightOption = app.add_option("--height", height, "Render height in pixels");
    app.add_option("--active", activeObject, "Object treated as selected (focus distance)");
    auto* indentOption = app.add_option("--indent", indent, "JSON indentation, -1 for a single line");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error");
    app.add_flag("--no-meshes", noMeshes, "Skip mesh objects");
    app.add_flag("--no-lights", noLights, "Skip light objects");
    app.add_flag("--no-materials", noMaterials, "Give every primitive the default material");
    app.add_flag("--verify", verify, "Re-read the written document and check it");

    CLI11_PARSE(app, argc, argv);

    config::AppConfig cfg = config::load_from_file(configPath);
    if (!logLevel.empty()) {
        cfg.log_level = config::parse_log_level(logLevel);
    }
    log::init(cfg.log_level);

    if (widthOption->count() > 0) cfg.render_width = width;
    if (heightOption->count() > 0) cfg.render_height = height;
    if (indentOption->count() > 0) cfg.json_indent = indent;
    if (noMeshes) cfg.export_options.ExportMeshes = false;
    if (noLights) cfg.export_options.ExportLights = false;
    if (noMaterials) cfg.export_options.ExportMaterials = false;

    try {
        gltf::GltfLoadOptions loadOptions;
        loadOptions.Render = scene::RenderSettings{cfg.render_width, cfg.render_height};
        if (!activeObject.empty()) {
            loadOptions.ActiveObject = activeObject;
        }

        auto loaded = gltf::LoadGltfScene(scenePath, loadOptions);
        if (!loaded) {
            RAYCAST_LOG_ERROR("{}", loaded.GetError().Message);
            return 1;
        }
        const scene::Scene& scene = loaded.Value();

        if (outputPath.empty()) {
            outputPath = scenePath.parent_path() / (scene.Name + "_raycast.json");
        }

        auto exported = exporter::ExportScene(scene, cfg.export_options, outputPath, cfg.json_indent);
        if (!exported) {
            return 1;
        }

        if (verify) {
            auto reread = document::ReadDocument(outputPath);
            if (!reread) {
                RAYCAST_LOG_ERROR("Verification failed: {}", reread.GetError().Message);
                return 1;
            }
            RAYCAST_LOG_INFO("Verified {}", outputPath.string());
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
