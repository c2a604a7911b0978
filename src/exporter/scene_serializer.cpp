// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/exporter/scene_serializer.h"
#include "raycast/exporter/camera_deriver.h"
#include "raycast/exporter/geometry_resolver.h"
#include "raycast/exporter/light_exporter.h"
#include "raycast/document/json_io.h"
#include "raycast/core/log.h"

#include <fstream>
#include <system_error>

#include <fmt/format.h>

namespace raycast::exporter {

namespace fs = std::filesystem;

document::SceneDocument Serialize(const scene::Scene& scene, const ExportOptions& options) {
    document::SceneDocument doc;
    doc.Name = scene.Name;

    GeometryResolver resolver(options, *scene.Evaluator);

    for (const auto& object : scene.Objects) {
        if (object.Kind == scene::ObjectKind::Mesh && options.ExportMeshes) {
            if (auto primitive = resolver.Resolve(object)) {
                doc.Objects.push_back(std::move(*primitive));
            }
        } else if (object.Kind == scene::ObjectKind::Light && options.ExportLights) {
            if (auto light = ExportLight(object)) {
                doc.Lights.push_back(std::move(*light));
            }
        }
    }

    doc.Cam = DeriveCamera(scene.ActiveCamera(), scene.Render, scene.ActiveObject());
    doc.Bg = document::Background{"gradient", 1.0};
    return doc;
}

core::Result<void> WriteDocument(const document::SceneDocument& document,
                                 const fs::path& path,
                                 int indent) {
    std::error_code ec;
    const fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return core::MakeError(fmt::format("Failed to create directory {}: {}", parent.string(), ec.message()));
        }
    }

    std::string text;
    try {
        text = document::DumpDocument(document, indent);
    } catch (const nlohmann::json::exception& err) {
        return core::MakeError(fmt::format("Failed to serialize document '{}': {}", document.Name, err.what()));
    }

    fs::path staging = path;
    staging += ".tmp";
    {
        std::ofstream file(staging, std::ios::binary | std::ios::trunc);
        if (!file) {
            return core::MakeError(fmt::format("Failed to open {} for writing", staging.string()));
        }
        file << text << '\n';
        file.close();
        if (!file) {
            fs::remove(staging, ec);
            return core::MakeError(fmt::format("Failed to write {}", staging.string()));
        }
    }

    fs::rename(staging, path, ec);
    if (ec) {
        const std::string reason = ec.message();
        fs::remove(staging, ec);
        return core::MakeError(fmt::format("Failed to move document into place at {}: {}", path.string(), reason));
    }
    return core::Result<void>::Ok();
}

core::Result<void> ExportScene(const scene::Scene& scene,
                               const ExportOptions& options,
                               const fs::path& path,
                               int indent) {
    const document::SceneDocument doc = Serialize(scene, options);

    auto written = WriteDocument(doc, path, indent);
    if (!written) {
        RAYCAST_LOG_ERROR("Export of scene '{}' failed: {}", scene.Name, written.GetError().Message);
        return written;
    }

    RAYCAST_LOG_INFO("Scene '{}' exported to {} ({} objects, {} lights)",
                     scene.Name, path.string(), doc.Objects.size(), doc.Lights.size());
    return core::Result<void>::Ok();
}

} // namespace raycast::exporter
