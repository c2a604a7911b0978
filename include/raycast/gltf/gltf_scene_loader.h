// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "raycast/core/common.h"
#include "raycast/core/result.h"
#include "raycast/scene/scene.h"

namespace raycast::gltf {

// glTF watts-to-lumens constant used for light units
inline constexpr double kWattsToLumens = 683.0;

// Horizontal angle given to orthographic cameras (50mm lens, 36mm sensor)
inline constexpr double kDefaultCameraAngle = 0.6911112070083618;

struct GltfLoadOptions {
    scene::RenderSettings Render{};
    std::optional<std::string> ActiveObject;  // name of the object treated as selected
};

/**
 * @brief Rebase a Y-up glTF world matrix into the Z-up source convention
 *
 * (x, y, z) -> (x, -z, y); the exporter's conversion undoes it.
 */
Mat4 GltfToSourceSpace();

/**
 * @brief Build a scene snapshot from a .gltf or .glb file
 *
 * Nodes of the default scene are visited depth-first in document order and
 * become mesh, camera, light or empty objects.
 */
core::Result<scene::Scene> LoadGltfScene(const std::filesystem::path& path,
                                         const GltfLoadOptions& options = {});

} // namespace raycast::gltf
