// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/scene/mesh_data.h"

namespace raycast::scene {

BoundingBox ComputeBounds(const MeshData& mesh) {
    BoundingBox bounds;
    if (mesh.Positions.empty()) {
        return bounds;
    }

    bounds.Min = mesh.Positions.front();
    bounds.Max = mesh.Positions.front();
    for (const auto& p : mesh.Positions) {
        bounds.Min = glm::min(bounds.Min, p);
        bounds.Max = glm::max(bounds.Max, p);
    }
    return bounds;
}

} // namespace raycast::scene
