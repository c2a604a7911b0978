// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <vector>
#include <cstdint>

#include "raycast/core/common.h"

namespace raycast::scene {

// ========================================
// MeshData - authoring mesh in object-local space
// ========================================
struct MeshData {
    std::vector<Vec3> Positions;                 // local-space vertex positions
    std::vector<std::vector<uint32_t>> Polygons; // vertex indices per face, any arity

    bool HasVertices() const {
        return !Positions.empty();
    }

    size_t VertexCount() const {
        return Positions.size();
    }

    size_t PolygonCount() const {
        return Polygons.size();
    }
};

// ========================================
// BoundingBox - local axis-aligned bounds
// ========================================
struct BoundingBox {
    Vec3 Min = Vec3(0.0);
    Vec3 Max = Vec3(0.0);
};

// Bounds of every position; a zero box for an empty mesh
BoundingBox ComputeBounds(const MeshData& mesh);

} // namespace raycast::scene
