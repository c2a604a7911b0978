// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "raycast/core/result.h"
#include "raycast/document/scene_document.h"
#include "raycast/exporter/export_options.h"
#include "raycast/scene/scene.h"

namespace raycast::exporter {

/**
 * @brief States of the per-object fallback chain
 */
enum class ResolveStage {
    TrySphere,
    TryMesh,
    UseBox
};

/**
 * @brief Fan triangulation of every polygon: [0, i-1, i] for i in [2, n)
 *
 * Fails when a polygon references a vertex that does not exist.
 */
core::Result<std::vector<uint32_t>> FanTriangulate(const scene::MeshData& mesh);

// Case-insensitive "sphere" anywhere in the name
bool IsSphereName(std::string_view name);

/**
 * @brief Turns one mesh object into exactly one output primitive
 *
 * TrySphere -> TryMesh -> UseBox. The box stage always succeeds, so the only
 * empty results are an object with no geometry and one whose world transform
 * is not finite. Non-finite bounds collapse the box onto the object origin.
 */
class GeometryResolver {
public:
    GeometryResolver(const ExportOptions& options, const scene::GeometryEvaluator& evaluator);

    std::optional<document::Primitive> Resolve(const scene::SceneObject& object) const;

    document::SpherePrimitive MakeSphere(const scene::SceneObject& object, document::Material material) const;
    core::Result<document::MeshPrimitive> ExtractMesh(const scene::SceneObject& object, document::Material material) const;
    document::BoxPrimitive MakeBox(const scene::SceneObject& object, document::Material material) const;

private:
    core::Result<scene::MeshData> EvaluateGeometry(const scene::SceneObject& object) const;

    const ExportOptions& options_;
    const scene::GeometryEvaluator& evaluator_;
};

} // namespace raycast::exporter
