// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/exporter/geometry_resolver.h"
#include "raycast/exporter/material_classifier.h"
#include "raycast/math/coords.h"
#include "raycast/core/log.h"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/format.h>

namespace raycast::exporter {

core::Result<std::vector<uint32_t>> FanTriangulate(const scene::MeshData& mesh) {
    std::vector<uint32_t> indices;
    const size_t vertexCount = mesh.VertexCount();

    for (size_t face = 0; face < mesh.Polygons.size(); ++face) {
        const auto& polygon = mesh.Polygons[face];
        for (uint32_t vertex : polygon) {
            if (vertex >= vertexCount) {
                return core::MakeError(fmt::format(
                    "polygon {} references vertex {} but the mesh has {} vertices", face, vertex, vertexCount));
            }
        }
        for (size_t i = 2; i < polygon.size(); ++i) {
            indices.push_back(polygon[0]);
            indices.push_back(polygon[i - 1]);
            indices.push_back(polygon[i]);
        }
    }
    return indices;
}

bool IsSphereName(std::string_view name) {
    constexpr std::string_view kNeedle = "sphere";
    auto it = std::search(name.begin(), name.end(), kNeedle.begin(), kNeedle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    return it != name.end();
}

GeometryResolver::GeometryResolver(const ExportOptions& options, const scene::GeometryEvaluator& evaluator)
    : options_(options), evaluator_(evaluator) {}

std::optional<document::Primitive> GeometryResolver::Resolve(const scene::SceneObject& object) const {
    if (!object.HasGeometry()) {
        RAYCAST_LOG_DEBUG("Skipping '{}': no mesh data", object.Name);
        return std::nullopt;
    }
    if (!math::IsFinite(object.MatrixWorld)) {
        RAYCAST_LOG_WARN("Skipping '{}': non-finite world transform", object.Name);
        return std::nullopt;
    }

    const document::Material material = MaterialFor(object, options_.ExportMaterials);

    ResolveStage stage = ResolveStage::TrySphere;
    for (;;) {
        switch (stage) {
            case ResolveStage::TrySphere:
                if (IsSphereName(object.Name)) {
                    if (std::isfinite(object.Scale.x)) {
                        return MakeSphere(object, material);
                    }
                    RAYCAST_LOG_WARN("Sphere '{}' has a non-finite scale, exporting its mesh instead", object.Name);
                }
                stage = ResolveStage::TryMesh;
                break;

            case ResolveStage::TryMesh: {
                auto mesh = ExtractMesh(object, material);
                if (mesh) {
                    return std::move(mesh).Value();
                }
                RAYCAST_LOG_WARN("Error exporting mesh '{}': {}. Falling back to box approximation.",
                                 object.Name, mesh.GetError().Message);
                stage = ResolveStage::UseBox;
                break;
            }

            case ResolveStage::UseBox:
                return MakeBox(object, material);
        }
    }
}

document::SpherePrimitive GeometryResolver::MakeSphere(const scene::SceneObject& object,
                                                       document::Material material) const {
    document::SpherePrimitive sphere;
    sphere.Name = object.Name;
    sphere.Center = math::ToTargetSpace(math::WorldTranslation(object.MatrixWorld));
    // Non-uniform scale is not reconciled: Y and Z are ignored
    sphere.Radius = object.Scale.x;
    sphere.Mat = std::move(material);
    return sphere;
}

core::Result<scene::MeshData> GeometryResolver::EvaluateGeometry(const scene::SceneObject& object) const {
    try {
        return evaluator_.Evaluate(object);
    } catch (const std::exception& err) {
        return core::MakeError(fmt::format("geometry evaluation threw: {}", err.what()));
    }
}

core::Result<document::MeshPrimitive> GeometryResolver::ExtractMesh(const scene::SceneObject& object,
                                                                    document::Material material) const {
    auto evaluated = EvaluateGeometry(object);
    if (!evaluated) {
        return std::move(evaluated).GetError();
    }
    const scene::MeshData& mesh = evaluated.Value();

    auto indices = FanTriangulate(mesh);
    if (!indices) {
        return std::move(indices).GetError();
    }

    document::MeshPrimitive primitive;
    primitive.Name = object.Name;
    primitive.Vertices.reserve(mesh.VertexCount());
    for (const auto& position : mesh.Positions) {
        const Vec3 world = math::TransformPoint(object.MatrixWorld, position);
        if (!math::IsFinite(world)) {
            return core::MakeError("world transform produced a non-finite vertex");
        }
        primitive.Vertices.push_back(math::ToTargetSpace(world));
    }
    primitive.Indices = std::move(indices).Value();

    if (primitive.Vertices.empty() || primitive.Indices.empty()) {
        return core::MakeError(fmt::format("no triangles ({} vertices, {} polygons)",
                                           mesh.VertexCount(), mesh.PolygonCount()));
    }

    primitive.Mat = std::move(material);
    return primitive;
}

document::BoxPrimitive GeometryResolver::MakeBox(const scene::SceneObject& object,
                                                 document::Material material) const {
    const scene::BoundingBox bounds = object.LocalBounds();
    const Vec3 a = math::ToTargetSpace(math::TransformPoint(object.MatrixWorld, bounds.Min));
    const Vec3 b = math::ToTargetSpace(math::TransformPoint(object.MatrixWorld, bounds.Max));

    document::BoxPrimitive box;
    box.Name = object.Name;
    if (math::IsFinite(a) && math::IsFinite(b)) {
        // The axis flip and any world rotation can swap corner components
        box.Min = glm::min(a, b);
        box.Max = glm::max(a, b);
    } else {
        RAYCAST_LOG_WARN("Bounds of '{}' are not finite, exporting a point box at its origin", object.Name);
        box.Min = box.Max = math::ToTargetSpace(math::WorldTranslation(object.MatrixWorld));
    }
    box.Mat = std::move(material);
    return box;
}

} // namespace raycast::exporter
