// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "raycast/core/common.h"
#include "raycast/core/result.h"
#include "raycast/scene/mesh_data.h"
#include "raycast/scene/shading.h"

namespace raycast::scene {

enum class ObjectKind {
    Mesh,
    Light,
    Camera,
    Empty
};

enum class LightKind {
    Point,
    Sun,
    Spot,
    Area
};

struct LightData {
    LightKind Kind = LightKind::Point;
    double Energy = 10.0;         // host photometric units
    Vec3 Color = Vec3(1.0);
};

struct DofSettings {
    bool UseDof = false;
    double FStop = 2.8;
    double FocusDistance = 10.0;
};

struct CameraData {
    double Angle = 0.6911112070083618;  // radians, 50mm lens on a 36mm sensor
    DofSettings Dof{};
};

// ========================================
// SceneObject - one entry of the host object list
// ========================================
struct SceneObject {
    std::string Name;
    ObjectKind Kind = ObjectKind::Empty;

    Mat4 MatrixWorld = Mat4(1.0);  // object to world, Z-up source space
    Vec3 Scale = Vec3(1.0);        // the object's own scale property

    std::optional<MeshData> Mesh;
    std::shared_ptr<const ShadingDescription> ActiveMaterial;
    std::optional<LightData> Light;
    std::optional<CameraData> Camera;

    bool HasGeometry() const {
        return Mesh.has_value() && Mesh->HasVertices();
    }

    // Local bounds of the stored mesh; requires HasGeometry()
    BoundingBox LocalBounds() const {
        return ComputeBounds(*Mesh);
    }
};

/**
 * @brief Materializes an object's geometry with procedural modifiers baked
 *
 * Hosts with live modifier stacks provide their own evaluator. Evaluation is
 * allowed to fail; callers treat a failure as "geometry unavailable".
 */
class GeometryEvaluator {
public:
    virtual ~GeometryEvaluator() = default;
    virtual core::Result<MeshData> Evaluate(const SceneObject& object) const = 0;
};

/**
 * @brief Evaluator for snapshots whose meshes are already baked
 */
class SnapshotEvaluator : public GeometryEvaluator {
public:
    core::Result<MeshData> Evaluate(const SceneObject& object) const override;
};

struct RenderSettings {
    uint32_t ResolutionX = 1920;
    uint32_t ResolutionY = 1080;
};

// ========================================
// Scene - read-only snapshot handed to one export
// ========================================
struct Scene {
    std::string Name = "Scene";
    std::vector<SceneObject> Objects;       // host enumeration order
    std::optional<size_t> ActiveCameraIndex;
    std::optional<size_t> ActiveObjectIndex; // current selection, if any
    RenderSettings Render{};
    std::shared_ptr<const GeometryEvaluator> Evaluator = std::make_shared<SnapshotEvaluator>();

    const SceneObject* ActiveCamera() const;
    const SceneObject* ActiveObject() const;

    // Index of the first object with this exact name
    std::optional<size_t> FindObject(const std::string& name) const;
};

// Object-to-world matrix from location, XYZ euler rotation (radians) and scale
Mat4 ComposeTransform(const Vec3& location, const Vec3& rotationEuler, const Vec3& scale);

} // namespace raycast::scene
