// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "raycast/core/common.h"
#include "raycast/document/material.h"

namespace raycast::document {

// ========================================
// Primitives
// ========================================
struct SpherePrimitive {
    std::string Name;
    Vec3 Center = Vec3(0.0);
    double Radius = 1.0;
    Material Mat = DefaultMaterial{};
};

struct MeshPrimitive {
    std::string Name;
    std::vector<Vec3> Vertices;
    std::vector<uint32_t> Indices;  // 3 per triangle, each < Vertices.size()
    Material Mat = DefaultMaterial{};

    size_t TriangleCount() const {
        return Indices.size() / 3;
    }
};

struct BoxPrimitive {
    std::string Name;
    Vec3 Min = Vec3(0.0);
    Vec3 Max = Vec3(0.0);
    Material Mat = DefaultMaterial{};
};

using Primitive = std::variant<SpherePrimitive, MeshPrimitive, BoxPrimitive>;

std::string_view PrimitiveTypeName(const Primitive& primitive);
const std::string& PrimitiveName(const Primitive& primitive);
const Material& PrimitiveMaterial(const Primitive& primitive);

// ========================================
// Lights
// ========================================
struct PointLight {
    Vec3 Position = Vec3(0.0);
    Vec3 Color = Vec3(1.0);
    double Intensity = 1.0;
};

struct DirectionalLight {
    Vec3 Direction = Vec3(0.0, -1.0, 0.0);  // unit length
    Vec3 Color = Vec3(1.0);
    double Intensity = 1.0;
};

using Light = std::variant<PointLight, DirectionalLight>;

std::string_view LightTypeName(const Light& light);

// ========================================
// Camera
// ========================================
struct Camera {
    Vec3 Position = Vec3(0.0, 0.0, 5.0);
    Vec3 LookAt = Vec3(0.0);
    Vec3 Up = Vec3(0.0, 1.0, 0.0);
    double Fov = 45.0;        // degrees
    double Aspect = 1.0;      // width / height
    std::array<uint32_t, 2> Resolution{0, 0};
    double Aperture = 0.0;
    double FocusDist = 10.0;
    std::string Type = "perspective";
};

struct Background {
    std::string Type = "gradient";
    double Intensity = 1.0;
};

// ========================================
// SceneDocument - everything one export writes
// ========================================
struct SceneDocument {
    std::string Name;
    std::vector<Primitive> Objects;
    std::vector<Light> Lights;
    Camera Cam{};
    Background Bg{};
};

} // namespace raycast::document
