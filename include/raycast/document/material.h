// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <string_view>
#include <variant>

#include "raycast/core/common.h"

namespace raycast::document {

inline constexpr double kDefaultGray = 0.8;
inline constexpr double kDefaultIor = 1.5;

struct LambertianMaterial {
    Vec3 Color = Vec3(kDefaultGray);
};

struct MetalMaterial {
    Vec3 Color = Vec3(kDefaultGray);
    double Roughness = 0.1;
};

struct DielectricMaterial {
    double Ior = kDefaultIor;
};

struct EmissiveMaterial {
    Vec3 Color = Vec3(1.0);
    double Intensity = 1.0;
};

// Renderer-side gray diffuse; written without fields
struct DefaultMaterial {};

using Material = std::variant<LambertianMaterial, MetalMaterial, DielectricMaterial, EmissiveMaterial, DefaultMaterial>;

// "lambertian", "metal", "dielectric", "emissive" or "default"
std::string_view MaterialTypeName(const Material& material);

} // namespace raycast::document
