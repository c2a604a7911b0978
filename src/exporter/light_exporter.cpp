// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/exporter/light_exporter.h"
#include "raycast/math/coords.h"
#include "raycast/core/log.h"

#include <cmath>

namespace raycast::exporter {

std::optional<document::Light> ExportLight(const scene::SceneObject& object) {
    if (!object.Light) {
        RAYCAST_LOG_DEBUG("Skipping light '{}': no light data", object.Name);
        return std::nullopt;
    }

    const scene::LightData& light = *object.Light;
    const double intensity = light.Energy / kLightEnergyScale;

    if (!std::isfinite(intensity) || !math::IsFinite(light.Color) || !math::IsFinite(object.MatrixWorld)) {
        RAYCAST_LOG_WARN("Skipping light '{}': non-finite energy, color or transform", object.Name);
        return std::nullopt;
    }

    switch (light.Kind) {
        case scene::LightKind::Point:
            return document::PointLight{
                math::ToTargetSpace(math::WorldTranslation(object.MatrixWorld)),
                light.Color,
                intensity,
            };

        case scene::LightKind::Sun: {
            const Vec3 direction = glm::normalize(math::WorldRotation(object.MatrixWorld) * Vec3(0.0, 0.0, -1.0));
            if (!math::IsFinite(direction)) {
                RAYCAST_LOG_WARN("Skipping light '{}': degenerate rotation", object.Name);
                return std::nullopt;
            }
            return document::DirectionalLight{
                math::ToTargetSpace(direction),
                light.Color,
                intensity,
            };
        }

        case scene::LightKind::Spot:
        case scene::LightKind::Area:
            break;
    }

    RAYCAST_LOG_DEBUG("Skipping light '{}': unsupported light type", object.Name);
    return std::nullopt;
}

} // namespace raycast::exporter
