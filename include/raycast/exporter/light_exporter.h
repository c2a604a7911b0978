// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <optional>

#include "raycast/document/scene_document.h"
#include "raycast/scene/scene.h"

namespace raycast::exporter {

// Host light energy units per renderer intensity unit
inline constexpr double kLightEnergyScale = 100.0;

/**
 * @brief Point and sun lights become document lights; every other kind is skipped
 *
 * Lights with a non-finite energy, color or transform are skipped as well.
 */
std::optional<document::Light> ExportLight(const scene::SceneObject& object);

} // namespace raycast::exporter
