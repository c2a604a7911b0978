// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "raycast/document/scene_document.h"
#include "raycast/scene/scene.h"

namespace raycast::exporter {

// Distance along the view direction at which the look-at point is placed.
// Also the focus distance when nothing better is known.
inline constexpr double kLookAtDistance = 10.0;

// Maps the host f-stop range onto the renderer's aperture scale
inline constexpr double kFStopNormalization = 16.0;

/**
 * @brief Camera used when the scene has no active camera
 */
document::Camera DefaultCamera(const scene::RenderSettings& render);

/**
 * @brief Derive renderer camera parameters
 *
 * @param camera Active camera object, or nullptr
 * @param render Output resolution
 * @param activeObject Currently selected object, or nullptr; used to guess a
 *        focus distance when depth of field is off
 */
document::Camera DeriveCamera(const scene::SceneObject* camera,
                              const scene::RenderSettings& render,
                              const scene::SceneObject* activeObject);

} // namespace raycast::exporter
