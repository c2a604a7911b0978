// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/exporter/camera_deriver.h"
#include "raycast/math/coords.h"
#include "raycast/core/log.h"

#include <cmath>

namespace raycast::exporter {

namespace {

double AspectRatio(const scene::RenderSettings& render) {
    if (render.ResolutionY == 0) {
        RAYCAST_LOG_WARN("Render resolution {}x{} has no height, using aspect 1.0",
                         render.ResolutionX, render.ResolutionY);
        return 1.0;
    }
    return static_cast<double>(render.ResolutionX) / static_cast<double>(render.ResolutionY);
}

} // namespace

document::Camera DefaultCamera(const scene::RenderSettings& render) {
    document::Camera camera;
    camera.Position = Vec3(0.0, 0.0, 5.0);
    camera.LookAt = Vec3(0.0);
    camera.Up = Vec3(0.0, 1.0, 0.0);
    camera.Fov = 45.0;
    camera.Aspect = AspectRatio(render);
    camera.Resolution = {render.ResolutionX, render.ResolutionY};
    camera.Aperture = 0.0;
    camera.FocusDist = kLookAtDistance;
    camera.Type = "perspective";
    return camera;
}

document::Camera DeriveCamera(const scene::SceneObject* camera,
                              const scene::RenderSettings& render,
                              const scene::SceneObject* activeObject) {
    if (!camera || !camera->Camera) {
        RAYCAST_LOG_DEBUG("No active camera, using the default camera");
        return DefaultCamera(render);
    }

    if (!math::IsFinite(camera->MatrixWorld)) {
        RAYCAST_LOG_WARN("Camera '{}' has a non-finite transform, using the default camera", camera->Name);
        return DefaultCamera(render);
    }

    const scene::CameraData& lens = *camera->Camera;
    const Vec3 position = math::WorldTranslation(camera->MatrixWorld);
    const Quat rotation = math::WorldRotation(camera->MatrixWorld);

    // Cameras look down local -Z with local +Y up
    const Vec3 forward = glm::normalize(rotation * Vec3(0.0, 0.0, -1.0));
    const Vec3 up = glm::normalize(rotation * Vec3(0.0, 1.0, 0.0));
    if (!math::IsFinite(forward) || !math::IsFinite(up)) {
        RAYCAST_LOG_WARN("Camera '{}' has a degenerate rotation, using the default camera", camera->Name);
        return DefaultCamera(render);
    }

    document::Camera result;
    result.Position = math::ToTargetSpace(position);
    result.LookAt = math::ToTargetSpace(position + forward * kLookAtDistance);
    result.Up = math::ToTargetSpace(up);
    result.Fov = glm::degrees(lens.Angle);
    if (!std::isfinite(result.Fov)) {
        RAYCAST_LOG_WARN("Camera '{}' has a non-finite angle, using the default lens", camera->Name);
        result.Fov = glm::degrees(scene::CameraData{}.Angle);
    }
    result.Aspect = AspectRatio(render);
    result.Resolution = {render.ResolutionX, render.ResolutionY};
    result.Type = "perspective";

    result.Aperture = 0.0;
    result.FocusDist = kLookAtDistance;
    if (lens.Dof.UseDof) {
        if (std::isfinite(lens.Dof.FStop) && std::isfinite(lens.Dof.FocusDistance)) {
            result.Aperture = lens.Dof.FStop / kFStopNormalization;
            result.FocusDist = lens.Dof.FocusDistance;
        } else {
            RAYCAST_LOG_WARN("Camera '{}' has non-finite depth of field settings, disabling them", camera->Name);
        }
    } else if (activeObject && activeObject != camera) {
        const double distance = glm::distance(position, math::WorldTranslation(activeObject->MatrixWorld));
        if (std::isfinite(distance)) {
            result.FocusDist = distance;
        }
    }

    return result;
}

} // namespace raycast::exporter
