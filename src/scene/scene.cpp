// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/scene/scene.h"

#include <fmt/format.h>
#include <glm/gtc/matrix_transform.hpp>

namespace raycast::scene {

core::Result<MeshData> SnapshotEvaluator::Evaluate(const SceneObject& object) const {
    if (!object.Mesh) {
        return core::MakeError(fmt::format("object '{}' has no mesh data", object.Name));
    }
    return *object.Mesh;
}

const SceneObject* Scene::ActiveCamera() const {
    if (!ActiveCameraIndex || *ActiveCameraIndex >= Objects.size()) {
        return nullptr;
    }
    const SceneObject& camera = Objects[*ActiveCameraIndex];
    if (camera.Kind != ObjectKind::Camera || !camera.Camera) {
        return nullptr;
    }
    return &camera;
}

const SceneObject* Scene::ActiveObject() const {
    if (!ActiveObjectIndex || *ActiveObjectIndex >= Objects.size()) {
        return nullptr;
    }
    return &Objects[*ActiveObjectIndex];
}

std::optional<size_t> Scene::FindObject(const std::string& name) const {
    for (size_t i = 0; i < Objects.size(); ++i) {
        if (Objects[i].Name == name) {
            return i;
        }
    }
    return std::nullopt;
}

Mat4 ComposeTransform(const Vec3& location, const Vec3& rotationEuler, const Vec3& scale) {
    // Rotation order X, then Y, then Z about the world axes
    Mat4 rotation(1.0);
    rotation = glm::rotate(rotation, rotationEuler.z, Vec3(0.0, 0.0, 1.0));
    rotation = glm::rotate(rotation, rotationEuler.y, Vec3(0.0, 1.0, 0.0));
    rotation = glm::rotate(rotation, rotationEuler.x, Vec3(1.0, 0.0, 0.0));

    return glm::translate(Mat4(1.0), location) * rotation * glm::scale(Mat4(1.0), scale);
}

} // namespace raycast::scene
