// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include "raycast/core/common.h"

namespace raycast::math {

/**
 * @brief Map a Z-up authoring vector into the Y-up target space
 *
 * (x, y, z) -> (x, z, -y). Applied exactly once to every position,
 * direction and box corner written to a document.
 */
inline Vec3 ToTargetSpace(const Vec3& v) {
    return Vec3(v.x, v.z, -v.y);
}

/**
 * @brief Translation column of a world matrix
 */
inline Vec3 WorldTranslation(const Mat4& world) {
    return Vec3(world[3]);
}

/**
 * @brief Rotation part of a world matrix with scale and shear divided out
 */
Quat WorldRotation(const Mat4& world);

/**
 * @brief Apply a full affine world matrix to a point
 */
inline Vec3 TransformPoint(const Mat4& world, const Vec3& p) {
    return Vec3(world * Vec4(p, 1.0));
}

bool IsFinite(const Vec3& v);
bool IsFinite(const Mat4& m);

} // namespace raycast::math
