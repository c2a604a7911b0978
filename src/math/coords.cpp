// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/math/coords.h"

#include <cmath>

#include <glm/gtc/quaternion.hpp>

namespace raycast::math {

Quat WorldRotation(const Mat4& world) {
    Mat3 basis(world);
    for (int axis = 0; axis < 3; ++axis) {
        const double len = glm::length(basis[axis]);
        if (len > 0.0) {
            basis[axis] /= len;
        }
    }
    return glm::normalize(glm::quat_cast(basis));
}

bool IsFinite(const Vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

bool IsFinite(const Mat4& m) {
    for (int column = 0; column < 4; ++column) {
        for (int row = 0; row < 4; ++row) {
            if (!std::isfinite(m[column][row])) {
                return false;
            }
        }
    }
    return true;
}

} // namespace raycast::math
