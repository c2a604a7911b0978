// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace raycast
{

// Everything that ends up in an exported document is double precision.
using Vec3 = glm::dvec3;
using Vec4 = glm::dvec4;
using Mat3 = glm::dmat3;
using Mat4 = glm::dmat4;
using Quat = glm::dquat;

} // namespace raycast
