// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <span>
#include <string_view>

#include "raycast/document/material.h"
#include "raycast/scene/scene.h"

namespace raycast::exporter {

/**
 * @brief One entry of the classification table
 *
 * Rules are evaluated in table order and the first whose predicate holds
 * builds the material. Both functions may throw while probing the host
 * description; the classifier treats that as "no usable material".
 */
struct ClassifierRule {
    std::string_view Name;
    bool (*Matches)(const scene::ShadingDescription& shading);
    document::Material (*Build)(const scene::ShadingDescription& shading);
};

/**
 * @brief Ordered rule table: metallic, glass_node, emission_node,
 *        blend_transparency, legacy_emission, diffuse
 *
 * The last rule always matches.
 */
std::span<const ClassifierRule> ClassifierRules();

// Material used when nothing is assigned or probing fails
document::Material FallbackMaterial();

/**
 * @brief Classify a shading description into one output material
 *
 * Total: never throws, a null description yields the fallback.
 */
document::Material ClassifyMaterial(const scene::ShadingDescription* shading);

// Classified material when materials are exported, the default material otherwise
document::Material MaterialFor(const scene::SceneObject& object, bool exportMaterials);

} // namespace raycast::exporter
