// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/exporter/material_classifier.h"
#include "raycast/math/coords.h"
#include "raycast/core/log.h"

#include <array>
#include <cmath>
#include <variant>

namespace raycast::exporter {

namespace {

using scene::BlendMethod;
using scene::ShaderNode;
using scene::ShadingDescription;

constexpr double kMetallicThreshold = 0.5;
constexpr double kDefaultMetalRoughness = 0.1;

Vec3 DiffuseOrGray(const ShadingDescription& shading) {
    if (shading.DiffuseColor) {
        return Vec3(*shading.DiffuseColor);
    }
    return Vec3(document::kDefaultGray);
}

const ShaderNode* FindGlassNode(const ShadingDescription& shading) {
    if (!shading.HasNodeGraph()) {
        return nullptr;
    }
    return shading.Nodes->FindFirst({scene::node_type::Glass, scene::node_type::Refraction});
}

const ShaderNode* FindEmissionNode(const ShadingDescription& shading) {
    if (!shading.HasNodeGraph()) {
        return nullptr;
    }
    return shading.Nodes->FindFirst({scene::node_type::Emission});
}

// metallic
bool IsMetallic(const ShadingDescription& shading) {
    return shading.Metallic && *shading.Metallic > kMetallicThreshold;
}

document::Material BuildMetal(const ShadingDescription& shading) {
    return document::MetalMaterial{DiffuseOrGray(shading), shading.Roughness.value_or(kDefaultMetalRoughness)};
}

// glass_node
bool HasGlassNode(const ShadingDescription& shading) {
    return FindGlassNode(shading) != nullptr;
}

document::Material BuildGlass(const ShadingDescription& shading) {
    const ShaderNode& node = *FindGlassNode(shading);
    document::DielectricMaterial glass;
    if (node.HasInput("IOR")) {
        glass.Ior = node.ScalarInput("IOR");
    }
    return glass;
}

// emission_node
bool HasEmissionNode(const ShadingDescription& shading) {
    return FindEmissionNode(shading) != nullptr;
}

document::Material BuildNodeEmission(const ShadingDescription& shading) {
    const ShaderNode& node = *FindEmissionNode(shading);
    document::EmissiveMaterial emissive;
    if (node.HasInput("Color")) {
        emissive.Color = Vec3(node.ColorInput("Color"));
    }
    if (node.HasInput("Strength")) {
        emissive.Intensity = node.ScalarInput("Strength");
    }
    return emissive;
}

// blend_transparency
bool IsAlphaBlended(const ShadingDescription& shading) {
    if (!shading.Blend) {
        return false;
    }
    switch (*shading.Blend) {
        case BlendMethod::Blend:
        case BlendMethod::Hashed:
        case BlendMethod::Clip:
            return true;
        case BlendMethod::Opaque:
            return false;
    }
    return false;
}

document::Material BuildBlendGlass(const ShadingDescription&) {
    // The blend mode says "see-through" but carries no refraction index
    return document::DielectricMaterial{document::kDefaultIor};
}

// legacy_emission
bool UsesLegacyEmission(const ShadingDescription& shading) {
    return shading.UseEmission.value_or(false);
}

document::Material BuildLegacyEmission(const ShadingDescription& shading) {
    return document::EmissiveMaterial{shading.EmissionColor.value_or(Vec3(1.0)),
                                      shading.EmissionStrength.value_or(1.0)};
}

// diffuse
bool Always(const ShadingDescription&) {
    return true;
}

document::Material BuildDiffuse(const ShadingDescription& shading) {
    return document::LambertianMaterial{DiffuseOrGray(shading)};
}

// Host values land in the document verbatim and JSON has no inf or nan
bool HasFiniteValues(const document::LambertianMaterial& m) { return math::IsFinite(m.Color); }
bool HasFiniteValues(const document::MetalMaterial& m) { return math::IsFinite(m.Color) && std::isfinite(m.Roughness); }
bool HasFiniteValues(const document::DielectricMaterial& m) { return std::isfinite(m.Ior); }
bool HasFiniteValues(const document::EmissiveMaterial& m) { return math::IsFinite(m.Color) && std::isfinite(m.Intensity); }
bool HasFiniteValues(const document::DefaultMaterial&) { return true; }

const std::array<ClassifierRule, 6> kRules = {{
    {"metallic", IsMetallic, BuildMetal},
    {"glass_node", HasGlassNode, BuildGlass},
    {"emission_node", HasEmissionNode, BuildNodeEmission},
    {"blend_transparency", IsAlphaBlended, BuildBlendGlass},
    {"legacy_emission", UsesLegacyEmission, BuildLegacyEmission},
    {"diffuse", Always, BuildDiffuse},
}};

} // namespace

std::span<const ClassifierRule> ClassifierRules() {
    return kRules;
}

document::Material FallbackMaterial() {
    return document::LambertianMaterial{Vec3(document::kDefaultGray)};
}

document::Material ClassifyMaterial(const scene::ShadingDescription* shading) {
    if (!shading) {
        return FallbackMaterial();
    }

    try {
        for (const auto& rule : kRules) {
            if (rule.Matches(*shading)) {
                RAYCAST_LOG_TRACE("Material '{}' classified by rule '{}'", shading->Name, rule.Name);
                document::Material material = rule.Build(*shading);
                if (!std::visit([](const auto& m) { return HasFiniteValues(m); }, material)) {
                    RAYCAST_LOG_WARN("Material '{}' has non-finite values. Using default diffuse.", shading->Name);
                    break;
                }
                return material;
            }
        }
    } catch (const std::exception& err) {
        RAYCAST_LOG_WARN("Error exporting material '{}': {}. Using default diffuse.", shading->Name, err.what());
    }
    return FallbackMaterial();
}

document::Material MaterialFor(const scene::SceneObject& object, bool exportMaterials) {
    if (!exportMaterials) {
        return document::DefaultMaterial{};
    }
    return ClassifyMaterial(object.ActiveMaterial.get());
}

} // namespace raycast::exporter
