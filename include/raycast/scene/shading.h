// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "raycast/core/common.h"

namespace raycast::scene {

// Host node type tags the classifier looks for
namespace node_type {
inline constexpr std::string_view Glass = "BSDF_GLASS";
inline constexpr std::string_view Refraction = "BSDF_REFRACTION";
inline constexpr std::string_view Emission = "EMISSION";
inline constexpr std::string_view Principled = "BSDF_PRINCIPLED";
inline constexpr std::string_view Output = "OUTPUT_MATERIAL";
} // namespace node_type

// Unlinked default value of an input socket
using SocketValue = std::variant<double, Vec4>;

struct ShaderNode {
    std::string Name;
    std::string Type;
    std::map<std::string, SocketValue, std::less<>> Inputs;

    bool HasInput(std::string_view socket) const {
        return Inputs.find(socket) != Inputs.end();
    }

    // Both accessors throw when the socket is missing or holds the other kind of value
    double ScalarInput(std::string_view socket) const;
    Vec4 ColorInput(std::string_view socket) const;
};

struct NodeTree {
    std::vector<ShaderNode> Nodes;

    // First node, in tree order, whose type is one of `types`
    const ShaderNode* FindFirst(std::initializer_list<std::string_view> types) const;
};

enum class BlendMethod {
    Opaque,
    Clip,
    Hashed,
    Blend
};

/**
 * @brief The active material of an object as the host exposes it
 *
 * Every signal is optional: hosts fill in what their material model has.
 * Flat signals and a node graph may be present at the same time.
 */
struct ShadingDescription {
    std::string Name;

    std::optional<double> Metallic;
    std::optional<double> Roughness;
    std::optional<Vec4> DiffuseColor;

    bool UseNodes = false;
    std::optional<NodeTree> Nodes;

    std::optional<BlendMethod> Blend;

    // Legacy (pre node graph) emission settings
    std::optional<bool> UseEmission;
    std::optional<Vec3> EmissionColor;
    std::optional<double> EmissionStrength;

    bool HasNodeGraph() const {
        return UseNodes && Nodes.has_value();
    }
};

} // namespace raycast::scene
