// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/scene/shading.h"
#include "raycast/core/error.h"

#include <fmt/format.h>

namespace raycast::scene {

namespace {

const SocketValue& FindSocket(const ShaderNode& node, std::string_view socket) {
    auto it = node.Inputs.find(socket);
    if (it == node.Inputs.end()) {
        throw SceneError(fmt::format("node '{}' has no input '{}'", node.Name, socket));
    }
    return it->second;
}

} // namespace

double ShaderNode::ScalarInput(std::string_view socket) const {
    return std::get<double>(FindSocket(*this, socket));
}

Vec4 ShaderNode::ColorInput(std::string_view socket) const {
    return std::get<Vec4>(FindSocket(*this, socket));
}

const ShaderNode* NodeTree::FindFirst(std::initializer_list<std::string_view> types) const {
    for (const auto& node : Nodes) {
        for (auto type : types) {
            if (node.Type == type) {
                return &node;
            }
        }
    }
    return nullptr;
}

} // namespace raycast::scene
