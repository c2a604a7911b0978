// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/document/scene_document.h"

namespace raycast::document {

namespace {

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

std::string_view MaterialTypeName(const Material& material) {
    return std::visit(Overloaded{
        [](const LambertianMaterial&) -> std::string_view { return "lambertian"; },
        [](const MetalMaterial&) -> std::string_view { return "metal"; },
        [](const DielectricMaterial&) -> std::string_view { return "dielectric"; },
        [](const EmissiveMaterial&) -> std::string_view { return "emissive"; },
        [](const DefaultMaterial&) -> std::string_view { return "default"; },
    }, material);
}

std::string_view PrimitiveTypeName(const Primitive& primitive) {
    return std::visit(Overloaded{
        [](const SpherePrimitive&) -> std::string_view { return "sphere"; },
        [](const MeshPrimitive&) -> std::string_view { return "mesh"; },
        [](const BoxPrimitive&) -> std::string_view { return "box"; },
    }, primitive);
}

const std::string& PrimitiveName(const Primitive& primitive) {
    return std::visit([](const auto& p) -> const std::string& { return p.Name; }, primitive);
}

const Material& PrimitiveMaterial(const Primitive& primitive) {
    return std::visit([](const auto& p) -> const Material& { return p.Mat; }, primitive);
}

std::string_view LightTypeName(const Light& light) {
    return std::holds_alternative<PointLight>(light) ? "point" : "directional";
}

} // namespace raycast::document
