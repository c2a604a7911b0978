// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/gltf/gltf_scene_loader.h"
#include "raycast/core/error.h"
#include "raycast/core/log.h"

#include <nlohmann/json.hpp>

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_EXTERNAL_IMAGE
#define TINYGLTF_NO_INCLUDE_JSON
#include <tiny_gltf.h>

#include <cmath>
#include <cstring>
#include <unordered_map>

#include <fmt/format.h>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>
#include <glm/gtc/constants.hpp>

namespace raycast::gltf {

namespace {

constexpr int kMaxNodeDepth = 256;

// Textures are not exported; accept every image without decoding it
bool SkipImageData(tinygltf::Image*, const int, std::string*, std::string*,
                   int, int, const unsigned char*, int, void*) {
    return true;
}

Vec3 ToVec3(const std::vector<double>& values, const Vec3& fallback) {
    if (values.size() < 3) {
        return fallback;
    }
    return Vec3(values[0], values[1], values[2]);
}

double ExtensionNumber(const tinygltf::ExtensionMap& extensions, const char* extension,
                       const char* key, double fallback) {
    auto it = extensions.find(extension);
    if (it == extensions.end() || !it->second.Has(key)) {
        return fallback;
    }
    const tinygltf::Value& value = it->second.Get(key);
    return value.IsNumber() || value.IsInt() ? value.GetNumberAsDouble() : fallback;
}

Mat4 LocalMatrix(const tinygltf::Node& node) {
    if (node.matrix.size() == 16) {
        return glm::make_mat4(node.matrix.data());
    }

    Mat4 translation(1.0);
    Mat4 rotation(1.0);
    Mat4 scale(1.0);
    if (node.translation.size() == 3) {
        translation = glm::translate(Mat4(1.0), ToVec3(node.translation, Vec3(0.0)));
    }
    if (node.rotation.size() == 4) {
        // glTF stores x, y, z, w
        rotation = glm::mat4_cast(Quat(node.rotation[3], node.rotation[0], node.rotation[1], node.rotation[2]));
    }
    if (node.scale.size() == 3) {
        scale = glm::scale(Mat4(1.0), ToVec3(node.scale, Vec3(1.0)));
    }
    return translation * rotation * scale;
}

Vec3 LocalScale(const tinygltf::Node& node) {
    if (node.matrix.size() == 16) {
        const Mat4 m = glm::make_mat4(node.matrix.data());
        return Vec3(glm::length(Vec3(m[0])), glm::length(Vec3(m[1])), glm::length(Vec3(m[2])));
    }
    return ToVec3(node.scale, Vec3(1.0));
}

// ========================================
// Accessor reading - throws SceneError on malformed data
// ========================================

struct AccessorView {
    const unsigned char* Data = nullptr;
    size_t Stride = 0;
    size_t Count = 0;
};

AccessorView ViewAccessor(const tinygltf::Model& model, int accessorIndex, size_t elementSize) {
    if (accessorIndex < 0 || static_cast<size_t>(accessorIndex) >= model.accessors.size()) {
        throw SceneError(fmt::format("accessor {} does not exist", accessorIndex));
    }
    const tinygltf::Accessor& accessor = model.accessors[accessorIndex];
    if (accessor.sparse.isSparse) {
        throw SceneError(fmt::format("accessor {} is sparse, which is not supported", accessorIndex));
    }
    if (accessor.bufferView < 0 || static_cast<size_t>(accessor.bufferView) >= model.bufferViews.size()) {
        throw SceneError(fmt::format("accessor {} has no buffer view", accessorIndex));
    }
    const tinygltf::BufferView& view = model.bufferViews[accessor.bufferView];
    if (view.buffer < 0 || static_cast<size_t>(view.buffer) >= model.buffers.size()) {
        throw SceneError(fmt::format("buffer view {} references a missing buffer", accessor.bufferView));
    }
    const tinygltf::Buffer& buffer = model.buffers[view.buffer];

    AccessorView result;
    result.Stride = view.byteStride != 0 ? view.byteStride : elementSize;
    result.Count = accessor.count;

    const size_t begin = view.byteOffset + accessor.byteOffset;
    const size_t span = accessor.count == 0 ? 0 : (accessor.count - 1) * result.Stride + elementSize;
    if (begin + span > buffer.data.size() || accessor.byteOffset + span > view.byteLength) {
        throw SceneError(fmt::format("accessor {} reads past the end of its buffer", accessorIndex));
    }
    result.Data = buffer.data.data() + begin;
    return result;
}

std::vector<Vec3> ReadPositions(const tinygltf::Model& model, int accessorIndex) {
    const tinygltf::Accessor& accessor = model.accessors.at(accessorIndex);
    if (accessor.componentType != TINYGLTF_COMPONENT_TYPE_FLOAT || accessor.type != TINYGLTF_TYPE_VEC3) {
        throw SceneError(fmt::format("POSITION accessor {} is not float VEC3", accessorIndex));
    }

    const AccessorView view = ViewAccessor(model, accessorIndex, 3 * sizeof(float));
    std::vector<Vec3> positions;
    positions.reserve(view.Count);
    for (size_t i = 0; i < view.Count; ++i) {
        float xyz[3];
        std::memcpy(xyz, view.Data + i * view.Stride, sizeof(xyz));
        positions.emplace_back(xyz[0], xyz[1], xyz[2]);
    }
    return positions;
}

std::vector<uint32_t> ReadIndices(const tinygltf::Model& model, int accessorIndex) {
    const tinygltf::Accessor& accessor = model.accessors.at(accessorIndex);
    if (accessor.type != TINYGLTF_TYPE_SCALAR) {
        throw SceneError(fmt::format("index accessor {} is not SCALAR", accessorIndex));
    }

    size_t componentSize = 0;
    switch (accessor.componentType) {
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE: componentSize = 1; break;
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT: componentSize = 2; break;
        case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT: componentSize = 4; break;
        default:
            throw SceneError(fmt::format("index accessor {} has unsupported component type {}",
                                         accessorIndex, accessor.componentType));
    }

    const AccessorView view = ViewAccessor(model, accessorIndex, componentSize);
    std::vector<uint32_t> indices;
    indices.reserve(view.Count);
    for (size_t i = 0; i < view.Count; ++i) {
        const unsigned char* element = view.Data + i * view.Stride;
        if (componentSize == 1) {
            indices.push_back(element[0]);
        } else if (componentSize == 2) {
            uint16_t value;
            std::memcpy(&value, element, sizeof(value));
            indices.push_back(value);
        } else {
            uint32_t value;
            std::memcpy(&value, element, sizeof(value));
            indices.push_back(value);
        }
    }
    return indices;
}

// ========================================
// Material -> shading description
// ========================================

std::shared_ptr<const scene::ShadingDescription> ConvertMaterial(const tinygltf::Material& material) {
    auto shading = std::make_shared<scene::ShadingDescription>();
    shading->Name = material.name;

    const auto& pbr = material.pbrMetallicRoughness;
    shading->Metallic = pbr.metallicFactor;
    shading->Roughness = pbr.roughnessFactor;
    if (pbr.baseColorFactor.size() == 4) {
        shading->DiffuseColor = Vec4(pbr.baseColorFactor[0], pbr.baseColorFactor[1],
                                     pbr.baseColorFactor[2], pbr.baseColorFactor[3]);
    }

    if (material.alphaMode == "BLEND") {
        shading->Blend = scene::BlendMethod::Blend;
    } else if (material.alphaMode == "MASK") {
        shading->Blend = scene::BlendMethod::Clip;
    } else {
        shading->Blend = scene::BlendMethod::Opaque;
    }

    scene::NodeTree tree;

    scene::ShaderNode principled;
    principled.Name = "Principled BSDF";
    principled.Type = std::string(scene::node_type::Principled);
    principled.Inputs["Metallic"] = pbr.metallicFactor;
    principled.Inputs["Roughness"] = pbr.roughnessFactor;
    if (shading->DiffuseColor) {
        principled.Inputs["Base Color"] = *shading->DiffuseColor;
    }
    tree.Nodes.push_back(std::move(principled));

    const double transmission =
        ExtensionNumber(material.extensions, "KHR_materials_transmission", "transmissionFactor", 0.0);
    if (transmission > 0.0) {
        scene::ShaderNode glass;
        glass.Name = "Glass BSDF";
        glass.Type = std::string(scene::node_type::Glass);
        glass.Inputs["IOR"] = ExtensionNumber(material.extensions, "KHR_materials_ior", "ior", 1.5);
        tree.Nodes.push_back(std::move(glass));
    }

    const Vec3 emissive = ToVec3(material.emissiveFactor, Vec3(0.0));
    if (emissive != Vec3(0.0)) {
        scene::ShaderNode emission;
        emission.Name = "Emission";
        emission.Type = std::string(scene::node_type::Emission);
        emission.Inputs["Color"] = Vec4(emissive, 1.0);
        emission.Inputs["Strength"] =
            ExtensionNumber(material.extensions, "KHR_materials_emissive_strength", "emissiveStrength", 1.0);
        tree.Nodes.push_back(std::move(emission));
    }

    shading->UseNodes = true;
    shading->Nodes = std::move(tree);
    return shading;
}

// ========================================
// Node traversal
// ========================================

class SnapshotBuilder {
public:
    SnapshotBuilder(const tinygltf::Model& model, scene::Scene& scene)
        : model_(model), scene_(scene) {}

    void VisitNode(int nodeIndex, const Mat4& parentWorld, int depth) {
        if (depth > kMaxNodeDepth) {
            throw SceneError(fmt::format("node hierarchy deeper than {} (cycle?) at node {}", kMaxNodeDepth, nodeIndex));
        }
        if (nodeIndex < 0 || static_cast<size_t>(nodeIndex) >= model_.nodes.size()) {
            throw SceneError(fmt::format("node {} does not exist", nodeIndex));
        }

        const tinygltf::Node& node = model_.nodes[nodeIndex];
        const Mat4 world = parentWorld * LocalMatrix(node);
        const std::string name = node.name.empty() ? fmt::format("node_{}", nodeIndex) : node.name;

        scene::SceneObject base;
        base.Name = name;
        base.MatrixWorld = GltfToSourceSpace() * world;
        base.Scale = LocalScale(node);

        bool attached = false;
        if (node.mesh >= 0) {
            AddMesh(node, base);
            attached = true;
        }
        if (node.camera >= 0) {
            AddCamera(node, base);
            attached = true;
        }
        if (const int light = LightIndex(node); light >= 0) {
            AddLight(light, base);
            attached = true;
        }
        if (!attached) {
            scene::SceneObject empty = base;
            empty.Kind = scene::ObjectKind::Empty;
            scene_.Objects.push_back(std::move(empty));
        }

        for (int child : node.children) {
            VisitNode(child, world, depth + 1);
        }
    }

private:
    static int LightIndex(const tinygltf::Node& node) {
        auto it = node.extensions.find("KHR_lights_punctual");
        if (it == node.extensions.end() || !it->second.Has("light")) {
            return -1;
        }
        return it->second.Get("light").GetNumberAsInt();
    }

    std::shared_ptr<const scene::ShadingDescription> MaterialAt(int materialIndex) {
        if (materialIndex < 0 || static_cast<size_t>(materialIndex) >= model_.materials.size()) {
            return nullptr;
        }
        auto it = materials_.find(materialIndex);
        if (it != materials_.end()) {
            return it->second;
        }
        auto shading = ConvertMaterial(model_.materials[materialIndex]);
        materials_.emplace(materialIndex, shading);
        return shading;
    }

    void AddMesh(const tinygltf::Node& node, const scene::SceneObject& base) {
        if (static_cast<size_t>(node.mesh) >= model_.meshes.size()) {
            throw SceneError(fmt::format("node '{}' references missing mesh {}", base.Name, node.mesh));
        }
        const tinygltf::Mesh& mesh = model_.meshes[node.mesh];

        scene::SceneObject object = base;
        object.Kind = scene::ObjectKind::Mesh;
        scene::MeshData data;

        for (size_t p = 0; p < mesh.primitives.size(); ++p) {
            const tinygltf::Primitive& primitive = mesh.primitives[p];
            if (primitive.mode != TINYGLTF_MODE_TRIANGLES && primitive.mode != -1) {
                RAYCAST_LOG_WARN("Mesh '{}' primitive {} uses mode {}, only triangles are imported",
                                 mesh.name, p, primitive.mode);
                continue;
            }
            auto position = primitive.attributes.find("POSITION");
            if (position == primitive.attributes.end()) {
                RAYCAST_LOG_WARN("Mesh '{}' primitive {} has no POSITION attribute", mesh.name, p);
                continue;
            }

            const auto base_vertex = static_cast<uint32_t>(data.Positions.size());
            std::vector<Vec3> positions = ReadPositions(model_, position->second);
            std::vector<uint32_t> indices;
            if (primitive.indices >= 0) {
                indices = ReadIndices(model_, primitive.indices);
            } else {
                indices.resize(positions.size());
                for (size_t i = 0; i < indices.size(); ++i) {
                    indices[i] = static_cast<uint32_t>(i);
                }
            }

            // Indices are local to the primitive until base_vertex is added
            for (uint32_t index : indices) {
                if (index >= positions.size()) {
                    throw SceneError(fmt::format("mesh '{}' primitive {} index {} is out of range ({} vertices)",
                                                 mesh.name, p, index, positions.size()));
                }
            }

            data.Positions.insert(data.Positions.end(), positions.begin(), positions.end());
            for (size_t i = 0; i + 2 < indices.size(); i += 3) {
                data.Polygons.push_back({base_vertex + indices[i], base_vertex + indices[i + 1],
                                         base_vertex + indices[i + 2]});
            }

            if (!object.ActiveMaterial) {
                object.ActiveMaterial = MaterialAt(primitive.material);
            }
        }

        object.Mesh = std::move(data);
        scene_.Objects.push_back(std::move(object));
    }

    void AddCamera(const tinygltf::Node& node, const scene::SceneObject& base) {
        if (static_cast<size_t>(node.camera) >= model_.cameras.size()) {
            throw SceneError(fmt::format("node '{}' references missing camera {}", base.Name, node.camera));
        }
        const tinygltf::Camera& camera = model_.cameras[node.camera];

        scene::CameraData lens;
        if (camera.type == "perspective") {
            const double renderAspect = scene_.Render.ResolutionY == 0
                ? 1.0
                : static_cast<double>(scene_.Render.ResolutionX) / scene_.Render.ResolutionY;
            const double aspect = camera.perspective.aspectRatio > 0.0 ? camera.perspective.aspectRatio : renderAspect;
            lens.Angle = 2.0 * std::atan(std::tan(camera.perspective.yfov * 0.5) * aspect);
        } else {
            RAYCAST_LOG_WARN("Camera '{}' is {}, exporting it as perspective", base.Name, camera.type);
            lens.Angle = kDefaultCameraAngle;
        }

        scene::SceneObject object = base;
        object.Kind = scene::ObjectKind::Camera;
        object.Camera = lens;
        scene_.Objects.push_back(std::move(object));
    }

    void AddLight(int lightIndex, const scene::SceneObject& base) {
        if (static_cast<size_t>(lightIndex) >= model_.lights.size()) {
            throw SceneError(fmt::format("node '{}' references missing light {}", base.Name, lightIndex));
        }
        const tinygltf::Light& light = model_.lights[lightIndex];

        scene::LightData data;
        data.Color = ToVec3(light.color, Vec3(1.0));
        if (light.type == "point") {
            data.Kind = scene::LightKind::Point;
            data.Energy = light.intensity * 4.0 * glm::pi<double>() / kWattsToLumens;
        } else if (light.type == "directional") {
            data.Kind = scene::LightKind::Sun;
            data.Energy = light.intensity;
        } else {
            data.Kind = scene::LightKind::Spot;
            data.Energy = light.intensity * 4.0 * glm::pi<double>() / kWattsToLumens;
        }

        scene::SceneObject object = base;
        object.Kind = scene::ObjectKind::Light;
        object.Light = data;
        scene_.Objects.push_back(std::move(object));
    }

    const tinygltf::Model& model_;
    scene::Scene& scene_;
    std::unordered_map<int, std::shared_ptr<const scene::ShadingDescription>> materials_;
};

} // namespace

Mat4 GltfToSourceSpace() {
    return Mat4(
        Vec4(1.0, 0.0, 0.0, 0.0),
        Vec4(0.0, 0.0, 1.0, 0.0),
        Vec4(0.0, -1.0, 0.0, 0.0),
        Vec4(0.0, 0.0, 0.0, 1.0));
}

core::Result<scene::Scene> LoadGltfScene(const std::filesystem::path& path, const GltfLoadOptions& options) {
    tinygltf::Model model;
    tinygltf::TinyGLTF loader;
    loader.SetImageLoader(SkipImageData, nullptr);
    std::string err, warn;

    bool ret = false;
    if (path.extension() == ".gltf") {
        ret = loader.LoadASCIIFromFile(&model, &err, &warn, path.string());
    } else if (path.extension() == ".glb") {
        ret = loader.LoadBinaryFromFile(&model, &err, &warn, path.string());
    } else {
        return core::MakeError(fmt::format("Unsupported file extension: {}", path.extension().string()));
    }

    if (!warn.empty()) {
        RAYCAST_LOG_WARN("glTF warning: {}", warn);
    }
    if (!err.empty()) {
        return core::MakeError(fmt::format("glTF error: {}", err));
    }
    if (!ret) {
        return core::MakeError(fmt::format("Failed to load glTF file: {}", path.string()));
    }

    scene::Scene snapshot;
    snapshot.Render = options.Render;

    const int sceneIndex = model.defaultScene >= 0 ? model.defaultScene : 0;
    if (model.scenes.empty()) {
        snapshot.Name = path.stem().string();
        RAYCAST_LOG_WARN("glTF file {} has no scenes", path.string());
        return snapshot;
    }
    if (static_cast<size_t>(sceneIndex) >= model.scenes.size()) {
        return core::MakeError(fmt::format("default scene {} does not exist", sceneIndex));
    }
    const tinygltf::Scene& gltfScene = model.scenes[sceneIndex];
    snapshot.Name = gltfScene.name.empty() ? path.stem().string() : gltfScene.name;

    try {
        SnapshotBuilder builder(model, snapshot);
        for (int root : gltfScene.nodes) {
            builder.VisitNode(root, Mat4(1.0), 0);
        }
    } catch (const SceneError& error) {
        return core::MakeError(fmt::format("{}: {}", path.string(), error.what()));
    } catch (const std::out_of_range& error) {
        return core::MakeError(fmt::format("{}: dangling reference ({})", path.string(), error.what()));
    }

    for (size_t i = 0; i < snapshot.Objects.size(); ++i) {
        if (snapshot.Objects[i].Kind == scene::ObjectKind::Camera) {
            snapshot.ActiveCameraIndex = i;
            break;
        }
    }

    if (options.ActiveObject) {
        snapshot.ActiveObjectIndex = snapshot.FindObject(*options.ActiveObject);
        if (!snapshot.ActiveObjectIndex) {
            RAYCAST_LOG_WARN("Active object '{}' not found in {}", *options.ActiveObject, path.string());
        }
    }

    RAYCAST_LOG_DEBUG("Loaded {} objects from {}", snapshot.Objects.size(), path.string());
    return snapshot;
}

} // namespace raycast::gltf
