// raycast - scene exporter for the RayCast ray tracer
// Copyright (c) 2025 raycast Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "raycast/document/json_io.h"
#include "raycast/core/error.h"

#include <fstream>

#include <fmt/format.h>

namespace raycast::document {

namespace {

Json VecToJson(const Vec3& v) {
    return Json::array({v.x, v.y, v.z});
}

// ========================================
// Reader helpers - throw DocumentError, caught in ParseDocument
// ========================================

const Json& Field(const Json& object, const char* key, const std::string& where) {
    if (!object.is_object()) {
        throw DocumentError(fmt::format("{} is not an object", where));
    }
    auto it = object.find(key);
    if (it == object.end()) {
        throw DocumentError(fmt::format("{} is missing '{}'", where, key));
    }
    return *it;
}

double ReadNumber(const Json& object, const char* key, const std::string& where) {
    const Json& value = Field(object, key, where);
    if (!value.is_number()) {
        throw DocumentError(fmt::format("{}.{} is not a number", where, key));
    }
    return value.get<double>();
}

std::string ReadString(const Json& object, const char* key, const std::string& where) {
    const Json& value = Field(object, key, where);
    if (!value.is_string()) {
        throw DocumentError(fmt::format("{}.{} is not a string", where, key));
    }
    return value.get<std::string>();
}

Vec3 ParseVec(const Json& value, const std::string& where) {
    if (!value.is_array() || value.size() != 3) {
        throw DocumentError(fmt::format("{} is not a 3-component array", where));
    }
    Vec3 result;
    for (int i = 0; i < 3; ++i) {
        if (!value[i].is_number()) {
            throw DocumentError(fmt::format("{}[{}] is not a number", where, i));
        }
        result[i] = value[i].get<double>();
    }
    return result;
}

Vec3 ReadVec(const Json& object, const char* key, const std::string& where) {
    return ParseVec(Field(object, key, where), where + "." + key);
}

Material ParseMaterial(const Json& json, const std::string& where) {
    const std::string type = ReadString(json, "type", where);
    if (type == "lambertian") {
        return LambertianMaterial{ReadVec(json, "color", where)};
    }
    if (type == "metal") {
        return MetalMaterial{ReadVec(json, "color", where), ReadNumber(json, "roughness", where)};
    }
    if (type == "dielectric") {
        return DielectricMaterial{ReadNumber(json, "ior", where)};
    }
    if (type == "emissive") {
        return EmissiveMaterial{ReadVec(json, "color", where), ReadNumber(json, "intensity", where)};
    }
    if (type == "default") {
        return DefaultMaterial{};
    }
    throw DocumentError(fmt::format("{} has unknown material type '{}'", where, type));
}

MeshPrimitive ParseMesh(const Json& json, const std::string& where) {
    MeshPrimitive mesh;
    mesh.Name = ReadString(json, "name", where);

    const Json& vertices = Field(json, "vertices", where);
    if (!vertices.is_array() || vertices.empty()) {
        throw DocumentError(fmt::format("{}.vertices must be a non-empty array", where));
    }
    mesh.Vertices.reserve(vertices.size());
    for (size_t i = 0; i < vertices.size(); ++i) {
        mesh.Vertices.push_back(ParseVec(vertices[i], fmt::format("{}.vertices[{}]", where, i)));
    }

    const Json& indices = Field(json, "indices", where);
    if (!indices.is_array() || indices.empty() || indices.size() % 3 != 0) {
        throw DocumentError(fmt::format("{}.indices must be a non-empty array of triangles", where));
    }
    mesh.Indices.reserve(indices.size());
    for (size_t i = 0; i < indices.size(); ++i) {
        if (!indices[i].is_number_unsigned()) {
            throw DocumentError(fmt::format("{}.indices[{}] is not an unsigned integer", where, i));
        }
        const auto index = indices[i].get<uint64_t>();
        if (index >= mesh.Vertices.size()) {
            throw DocumentError(fmt::format("{}.indices[{}] = {} is out of range ({} vertices)",
                                            where, i, index, mesh.Vertices.size()));
        }
        mesh.Indices.push_back(static_cast<uint32_t>(index));
    }

    mesh.Mat = ParseMaterial(Field(json, "material", where), where + ".material");
    return mesh;
}

Primitive ParsePrimitive(const Json& json, const std::string& where) {
    const std::string type = ReadString(json, "type", where);
    if (type == "sphere") {
        SpherePrimitive sphere;
        sphere.Name = ReadString(json, "name", where);
        sphere.Center = ReadVec(json, "center", where);
        sphere.Radius = ReadNumber(json, "radius", where);
        sphere.Mat = ParseMaterial(Field(json, "material", where), where + ".material");
        return sphere;
    }
    if (type == "mesh") {
        return ParseMesh(json, where);
    }
    if (type == "box") {
        BoxPrimitive box;
        box.Name = ReadString(json, "name", where);
        box.Min = ReadVec(json, "min", where);
        box.Max = ReadVec(json, "max", where);
        if (glm::any(glm::greaterThan(box.Min, box.Max))) {
            throw DocumentError(fmt::format("{} has min corner above max corner", where));
        }
        box.Mat = ParseMaterial(Field(json, "material", where), where + ".material");
        return box;
    }
    throw DocumentError(fmt::format("{} has unknown primitive type '{}'", where, type));
}

Light ParseLight(const Json& json, const std::string& where) {
    const std::string type = ReadString(json, "type", where);
    if (type == "point") {
        return PointLight{ReadVec(json, "position", where), ReadVec(json, "color", where),
                          ReadNumber(json, "intensity", where)};
    }
    if (type == "directional") {
        return DirectionalLight{ReadVec(json, "direction", where), ReadVec(json, "color", where),
                                ReadNumber(json, "intensity", where)};
    }
    throw DocumentError(fmt::format("{} has unknown light type '{}'", where, type));
}

Camera ParseCamera(const Json& json) {
    const std::string where = "camera";
    Camera camera;
    camera.Position = ReadVec(json, "position", where);
    camera.LookAt = ReadVec(json, "lookAt", where);
    camera.Up = ReadVec(json, "up", where);
    camera.Fov = ReadNumber(json, "fov", where);
    camera.Aspect = ReadNumber(json, "aspect", where);

    const Json& resolution = Field(json, "resolution", where);
    if (!resolution.is_array() || resolution.size() != 2 ||
        !resolution[0].is_number_unsigned() || !resolution[1].is_number_unsigned()) {
        throw DocumentError("camera.resolution must be two unsigned integers");
    }
    camera.Resolution = {resolution[0].get<uint32_t>(), resolution[1].get<uint32_t>()};

    camera.Aperture = ReadNumber(json, "aperture", where);
    camera.FocusDist = ReadNumber(json, "focusDist", where);
    camera.Type = ReadString(json, "type", where);
    if (camera.Type != "perspective") {
        throw DocumentError(fmt::format("camera has unsupported type '{}'", camera.Type));
    }
    return camera;
}

template<typename T, typename Parse>
std::vector<T> ParseArray(const Json& document, const char* key, Parse parse) {
    const Json& items = Field(document, key, "document");
    if (!items.is_array()) {
        throw DocumentError(fmt::format("document.{} is not an array", key));
    }
    std::vector<T> result;
    result.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        result.push_back(parse(items[i], fmt::format("{}[{}]", key, i)));
    }
    return result;
}

} // namespace

// ========================================
// Writer
// ========================================

Json ToJson(const Material& material) {
    Json json;
    json["type"] = std::string(MaterialTypeName(material));

    if (const auto* lambertian = std::get_if<LambertianMaterial>(&material)) {
        json["color"] = VecToJson(lambertian->Color);
    } else if (const auto* metal = std::get_if<MetalMaterial>(&material)) {
        json["color"] = VecToJson(metal->Color);
        json["roughness"] = metal->Roughness;
    } else if (const auto* dielectric = std::get_if<DielectricMaterial>(&material)) {
        json["ior"] = dielectric->Ior;
    } else if (const auto* emissive = std::get_if<EmissiveMaterial>(&material)) {
        json["color"] = VecToJson(emissive->Color);
        json["intensity"] = emissive->Intensity;
    }
    return json;
}

Json ToJson(const Primitive& primitive) {
    Json json;
    json["type"] = std::string(PrimitiveTypeName(primitive));
    json["name"] = PrimitiveName(primitive);

    if (const auto* sphere = std::get_if<SpherePrimitive>(&primitive)) {
        json["center"] = VecToJson(sphere->Center);
        json["radius"] = sphere->Radius;
    } else if (const auto* mesh = std::get_if<MeshPrimitive>(&primitive)) {
        Json vertices = Json::array();
        for (const auto& v : mesh->Vertices) {
            vertices.push_back(VecToJson(v));
        }
        json["vertices"] = std::move(vertices);
        json["indices"] = mesh->Indices;
    } else if (const auto* box = std::get_if<BoxPrimitive>(&primitive)) {
        json["min"] = VecToJson(box->Min);
        json["max"] = VecToJson(box->Max);
    }

    json["material"] = ToJson(PrimitiveMaterial(primitive));
    return json;
}

Json ToJson(const Light& light) {
    Json json;
    json["type"] = std::string(LightTypeName(light));

    if (const auto* point = std::get_if<PointLight>(&light)) {
        json["position"] = VecToJson(point->Position);
        json["color"] = VecToJson(point->Color);
        json["intensity"] = point->Intensity;
    } else if (const auto* directional = std::get_if<DirectionalLight>(&light)) {
        json["direction"] = VecToJson(directional->Direction);
        json["color"] = VecToJson(directional->Color);
        json["intensity"] = directional->Intensity;
    }
    return json;
}

Json ToJson(const Camera& camera) {
    Json json;
    json["position"] = VecToJson(camera.Position);
    json["lookAt"] = VecToJson(camera.LookAt);
    json["up"] = VecToJson(camera.Up);
    json["fov"] = camera.Fov;
    json["aspect"] = camera.Aspect;
    json["resolution"] = Json::array({camera.Resolution[0], camera.Resolution[1]});
    json["aperture"] = camera.Aperture;
    json["focusDist"] = camera.FocusDist;
    json["type"] = camera.Type;
    return json;
}

Json ToJson(const SceneDocument& document) {
    Json json;
    json["name"] = document.Name;

    Json objects = Json::array();
    for (const auto& primitive : document.Objects) {
        objects.push_back(ToJson(primitive));
    }
    json["objects"] = std::move(objects);

    Json lights = Json::array();
    for (const auto& light : document.Lights) {
        lights.push_back(ToJson(light));
    }
    json["lights"] = std::move(lights);

    json["camera"] = ToJson(document.Cam);
    json["background"] = Json{{"type", document.Bg.Type}, {"intensity", document.Bg.Intensity}};
    return json;
}

std::string DumpDocument(const SceneDocument& document, int indent) {
    // Host names are not guaranteed to be valid UTF-8
    return ToJson(document).dump(indent, ' ', false, Json::error_handler_t::replace);
}

// ========================================
// Reader
// ========================================

core::Result<SceneDocument> ParseDocument(const Json& json) {
    try {
        SceneDocument document;
        document.Name = ReadString(json, "name", "document");
        document.Objects = ParseArray<Primitive>(json, "objects", ParsePrimitive);
        document.Lights = ParseArray<Light>(json, "lights", ParseLight);
        document.Cam = ParseCamera(Field(json, "camera", "document"));

        const Json& background = Field(json, "background", "document");
        document.Bg.Type = ReadString(background, "type", "background");
        document.Bg.Intensity = ReadNumber(background, "intensity", "background");
        return document;
    } catch (const DocumentError& err) {
        return core::MakeError(err.what());
    } catch (const nlohmann::json::exception& err) {
        return core::MakeError(fmt::format("Document error: {}", err.what()));
    }
}

core::Result<SceneDocument> ReadDocument(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return core::MakeError(fmt::format("Failed to open document: {}", path.string()));
    }

    Json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& err) {
        return core::MakeError(fmt::format("Failed to parse {}: {}", path.string(), err.what()));
    }
    return ParseDocument(json).WithContext(path.string());
}

} // namespace raycast::document
