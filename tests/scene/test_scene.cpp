#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <raycast/core/error.h>
#include <raycast/scene/scene.h>

#include <variant>

using namespace raycast;
using namespace raycast::scene;
using Catch::Matchers::WithinAbs;

namespace {

SceneObject MakeCameraObject(const std::string& name) {
    SceneObject object;
    object.Name = name;
    object.Kind = ObjectKind::Camera;
    object.Camera = CameraData{};
    return object;
}

} // namespace

TEST_CASE("Mesh bounds", "[scene][mesh]") {
    SECTION("Bounds of a unit cube") {
        MeshData mesh;
        mesh.Positions = {Vec3(-1.0, -1.0, -1.0), Vec3(1.0, -1.0, 0.5), Vec3(0.0, 1.0, 1.0)};

        BoundingBox bounds = ComputeBounds(mesh);
        REQUIRE(bounds.Min == Vec3(-1.0, -1.0, -1.0));
        REQUIRE(bounds.Max == Vec3(1.0, 1.0, 1.0));
    }

    SECTION("Empty mesh has a zero box") {
        MeshData mesh;
        BoundingBox bounds = ComputeBounds(mesh);

        REQUIRE(bounds.Min == Vec3(0.0));
        REQUIRE(bounds.Max == Vec3(0.0));
        REQUIRE_FALSE(mesh.HasVertices());
    }

    SECTION("Geometry requires vertices") {
        SceneObject object;
        object.Kind = ObjectKind::Mesh;
        REQUIRE_FALSE(object.HasGeometry());

        object.Mesh = MeshData{};
        REQUIRE_FALSE(object.HasGeometry());

        object.Mesh->Positions.push_back(Vec3(0.0));
        REQUIRE(object.HasGeometry());
    }
}

TEST_CASE("Shader node inputs", "[scene][shading]") {
    ShaderNode node;
    node.Name = "Glass BSDF";
    node.Type = std::string(node_type::Glass);
    node.Inputs["IOR"] = 1.45;
    node.Inputs["Color"] = Vec4(1.0, 0.5, 0.25, 1.0);

    SECTION("Typed access") {
        REQUIRE(node.HasInput("IOR"));
        REQUIRE(node.ScalarInput("IOR") == 1.45);
        REQUIRE(node.ColorInput("Color") == Vec4(1.0, 0.5, 0.25, 1.0));
    }

    SECTION("Missing socket throws") {
        REQUIRE_FALSE(node.HasInput("Roughness"));
        REQUIRE_THROWS_AS(node.ScalarInput("Roughness"), SceneError);
    }

    SECTION("Wrong kind of value throws") {
        REQUIRE_THROWS_AS(node.ColorInput("IOR"), std::bad_variant_access);
    }

    SECTION("FindFirst returns the first match in tree order") {
        NodeTree tree;
        ShaderNode output;
        output.Type = std::string(node_type::Output);
        ShaderNode refraction;
        refraction.Name = "Refraction";
        refraction.Type = std::string(node_type::Refraction);

        tree.Nodes = {output, refraction, node};

        const ShaderNode* found = tree.FindFirst({node_type::Glass, node_type::Refraction});
        REQUIRE(found != nullptr);
        REQUIRE(found->Name == "Refraction");
        REQUIRE(tree.FindFirst({node_type::Emission}) == nullptr);
    }
}

TEST_CASE("Scene lookups", "[scene]") {
    Scene scene;
    SceneObject cube;
    cube.Name = "Cube";
    cube.Kind = ObjectKind::Mesh;
    scene.Objects = {cube, MakeCameraObject("Camera")};

    SECTION("Active camera") {
        REQUIRE(scene.ActiveCamera() == nullptr);

        scene.ActiveCameraIndex = 1;
        REQUIRE(scene.ActiveCamera() == &scene.Objects[1]);
    }

    SECTION("Active camera must be a camera") {
        scene.ActiveCameraIndex = 0;
        REQUIRE(scene.ActiveCamera() == nullptr);

        scene.ActiveCameraIndex = 7;
        REQUIRE(scene.ActiveCamera() == nullptr);
    }

    SECTION("Active object") {
        REQUIRE(scene.ActiveObject() == nullptr);

        scene.ActiveObjectIndex = scene.FindObject("Cube");
        REQUIRE(scene.ActiveObject() == &scene.Objects[0]);
        REQUIRE_FALSE(scene.FindObject("Missing").has_value());
    }

    SECTION("Snapshot evaluator returns the stored mesh") {
        SceneObject object = cube;
        object.Mesh = MeshData{{Vec3(0.0), Vec3(1.0, 0.0, 0.0), Vec3(0.0, 1.0, 0.0)}, {{0, 1, 2}}};

        auto evaluated = scene.Evaluator->Evaluate(object);
        REQUIRE(evaluated.IsOk());
        REQUIRE(evaluated.Value().VertexCount() == 3);

        auto missing = scene.Evaluator->Evaluate(cube);
        REQUIRE(missing.IsErr());
    }
}

TEST_CASE("Transform composition", "[scene]") {
    SECTION("Scale then rotate then translate") {
        Mat4 world = ComposeTransform(Vec3(0.0, 0.0, 5.0), Vec3(glm::radians(90.0), 0.0, 0.0), Vec3(2.0));
        Vec4 p = world * Vec4(0.0, 1.0, 0.0, 1.0);

        REQUIRE_THAT(p.x, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(p.y, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(p.z, WithinAbs(7.0, 1e-9));
    }

    SECTION("Euler order is X then Y then Z") {
        Mat4 world = ComposeTransform(Vec3(0.0), Vec3(glm::radians(90.0), 0.0, glm::radians(90.0)), Vec3(1.0));
        // X maps +Y to +Z, Z leaves +Z alone
        Vec4 p = world * Vec4(0.0, 1.0, 0.0, 0.0);

        REQUIRE_THAT(p.x, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(p.y, WithinAbs(0.0, 1e-9));
        REQUIRE_THAT(p.z, WithinAbs(1.0, 1e-9));
    }
}
