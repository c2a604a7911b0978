#include <raycast/core/log.h>
#include <raycast/exporter/scene_serializer.h>
#include <raycast/scene/scene.h>

#include <glm/gtc/constants.hpp>
#include <memory>

using namespace raycast;

namespace {

scene::MeshData UnitPlane() {
    scene::MeshData mesh;
    mesh.Positions = {
        {-1.0, -1.0, 0.0}, {1.0, -1.0, 0.0},
        {1.0, 1.0, 0.0}, {-1.0, 1.0, 0.0},
    };
    mesh.Polygons = {{0, 1, 2, 3}};
    return mesh;
}

} // namespace

// Builds a small scene in code and writes it to hello_raycast.json
int main() {
    log::init(spdlog::level::debug);

    scene::Scene scene;
    scene.Name = "hello";
    scene.Render = {1280, 720};

    auto gold = std::make_shared<scene::ShadingDescription>();
    gold->Name = "Gold";
    gold->Metallic = 1.0;
    gold->Roughness = 0.05;
    gold->DiffuseColor = Vec4(1.0, 0.71, 0.29, 1.0);

    auto floorMaterial = std::make_shared<scene::ShadingDescription>();
    floorMaterial->Name = "Floor";
    floorMaterial->DiffuseColor = Vec4(0.6, 0.6, 0.6, 1.0);

    scene::SceneObject floor;
    floor.Name = "Floor";
    floor.Kind = scene::ObjectKind::Mesh;
    floor.Scale = Vec3(10.0, 10.0, 1.0);
    floor.MatrixWorld = scene::ComposeTransform(Vec3(0.0), Vec3(0.0), floor.Scale);
    floor.Mesh = UnitPlane();
    floor.ActiveMaterial = floorMaterial;
    scene.Objects.push_back(floor);

    scene::SceneObject ball;
    ball.Name = "Sphere";
    ball.Kind = scene::ObjectKind::Mesh;
    ball.MatrixWorld = scene::ComposeTransform(Vec3(0.0, 0.0, 1.0), Vec3(0.0), Vec3(1.0));
    ball.Mesh = UnitPlane();  // geometry is only checked for presence
    ball.ActiveMaterial = gold;
    scene.Objects.push_back(ball);

    scene::SceneObject sun;
    sun.Name = "Sun";
    sun.Kind = scene::ObjectKind::Light;
    sun.MatrixWorld = scene::ComposeTransform(Vec3(0.0, 0.0, 10.0), Vec3(0.3, 0.0, 0.0), Vec3(1.0));
    sun.Light = scene::LightData{scene::LightKind::Sun, 300.0, Vec3(1.0, 0.95, 0.9)};
    scene.Objects.push_back(sun);

    scene::SceneObject camera;
    camera.Name = "Camera";
    camera.Kind = scene::ObjectKind::Camera;
    camera.MatrixWorld = scene::ComposeTransform(Vec3(0.0, -8.0, 2.0),
                                                 Vec3(glm::half_pi<double>(), 0.0, 0.0), Vec3(1.0));
    camera.Camera = scene::CameraData{};
    scene.Objects.push_back(camera);
    scene.ActiveCameraIndex = scene.Objects.size() - 1;
    scene.ActiveObjectIndex = 1;

    auto result = exporter::ExportScene(scene, exporter::ExportOptions{}, "hello_raycast.json");
    return result ? 0 : 1;
}
