#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <raycast/exporter/camera_deriver.h>

#include <glm/gtc/constants.hpp>
#include <limits>

using namespace raycast;
using namespace raycast::exporter;
using Catch::Matchers::WithinAbs;

namespace {

void RequireVecNear(const Vec3& actual, const Vec3& expected, double eps = 1e-9) {
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, eps));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, eps));
    REQUIRE_THAT(actual.z, WithinAbs(expected.z, eps));
}

// Camera at (0, -10, 0) looking along +Y at the origin, Z up
scene::SceneObject FrontCamera() {
    scene::SceneObject camera;
    camera.Name = "Camera";
    camera.Kind = scene::ObjectKind::Camera;
    camera.MatrixWorld = scene::ComposeTransform(Vec3(0.0, -10.0, 0.0), Vec3(glm::half_pi<double>(), 0.0, 0.0), Vec3(1.0));
    camera.Camera = scene::CameraData{};
    return camera;
}

} // namespace

TEST_CASE("Default camera", "[exporter][camera]") {
    auto camera = DeriveCamera(nullptr, scene::RenderSettings{800, 600}, nullptr);

    RequireVecNear(camera.Position, Vec3(0.0, 0.0, 5.0));
    RequireVecNear(camera.LookAt, Vec3(0.0));
    RequireVecNear(camera.Up, Vec3(0.0, 1.0, 0.0));
    REQUIRE(camera.Fov == 45.0);
    REQUIRE_THAT(camera.Aspect, WithinAbs(800.0 / 600.0, 1e-12));
    REQUIRE(camera.Resolution[0] == 800);
    REQUIRE(camera.Resolution[1] == 600);
    REQUIRE(camera.Aperture == 0.0);
    REQUIRE(camera.FocusDist == 10.0);
    REQUIRE(camera.Type == "perspective");
}

TEST_CASE("Derived camera", "[exporter][camera]") {
    scene::RenderSettings render{1920, 1080};

    SECTION("Position, look-at and up") {
        auto object = FrontCamera();
        auto camera = DeriveCamera(&object, render, nullptr);

        RequireVecNear(camera.Position, Vec3(0.0, 0.0, 10.0));
        RequireVecNear(camera.LookAt, Vec3(0.0, 0.0, 0.0));
        RequireVecNear(camera.Up, Vec3(0.0, 1.0, 0.0));
        REQUIRE_THAT(glm::distance(camera.Position, camera.LookAt), WithinAbs(kLookAtDistance, 1e-9));
    }

    SECTION("Field of view in degrees") {
        auto object = FrontCamera();
        object.Camera->Angle = glm::half_pi<double>();

        auto camera = DeriveCamera(&object, render, nullptr);
        REQUIRE_THAT(camera.Fov, WithinAbs(90.0, 1e-9));
        REQUIRE_THAT(camera.Aspect, WithinAbs(1920.0 / 1080.0, 1e-12));
    }

    SECTION("Depth of field on") {
        auto object = FrontCamera();
        object.Camera->Dof = scene::DofSettings{true, 8.0, 4.5};

        auto camera = DeriveCamera(&object, render, nullptr);
        REQUIRE(camera.Aperture == 0.5);
        REQUIRE(camera.FocusDist == 4.5);
    }

    SECTION("Depth of field off focuses on the active object") {
        auto object = FrontCamera();
        scene::SceneObject target;
        target.Name = "Target";
        target.MatrixWorld = scene::ComposeTransform(Vec3(0.0, -4.0, 0.0), Vec3(0.0), Vec3(1.0));

        auto camera = DeriveCamera(&object, render, &target);
        REQUIRE(camera.Aperture == 0.0);
        REQUIRE_THAT(camera.FocusDist, WithinAbs(6.0, 1e-9));
    }

    SECTION("Camera itself selected keeps the default focus") {
        auto object = FrontCamera();
        auto camera = DeriveCamera(&object, render, &object);

        REQUIRE(camera.FocusDist == 10.0);
    }

    SECTION("Zero height gives aspect 1") {
        auto object = FrontCamera();
        auto camera = DeriveCamera(&object, scene::RenderSettings{640, 0}, nullptr);

        REQUIRE(camera.Aspect == 1.0);
        REQUIRE(camera.Resolution[1] == 0);
    }
}

TEST_CASE("Camera with non-finite values", "[exporter][camera]") {
    scene::RenderSettings render{1920, 1080};
    const double nan = std::numeric_limits<double>::quiet_NaN();

    SECTION("NaN transform uses the default camera") {
        auto object = FrontCamera();
        object.MatrixWorld[3][1] = nan;

        auto camera = DeriveCamera(&object, render, nullptr);
        RequireVecNear(camera.Position, Vec3(0.0, 0.0, 5.0));
        REQUIRE(camera.Fov == 45.0);
    }

    SECTION("Infinite angle uses the default lens") {
        auto object = FrontCamera();
        object.Camera->Angle = std::numeric_limits<double>::infinity();

        auto camera = DeriveCamera(&object, render, nullptr);
        REQUIRE_THAT(camera.Fov, WithinAbs(glm::degrees(scene::CameraData{}.Angle), 1e-9));
    }

    SECTION("NaN depth of field settings are dropped") {
        auto object = FrontCamera();
        object.Camera->Dof = scene::DofSettings{true, nan, 3.0};

        auto camera = DeriveCamera(&object, render, nullptr);
        REQUIRE(camera.Aperture == 0.0);
        REQUIRE(camera.FocusDist == kLookAtDistance);
    }

    SECTION("Active object with a NaN position keeps the default focus") {
        auto object = FrontCamera();
        scene::SceneObject target;
        target.MatrixWorld[3][0] = nan;

        auto camera = DeriveCamera(&object, render, &target);
        REQUIRE(camera.FocusDist == kLookAtDistance);
    }
}
