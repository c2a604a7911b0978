#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <raycast/exporter/light_exporter.h>

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

scene::SceneObject LightObject(scene::LightKind kind, double energy) {
    scene::SceneObject object;
    object.Name = "Light";
    object.Kind = scene::ObjectKind::Light;
    object.Light = scene::LightData{kind, energy, Vec3(1.0, 0.9, 0.8)};
    return object;
}

} // namespace

TEST_CASE("Point light export", "[exporter][light]") {
    auto object = LightObject(scene::LightKind::Point, 200.0);
    object.MatrixWorld = scene::ComposeTransform(Vec3(0.0, 5.0, 0.0), Vec3(0.0), Vec3(1.0));

    auto light = ExportLight(object);

    REQUIRE(light.has_value());
    REQUIRE(std::holds_alternative<document::PointLight>(*light));

    const auto& point = std::get<document::PointLight>(*light);
    RequireVecNear(point.Position, Vec3(0.0, 0.0, -5.0));
    REQUIRE(point.Color == Vec3(1.0, 0.9, 0.8));
    REQUIRE_THAT(point.Intensity, WithinAbs(2.0, 1e-12));
}

TEST_CASE("Sun light export", "[exporter][light]") {
    SECTION("Unrotated sun points straight down") {
        auto object = LightObject(scene::LightKind::Sun, 300.0);

        auto light = ExportLight(object);
        REQUIRE(light.has_value());
        REQUIRE(std::holds_alternative<document::DirectionalLight>(*light));

        const auto& sun = std::get<document::DirectionalLight>(*light);
        RequireVecNear(sun.Direction, Vec3(0.0, -1.0, 0.0));
        REQUIRE_THAT(sun.Intensity, WithinAbs(3.0, 1e-12));
    }

    SECTION("Direction ignores position and scale") {
        auto object = LightObject(scene::LightKind::Sun, 100.0);
        object.MatrixWorld = scene::ComposeTransform(Vec3(4.0, 4.0, 4.0), Vec3(glm::radians(90.0), 0.0, 0.0), Vec3(3.0));

        auto sun = std::get<document::DirectionalLight>(*ExportLight(object));
        // -Z rotated 90 degrees about X is +Y in Z-up, -Z in Y-up
        RequireVecNear(sun.Direction, Vec3(0.0, 0.0, -1.0));
        REQUIRE_THAT(glm::length(sun.Direction), WithinAbs(1.0, 1e-12));
    }
}

TEST_CASE("Unsupported lights are skipped", "[exporter][light]") {
    REQUIRE_FALSE(ExportLight(LightObject(scene::LightKind::Spot, 100.0)).has_value());
    REQUIRE_FALSE(ExportLight(LightObject(scene::LightKind::Area, 100.0)).has_value());

    scene::SceneObject bare;
    bare.Kind = scene::ObjectKind::Light;
    REQUIRE_FALSE(ExportLight(bare).has_value());
}

TEST_CASE("Lights with non-finite values are skipped", "[exporter][light]") {
    SECTION("Infinite energy") {
        auto object = LightObject(scene::LightKind::Point, std::numeric_limits<double>::infinity());
        REQUIRE_FALSE(ExportLight(object).has_value());
    }

    SECTION("NaN color") {
        auto object = LightObject(scene::LightKind::Sun, 100.0);
        object.Light->Color.y = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_FALSE(ExportLight(object).has_value());
    }

    SECTION("NaN transform") {
        auto object = LightObject(scene::LightKind::Point, 100.0);
        object.MatrixWorld[3][0] = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_FALSE(ExportLight(object).has_value());
    }
}
