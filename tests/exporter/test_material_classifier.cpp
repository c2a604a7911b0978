#include <catch2/catch_test_macros.hpp>
#include <raycast/exporter/material_classifier.h>

#include <limits>
#include <memory>

using namespace raycast;
using namespace raycast::exporter;
using scene::ShadingDescription;

namespace {

scene::ShaderNode MakeNode(std::string_view type) {
    scene::ShaderNode node;
    node.Name = std::string(type);
    node.Type = std::string(type);
    return node;
}

ShadingDescription WithNodes(std::vector<scene::ShaderNode> nodes) {
    ShadingDescription shading;
    shading.Name = "Material";
    shading.UseNodes = true;
    shading.Nodes = scene::NodeTree{std::move(nodes)};
    return shading;
}

} // namespace

TEST_CASE("Classifier rule table", "[exporter][material]") {
    auto rules = ClassifierRules();

    REQUIRE(rules.size() == 6);
    REQUIRE(rules[0].Name == "metallic");
    REQUIRE(rules[1].Name == "glass_node");
    REQUIRE(rules[2].Name == "emission_node");
    REQUIRE(rules[3].Name == "blend_transparency");
    REQUIRE(rules[4].Name == "legacy_emission");
    REQUIRE(rules[5].Name == "diffuse");
}

TEST_CASE("Material classification", "[exporter][material]") {
    SECTION("No material uses the gray fallback") {
        auto material = ClassifyMaterial(nullptr);

        REQUIRE(std::holds_alternative<document::LambertianMaterial>(material));
        REQUIRE(std::get<document::LambertianMaterial>(material).Color == Vec3(0.8));
    }

    SECTION("Metallic above the threshold") {
        ShadingDescription shading;
        shading.Metallic = 0.9;
        shading.Roughness = 0.35;
        shading.DiffuseColor = Vec4(1.0, 0.8, 0.2, 1.0);

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::holds_alternative<document::MetalMaterial>(material));

        const auto& metal = std::get<document::MetalMaterial>(material);
        REQUIRE(metal.Color == Vec3(1.0, 0.8, 0.2));
        REQUIRE(metal.Roughness == 0.35);
    }

    SECTION("Metallic exactly at the threshold is not metal") {
        ShadingDescription shading;
        shading.Metallic = 0.5;

        REQUIRE(std::holds_alternative<document::LambertianMaterial>(ClassifyMaterial(&shading)));
    }

    SECTION("Metal without roughness uses the default") {
        ShadingDescription shading;
        shading.Metallic = 1.0;

        auto metal = std::get<document::MetalMaterial>(ClassifyMaterial(&shading));
        REQUIRE(metal.Roughness == 0.1);
        REQUIRE(metal.Color == Vec3(0.8));
    }

    SECTION("Glass node with IOR") {
        auto glass = MakeNode(scene::node_type::Glass);
        glass.Inputs["IOR"] = 1.45;
        auto shading = WithNodes({MakeNode(scene::node_type::Output), glass});

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::holds_alternative<document::DielectricMaterial>(material));
        REQUIRE(std::get<document::DielectricMaterial>(material).Ior == 1.45);
    }

    SECTION("Refraction node without IOR uses 1.5") {
        auto shading = WithNodes({MakeNode(scene::node_type::Refraction)});

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::get<document::DielectricMaterial>(material).Ior == 1.5);
    }

    SECTION("Node graph is ignored when nodes are disabled") {
        auto shading = WithNodes({MakeNode(scene::node_type::Glass)});
        shading.UseNodes = false;

        REQUIRE(std::holds_alternative<document::LambertianMaterial>(ClassifyMaterial(&shading)));
    }

    SECTION("Emission node") {
        auto emission = MakeNode(scene::node_type::Emission);
        emission.Inputs["Color"] = Vec4(1.0, 0.5, 0.0, 1.0);
        emission.Inputs["Strength"] = 12.0;
        auto shading = WithNodes({emission});

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::holds_alternative<document::EmissiveMaterial>(material));

        const auto& emissive = std::get<document::EmissiveMaterial>(material);
        REQUIRE(emissive.Color == Vec3(1.0, 0.5, 0.0));
        REQUIRE(emissive.Intensity == 12.0);
    }

    SECTION("Glass node wins over emission node") {
        auto shading = WithNodes({MakeNode(scene::node_type::Emission), MakeNode(scene::node_type::Glass)});

        REQUIRE(std::holds_alternative<document::DielectricMaterial>(ClassifyMaterial(&shading)));
    }

    SECTION("Metallic wins over a glass node") {
        auto shading = WithNodes({MakeNode(scene::node_type::Glass)});
        shading.Metallic = 0.8;

        REQUIRE(std::holds_alternative<document::MetalMaterial>(ClassifyMaterial(&shading)));
    }

    SECTION("Blend transparency becomes glass") {
        for (auto blend : {scene::BlendMethod::Blend, scene::BlendMethod::Hashed, scene::BlendMethod::Clip}) {
            ShadingDescription shading;
            shading.Blend = blend;

            auto material = ClassifyMaterial(&shading);
            REQUIRE(std::holds_alternative<document::DielectricMaterial>(material));
            REQUIRE(std::get<document::DielectricMaterial>(material).Ior == 1.5);
        }

        ShadingDescription opaque;
        opaque.Blend = scene::BlendMethod::Opaque;
        REQUIRE(std::holds_alternative<document::LambertianMaterial>(ClassifyMaterial(&opaque)));
    }

    SECTION("Legacy emission") {
        ShadingDescription shading;
        shading.UseEmission = true;
        shading.EmissionColor = Vec3(0.0, 1.0, 0.0);
        shading.EmissionStrength = 4.0;

        auto emissive = std::get<document::EmissiveMaterial>(ClassifyMaterial(&shading));
        REQUIRE(emissive.Color == Vec3(0.0, 1.0, 0.0));
        REQUIRE(emissive.Intensity == 4.0);
    }

    SECTION("Diffuse color drops alpha") {
        ShadingDescription shading;
        shading.DiffuseColor = Vec4(0.1, 0.2, 0.3, 0.5);

        auto diffuse = std::get<document::LambertianMaterial>(ClassifyMaterial(&shading));
        REQUIRE(diffuse.Color == Vec3(0.1, 0.2, 0.3));
    }

    SECTION("Unreadable socket falls back to gray diffuse") {
        auto glass = MakeNode(scene::node_type::Glass);
        glass.Inputs["IOR"] = Vec4(1.0);  // wrong kind of value
        auto shading = WithNodes({glass});
        shading.DiffuseColor = Vec4(1.0, 0.0, 0.0, 1.0);

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::holds_alternative<document::LambertianMaterial>(material));
        REQUIRE(std::get<document::LambertianMaterial>(material).Color == Vec3(0.8));
    }
    SECTION("Non-finite values fall back to gray diffuse") {
        ShadingDescription shading;
        shading.Metallic = 1.0;
        shading.Roughness = std::numeric_limits<double>::infinity();

        auto material = ClassifyMaterial(&shading);
        REQUIRE(std::holds_alternative<document::LambertianMaterial>(material));
        REQUIRE(std::get<document::LambertianMaterial>(material).Color == Vec3(0.8));

        auto emission = MakeNode(scene::node_type::Emission);
        emission.Inputs["Strength"] = std::numeric_limits<double>::quiet_NaN();
        auto glowing = WithNodes({emission});
        REQUIRE(std::holds_alternative<document::LambertianMaterial>(ClassifyMaterial(&glowing)));
    }
}

TEST_CASE("Material for an object", "[exporter][material]") {
    scene::SceneObject object;
    object.Name = "Cube";
    auto shading = std::make_shared<ShadingDescription>();
    shading->Metallic = 1.0;
    object.ActiveMaterial = shading;

    SECTION("Materials enabled") {
        REQUIRE(std::holds_alternative<document::MetalMaterial>(MaterialFor(object, true)));
    }

    SECTION("Materials disabled") {
        REQUIRE(std::holds_alternative<document::DefaultMaterial>(MaterialFor(object, false)));
    }

    SECTION("Object without a material") {
        object.ActiveMaterial.reset();
        REQUIRE(std::holds_alternative<document::LambertianMaterial>(MaterialFor(object, true)));
    }
}
