// kiln

#include <catch2/catch_test_macros.hpp>

#include "kiln/scene_builder.hh"
#include "kiln/string_builder.hh"

#include "leak_alloc.hh"
#include "naming.hh"

using namespace kiln;

namespace {
    std::string_view baseName(knStringBuilder& out, knSceneBuilder const& scene, knNodeId nodeId)
    {
        out.clear();
        knAppendBaseName(out, scene, scene.object(nodeId));
        return out.view();
    }
} // namespace

TEST_CASE("Identifier fragments", "[naming]")
{
    test::LeakTestAllocator alloc;
    knStringBuilder out(alloc);

    SECTION("Floats")
    {
        knAppendFloatId(out, 10.f);
        CHECK(out.view() == "10");

        out.clear();
        knAppendFloatId(out, 1.5f);
        CHECK(out.view() == "1p5");

        out.clear();
        knAppendFloatId(out, -0.25f);
        CHECK(out.view() == "m0p25");

        out.clear();
        knAppendFloatId(out, 2.f / 3.f);
        CHECK(out.view() == "0p667");

        out.clear();
        knAppendFloatId(out, -0.0001f);
        CHECK(out.view() == "0");
    }

    SECTION("Vectors")
    {
        knAppendVector2Id(out, knVector2{10.f, 10.f});
        CHECK(out.view() == "10");

        out.clear();
        knAppendVector2Id(out, knVector2{10.f, 20.5f});
        CHECK(out.view() == "10x20p5");
    }

    SECTION("Colors")
    {
        knAppendColorName(out, knColor{.a = 0xff, .r = 0xff, .g = 0x00, .b = 0x00});
        CHECK(out.view() == "Red");

        out.clear();
        knAppendColorName(out, knColor{.a = 0x00, .r = 0xff, .g = 0xff, .b = 0xff});
        CHECK(out.view() == "Transparent");

        out.clear();
        knAppendColorName(out, knColor{.a = 0x80, .r = 0x12, .g = 0x34, .b = 0xab});
        CHECK(out.view() == "801234AB");
    }

    SECTION("Fields")
    {
        knAppendFieldName(out, knName{"ColorBrush_Red"});
        CHECK(out.view() == "_colorBrush_Red");

        out.clear();
        knAppendFieldName(out, knName{"Root"});
        CHECK(out.view() == "_root");
    }
}

TEST_CASE("Base names", "[naming]")
{
    test::LeakTestAllocator alloc;
    knStringBuilder out(alloc);
    knSceneBuilder scene;

    SECTION("Composition prefix is dropped")
    {
        knNodeId const sprite = scene.add(knObjectType::SpriteShape);
        knNodeId const visual = scene.add(knObjectType::ContainerVisual);
        knNodeId const viewBox = scene.add(knObjectType::ViewBox);

        CHECK(baseName(out, scene, sprite) == "SpriteShape");
        CHECK(baseName(out, scene, visual) == "ContainerVisual");
        CHECK(baseName(out, scene, viewBox) == "ViewBox");
    }

    SECTION("Geometries")
    {
        knNodeId const rect = scene.add(knObjectType::RectangleGeometry);
        scene.edit(rect).geometry.size = {10.f, 20.f};
        knNodeId const rounded = scene.add(knObjectType::RoundedRectangleGeometry);
        scene.edit(rounded).geometry.size = {10.f, 10.f};
        knNodeId const ellipse = scene.add(knObjectType::EllipseGeometry);
        scene.edit(ellipse).geometry.radius = {2.5f, 2.5f};
        knNodeId const canvas = scene.add(knObjectType::CanvasGeometryPath);

        CHECK(baseName(out, scene, rect) == "Rectangle_10x20");
        CHECK(baseName(out, scene, rounded) == "RoundedRectangle_10");
        CHECK(baseName(out, scene, ellipse) == "Ellipse_2p5");
        CHECK(baseName(out, scene, canvas) == "Geometry");
    }

    SECTION("Brushes")
    {
        knNodeId const solid = scene.add(knObjectType::ColorBrush);
        scene.edit(solid).color = {.a = 0xff, .r = 0x00, .g = 0x00, .b = 0xff};

        knNodeId const animation = scene.add(knObjectType::ColorKeyFrameAnimation);
        scene.edit(animation).animation.keyFrames = scene.keyFrames({
            {.progress = 0.f, .color = {.a = 0xff, .r = 0xff, .g = 0xff, .b = 0xff}},
            {.progress = 1.f, .color = {.a = 0xff, .r = 0x00, .g = 0x00, .b = 0x00}},
        });

        knNodeId const animated = scene.add(knObjectType::ColorBrush);
        scene.edit(animated).animators = scene.animators({{.property = scene.intern("Color"), .animation = animation}});

        CHECK(baseName(out, scene, solid) == "ColorBrush_Blue");
        CHECK(baseName(out, scene, animation) == "ColorAnimation_White_to_Black");
        CHECK(baseName(out, scene, animated) == "AnimatedColorBrush_White_to_Black");
    }

    SECTION("Animations")
    {
        knNodeId const scalar = scene.add(knObjectType::ScalarKeyFrameAnimation);
        scene.edit(scalar).animation.keyFrames = scene.keyFrames({
            {.progress = 0.f, .scalar = 0.f},
            {.progress = 1.f, .scalar = 360.f},
        });

        knNodeId const expressionEnd = scene.add(knObjectType::ScalarKeyFrameAnimation);
        scene.edit(expressionEnd).animation.keyFrames = scene.keyFrames({
            {.progress = 0.f, .scalar = 0.f},
            {.progress = 1.f, .kind = knKeyFrameKind::Expression, .expression = scene.intern("_.Width")},
        });

        knNodeId const typed = scene.add(knObjectType::ExpressionAnimation);
        scene.edit(typed).animation.expressionType = scene.intern("Progress");
        knNodeId const untyped = scene.add(knObjectType::ExpressionAnimation);

        CHECK(baseName(out, scene, scalar) == "ScalarAnimation_0_to_360");
        CHECK(baseName(out, scene, expressionEnd) == "ScalarAnimation");
        CHECK(baseName(out, scene, typed) == "ProgressExpressionAnimation");
        CHECK(baseName(out, scene, untyped) == "ExpressionAnimation");
    }
}
