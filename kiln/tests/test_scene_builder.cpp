// kiln

#include <catch2/catch_test_macros.hpp>

#include "kiln/scene_builder.hh"

using namespace kiln;

TEST_CASE("Scene builder", "[scene]")
{
    knSceneBuilder scene;

    knNodeId const root = scene.add(knObjectType::ShapeVisual);
    knNodeId const first = scene.add(knObjectType::SpriteShape);
    knNodeId const second = scene.add(knObjectType::SpriteShape);
    knNodeId const red = scene.add(knObjectType::ColorBrush);
    knNodeId const otherRed = scene.add(knObjectType::ColorBrush);
    knNodeId const geometry = scene.add(knObjectType::EllipseGeometry);

    scene.setRoot(root);
    scene.edit(root).shape.shapes = scene.nodes({first, second});
    scene.edit(first).sprite.fillBrush = red;
    scene.edit(first).sprite.geometry = geometry;
    scene.edit(second).sprite.fillBrush = otherRed;

    SECTION("Singleton groups")
    {
        scene.link();

        CHECK(scene.nodeCount() == 6);
        CHECK(scene.root() == root);
        CHECK(scene.canonical(otherRed) == otherRed);
        CHECK(scene.groupSize(red) == 1);
        CHECK(scene.inboundReferences(root).empty());
        CHECK(scene.inboundReferences(red).count == 1);
    }

    SECTION("Grouped nodes share references")
    {
        scene.setCanonical(otherRed, red);
        scene.link();

        CHECK(scene.canonical(otherRed) == red);
        CHECK(scene.groupSize(red) == 2);
        CHECK(scene.groupSize(otherRed) == 2);

        knSpan<knNodeId const> const inbound = scene.inboundReferences(red);
        REQUIRE(inbound.count == 2);
        CHECK(inbound[0] == first);
        CHECK(inbound[1] == second);
    }

    SECTION("Every use is an inbound reference")
    {
        scene.edit(first).sprite.strokeBrush = red;
        scene.setCanonical(otherRed, red);
        scene.link();

        knSpan<knNodeId const> const inbound = scene.inboundReferences(red);
        REQUIRE(inbound.count == 3);
        CHECK(inbound[0] == first);
        CHECK(inbound[1] == first);
        CHECK(inbound[2] == second);
    }

    SECTION("Only representatives refer")
    {
        scene.setCanonical(otherRed, red);
        scene.setCanonical(second, first);
        scene.link();

        REQUIRE(scene.inboundReferences(red).count == 1);
        CHECK(scene.inboundReferences(red)[0] == first);
        CHECK(scene.inboundReferences(first).count == 2);
    }

    SECTION("Construction order follows reference order")
    {
        scene.setCanonical(otherRed, red);
        scene.link();

        CHECK(scene.preorderPosition(root) == 0);
        CHECK(scene.preorderPosition(first) == 1);
        CHECK(scene.preorderPosition(red) == 2);
        CHECK(scene.preorderPosition(geometry) == 3);
        CHECK(scene.preorderPosition(second) == 4);
        CHECK(scene.preorderPosition(otherRed) == 2);
    }

    SECTION("Unreachable nodes come last")
    {
        knNodeId const orphan = scene.add(knObjectType::LinearEasingFunction);
        scene.link();

        CHECK(scene.preorderPosition(orphan) == 6);
    }

    SECTION("Animators are visited after owned references")
    {
        knNodeId const animation = scene.add(knObjectType::ScalarKeyFrameAnimation);
        knNodeId const controller = scene.add(knObjectType::AnimationController);
        knNodeId const progress = scene.add(knObjectType::ExpressionAnimation);

        scene.edit(progress).animation.referenceParameters = scene.parameters({{.key = scene.intern("_"), .value = root}});
        scene.edit(controller).animators = scene.animators({{.property = scene.intern("Progress"), .animation = progress}});
        scene.edit(second).animators =
            scene.animators({{.property = scene.intern("Offset"), .animation = animation, .controller = controller}});
        scene.link();

        CHECK(scene.preorderPosition(otherRed) == 5);
        CHECK(scene.preorderPosition(animation) == 6);
        CHECK(scene.preorderPosition(controller) == 7);
        CHECK(scene.preorderPosition(progress) == 8);

        REQUIRE(scene.inboundReferences(root).count == 1);
        CHECK(scene.inboundReferences(root)[0] == progress);
    }

    SECTION("Interned text is stable")
    {
        knName const name = scene.intern("Progress");
        for (int index = 0; index != 100; ++index)
            scene.intern("filler");

        CHECK(std::string_view(name.name, name.nameEnd - name.name) == "Progress");
    }
}
