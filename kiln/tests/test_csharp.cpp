// kiln

#include <catch2/catch_test_macros.hpp>

#include "kiln/code_builder.hh"
#include "kiln/csharp.hh"
#include "kiln/string_builder.hh"

#include "leak_alloc.hh"

using namespace kiln;

TEST_CASE("C# literals", "[csharp]")
{
    test::LeakTestAllocator alloc;
    knCSharpStringifier stringifier;
    knStringBuilder out(alloc);

    SECTION("Numbers")
    {
        stringifier.writeFloat(out, 2.f);
        CHECK(out.view() == "2");

        out.clear();
        stringifier.writeFloat(out, 0.5f);
        CHECK(out.view() == "0.5F");

        out.clear();
        stringifier.writeFloat(out, -2.25f);
        CHECK(out.view() == "-2.25F");

        out.clear();
        stringifier.writeFloat(out, -0.f);
        CHECK(out.view() == "0");

        out.clear();
        stringifier.writeInt32(out, -7);
        CHECK(out.view() == "-7");

        out.clear();
        stringifier.writeInt64(out, 10000000);
        CHECK(out.view() == "10000000L");

        out.clear();
        stringifier.writeBool(out, false);
        CHECK(out.view() == "false");
    }

    SECTION("Vectors and matrices")
    {
        stringifier.writeVector2(out, knVector2{1.f, 0.5f});
        CHECK(out.view() == "new Vector2(1, 0.5F)");

        out.clear();
        stringifier.writeVector3(out, knVector3{1.f, 2.f, 3.f});
        CHECK(out.view() == "new Vector3(1, 2, 3)");

        out.clear();
        stringifier.writeMatrix3x2(out, knMatrix3x2{});
        CHECK(out.view() == "new Matrix3x2(1, 0, 0, 1, 0, 0)");
    }

    SECTION("Colors and times")
    {
        stringifier.writeColor(out, knColor{.a = 0xff, .r = 0xff, .g = 0xa5, .b = 0x00});
        CHECK(out.view() == "Color.FromArgb(0xFF, 0xFF, 0xA5, 0x00)");

        out.clear();
        stringifier.writeTimeSpan(out, knMilliseconds(1));
        CHECK(out.view() == "TimeSpan.FromTicks(10000)");

        out.clear();
        stringifier.writeTimeSpan(out, knName{"c_durationTicks"});
        CHECK(out.view() == "TimeSpan.FromTicks(c_durationTicks)");
    }

    SECTION("Strings are escaped")
    {
        stringifier.writeString(out, knName{"say \"hi\""});
        CHECK(out.view() == "\"say \\\"hi\\\"\"");

        out.clear();
        stringifier.writeString(out, knName{});
        CHECK(out.view() == "\"\"");
    }
}

TEST_CASE("C# geometry factories", "[csharp]")
{
    test::LeakTestAllocator alloc;
    knCSharpClassWriter writer(alloc, knName{"Tests"});
    knCodeBuilder code(alloc);
    knObject obj;

    SECTION("Rounded rectangle cached in a field")
    {
        obj.type = knObjectType::CanvasGeometryRoundedRectangle;
        obj.canvas.x = -10.f;
        obj.canvas.y = -5.f;
        obj.canvas.width = 20.f;
        obj.canvas.height = 10.f;
        obj.canvas.radiusX = 2.f;
        obj.canvas.radiusY = 2.f;

        writer.writeGeometryRoundedRectangleFactory(code, obj, knName{"CanvasGeometry"}, knName{"_geometry"});
        CHECK(code.view() ==
              "CanvasGeometry result = _geometry = CanvasGeometry.CreateRoundedRectangle(\n"
              "    null,\n"
              "    -10, -5, 20, 10, 2, 2);\n");
    }

    SECTION("Combination")
    {
        obj.type = knObjectType::CanvasGeometryCombination;
        obj.canvas.combine = knGeometryCombine::Xor;

        writer.writeGeometryCombinationFactory(code, obj, knName{"CanvasGeometry"}, knName{}, knName{"Geometry_000()"}, knName{"_geometry_001"});
        CHECK(code.view() ==
              "CanvasGeometry result = Geometry_000().\n"
              "    CombineWith(_geometry_001,\n"
              "    new Matrix3x2(1, 0, 0, 1, 0, 0),\n"
              "    CanvasGeometryCombine.Xor);\n");
    }

    SECTION("Path with winding fill")
    {
        knPathCommand const commands[] = {
            {.type = knPathCommandType::BeginFigure, .point0 = {0.f, 0.f}},
            {.type = knPathCommandType::AddLine, .point0 = {1.f, 0.f}},
            {.type = knPathCommandType::EndFigure, .loop = knFigureLoop::Open},
        };
        obj.type = knObjectType::CanvasGeometryPath;
        obj.canvas.commands = commands;
        obj.canvas.filledRegionDetermination = knFilledRegionDetermination::Winding;

        writer.writeGeometryPathFactory(code, obj, knName{"CanvasGeometry"}, knName{});
        CHECK(code.view() ==
              "CanvasGeometry result;\n"
              "using (var builder = new CanvasPathBuilder(null))\n"
              "{\n"
              "    builder.SetFilledRegionDetermination(CanvasFilledRegionDetermination.Winding);\n"
              "    builder.BeginFigure(new Vector2(0, 0));\n"
              "    builder.AddLine(new Vector2(1, 0));\n"
              "    builder.EndFigure(CanvasFigureLoop.Open);\n"
              "    result = CanvasGeometry.CreatePath(builder);\n"
              "}\n");
    }
}

TEST_CASE("C# class shell", "[csharp]")
{
    test::LeakTestAllocator alloc;
    knCSharpClassWriter writer(alloc, knName{"Tests"});
    knCodeBuilder code(alloc);

    knScalarProperty const scalars[] = {{.name = knName{"Progress"}, .value = 0.f}};
    knPropertySet progress;
    progress.scalars = scalars;

    knCompiledNodeInfo root;
    root.name = knName{"Root"};

    writer.writePreamble(code, false);
    writer.writeClassStart(code, knName{"Spinner"}, knVector2{64.f, 32.f}, &progress, knMilliseconds(1500));
    writer.writeClassEnd(code, root, knName{"_reusableExpressionAnimation"});

    std::string_view const text = code.view();
    CHECK(text.find("using Microsoft.Graphics.Canvas.Geometry;") == std::string_view::npos);
    CHECK(text.find("namespace Tests\n{\n") != std::string_view::npos);
    CHECK(text.find("    // Duration:   1500 mS\n") != std::string_view::npos);
    CHECK(text.find("    sealed class Spinner : IAnimatedVisualSource\n") != std::string_view::npos);
    CHECK(text.find("                _reusableExpressionAnimation = compositor.CreateExpressionAnimation();\n") != std::string_view::npos);
    CHECK(text.find("                _rootVisual = Root();\n") != std::string_view::npos);
    CHECK(text.find("                propertySet.InsertScalar(\"Progress\", 0);\n") != std::string_view::npos);
    CHECK(text.find("            Vector2 IAnimatedVisual.Size => new Vector2(64, 32);\n") != std::string_view::npos);
    CHECK(code.indent() == 0);
    CHECK(text.substr(text.size() - 2) == "}\n");
}
