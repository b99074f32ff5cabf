// kiln

#include "kiln/csharp.hh"

#include <fmt/format.h>

#include <cmath>
#include <string>

namespace kiln {
    namespace {
        bool isEmpty(knName name) noexcept
        {
            if (name.name == nullptr)
                return true;
            return name.nameEnd != nullptr ? name.nameEnd == name.name : name.name[0] == '\0';
        }

        char const* combineName(knGeometryCombine combine) noexcept
        {
            switch (combine)
            {
            case knGeometryCombine::Union: return "Union";
            case knGeometryCombine::Exclude: return "Exclude";
            case knGeometryCombine::Intersect: return "Intersect";
            case knGeometryCombine::Xor: return "Xor";
            }
            return "Union";
        }
    } // namespace

    void knCSharpStringifier::writeBool(knStringBuilder& out, bool value) const { out.append(value ? "true" : "false"); }

    void knCSharpStringifier::writeInt32(knStringBuilder& out, int32_t value) const { out.format("{}", value); }

    void knCSharpStringifier::writeInt64(knStringBuilder& out, int64_t value) const { out.format("{}L", value); }

    // integral values are written bare, everything else as a float literal with 9 significant digits
    void knCSharpStringifier::writeFloat(knStringBuilder& out, float value) const
    {
        if (value == 0.f)
            out.append('0');
        else if (std::floor(value) == value)
            out.format("{:.0f}", value);
        else
            out.format("{:.9g}F", value);
    }

    void knCSharpStringifier::writeVector2(knStringBuilder& out, knVector2 value) const
    {
        out.append("new Vector2(");
        writeFloat(out, value.x);
        out.append(", ");
        writeFloat(out, value.y);
        out.append(')');
    }

    void knCSharpStringifier::writeVector3(knStringBuilder& out, knVector3 value) const
    {
        out.append("new Vector3(");
        writeFloat(out, value.x);
        out.append(", ");
        writeFloat(out, value.y);
        out.append(", ");
        writeFloat(out, value.z);
        out.append(')');
    }

    void knCSharpStringifier::writeMatrix3x2(knStringBuilder& out, knMatrix3x2 const& value) const
    {
        float const elements[] = {value.m11, value.m12, value.m21, value.m22, value.m31, value.m32};

        out.append("new Matrix3x2(");
        for (float const& element : elements)
        {
            if (&element != elements)
                out.append(", ");
            writeFloat(out, element);
        }
        out.append(')');
    }

    void knCSharpStringifier::writeColor(knStringBuilder& out, knColor value) const
    {
        out.format("Color.FromArgb(0x{:02X}, 0x{:02X}, 0x{:02X}, 0x{:02X})", value.a, value.r, value.g, value.b);
    }

    void knCSharpStringifier::writeTimeSpan(knStringBuilder& out, knTimeSpan value) const
    {
        out.format("TimeSpan.FromTicks({})", value.ticks);
    }

    void knCSharpStringifier::writeTimeSpan(knStringBuilder& out, knName ticksName) const
    {
        out.format("TimeSpan.FromTicks({})", ticksName);
    }

    void knCSharpStringifier::writeString(knStringBuilder& out, knName value) const
    {
        out.append('"');
        if (value.name != nullptr)
        {
            char const* const end = value.nameEnd != nullptr ? value.nameEnd : value.name + std::char_traits<char>::length(value.name);
            for (char const* c = value.name; c != end; ++c)
            {
                if (*c == '"' || *c == '\\')
                    out.append('\\');
                out.append(*c);
            }
        }
        out.append('"');
    }

    void knCSharpStringifier::writeReferenceTypeName(knStringBuilder& out, knName typeName) const { out.append(typeName); }

    void knCSharpStringifier::writeFactoryCall(knStringBuilder& out, knName call) const { out.append(call); }

    void knCSharpClassWriter::writePreamble(knCodeBuilder& builder, bool requiresGeometryLibrary)
    {
        if (requiresGeometryLibrary)
            builder.writeLine("using Microsoft.Graphics.Canvas.Geometry;");
        builder.writeLine("using Microsoft.UI.Xaml.Controls;");
        builder.writeLine("using System;");
        builder.writeLine("using System.Numerics;");
        builder.writeLine("using Windows.UI;");
        builder.writeLine("using Windows.UI.Composition;");
        builder.writeLine();
    }

    void knCSharpClassWriter::writeClassStart(
        knCodeBuilder& builder, knName className, knVector2 size, knPropertySet const* progressPropertySet, knTimeSpan duration)
    {
        size_ = size;
        progressPropertySet_ = progressPropertySet;

        builder.line("namespace {}", namespace_);
        builder.openScope();

        knStringBuilder width(allocator_);
        knStringBuilder height(allocator_);
        stringifier_.writeFloat(width, size.x);
        stringifier_.writeFloat(height, size.y);

        builder.line("// Frame size: {} x {}", width, height);
        builder.line("// Duration:   {} mS", duration.ticks / 10'000);
        builder.line("sealed class {} : IAnimatedVisualSource", className);
        builder.openScope();

        builder.writeLine("public IAnimatedVisual TryCreateAnimatedVisual(Compositor compositor, out object diagnostics)");
        builder.openScope();
        builder.writeLine("diagnostics = null;");
        builder.writeLine("return new AnimatedVisual(compositor);");
        builder.closeScope();
        builder.writeLine();

        builder.writeLine("sealed class AnimatedVisual : IAnimatedVisual");
        builder.openScope();
    }

    void knCSharpClassWriter::writeClassEnd(knCodeBuilder& builder, knCompiledNodeInfo const& root, knName reusableExpressionAnimationField)
    {
        builder.writeLine("internal AnimatedVisual(Compositor compositor)");
        builder.openScope();
        builder.writeLine("_c = compositor;");
        builder.line("{} = compositor.CreateExpressionAnimation();", reusableExpressionAnimationField);
        builder.line("_rootVisual = {}();", root.name);

        if (progressPropertySet_ != nullptr &&
            (!progressPropertySet_->scalars.empty() || !progressPropertySet_->vector2s.empty()))
        {
            builder.writeLine("var propertySet = _rootVisual.Properties;");
            for (knScalarProperty const& property : progressPropertySet_->scalars)
            {
                knStringBuilder name(allocator_);
                stringifier_.writeString(name, property.name);
                builder.line("propertySet.InsertScalar({}, {});", name, literal(property.value));
            }
            for (knVector2Property const& property : progressPropertySet_->vector2s)
            {
                knStringBuilder name(allocator_);
                stringifier_.writeString(name, property.name);
                builder.line("propertySet.InsertVector2({}, {});", name, literal(property.value));
            }
        }
        builder.closeScope();
        builder.writeLine();

        builder.writeLine("readonly Visual _rootVisual;");
        builder.writeLine();
        builder.writeLine("Visual IAnimatedVisual.RootVisual => _rootVisual;");
        builder.writeLine("TimeSpan IAnimatedVisual.Duration => TimeSpan.FromTicks(c_durationTicks);");
        builder.line("Vector2 IAnimatedVisual.Size => {};", literal(size_));
        builder.writeLine("void IDisposable.Dispose() => _rootVisual?.Dispose();");

        // AnimatedVisual, the source class and the namespace
        builder.closeScope();
        builder.closeScope();
        builder.closeScope();
    }

    void knCSharpClassWriter::writeGeometryCombinationFactory(
        knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName, knName geometryA, knName geometryB)
    {
        knStringBuilder matrix(allocator_);
        stringifier_.writeMatrix3x2(matrix, obj.canvas.matrix);

        builder.line("{} result = {}{}.", typeName, fieldAssignment(fieldName), geometryA);
        builder.line("    CombineWith({},", geometryB);
        builder.line("    {},", matrix);
        builder.line("    CanvasGeometryCombine.{});", combineName(obj.canvas.combine));
    }

    void knCSharpClassWriter::writeGeometryEllipseFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName)
    {
        knCanvasGeometryData const& canvas = obj.canvas;
        builder.line("{} result = {}{}.CreateEllipse(", typeName, fieldAssignment(fieldName), typeName);
        builder.line("    null,");
        builder.line("    {}, {}, {}, {});", literal(canvas.x), literal(canvas.y), literal(canvas.radiusX), literal(canvas.radiusY));
    }

    void knCSharpClassWriter::writeGeometryPathFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName)
    {
        knCanvasGeometryData const& canvas = obj.canvas;

        builder.line("{} result;", typeName);
        builder.writeLine("using (var builder = new CanvasPathBuilder(null))");
        builder.openScope();
        if (canvas.filledRegionDetermination != knFilledRegionDetermination::Alternate)
            builder.writeLine("builder.SetFilledRegionDetermination(CanvasFilledRegionDetermination.Winding);");

        for (knPathCommand const& command : canvas.commands)
        {
            switch (command.type)
            {
            case knPathCommandType::BeginFigure: builder.line("builder.BeginFigure({});", literal(command.point0)); break;
            case knPathCommandType::AddLine: builder.line("builder.AddLine({});", literal(command.point0)); break;
            case knPathCommandType::AddCubicBezier:
                builder.line("builder.AddCubicBezier({}, {}, {});", literal(command.point0), literal(command.point1), literal(command.point2));
                break;
            case knPathCommandType::EndFigure:
                builder.line("builder.EndFigure(CanvasFigureLoop.{});", command.loop == knFigureLoop::Closed ? "Closed" : "Open");
                break;
            }
        }

        builder.line("result = {}{}.CreatePath(builder);", fieldAssignment(fieldName), typeName);
        builder.closeScope();
    }

    void knCSharpClassWriter::writeGeometryRoundedRectangleFactory(
        knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName)
    {
        knCanvasGeometryData const& canvas = obj.canvas;
        builder.line("{} result = {}{}.CreateRoundedRectangle(", typeName, fieldAssignment(fieldName), typeName);
        builder.line("    null,");
        builder.line("    {}, {}, {}, {}, {}, {});",
            literal(canvas.x),
            literal(canvas.y),
            literal(canvas.width),
            literal(canvas.height),
            literal(canvas.radiusX),
            literal(canvas.radiusY));
    }

    knStringBuilder knCSharpClassWriter::fieldAssignment(knName fieldName)
    {
        knStringBuilder result(allocator_);
        if (!isEmpty(fieldName))
            result.format("{} = ", fieldName);
        return result;
    }

    knStringBuilder knCSharpClassWriter::literal(float value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeFloat(result, value);
        return result;
    }

    knStringBuilder knCSharpClassWriter::literal(knVector2 value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeVector2(result, value);
        return result;
    }
} // namespace kiln
