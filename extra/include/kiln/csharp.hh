// kiln

#pragma once

#include "kiln/alloc.hh"
#include "kiln/class_writer.hh"
#include "kiln/export.hh"
#include "kiln/stringifier.hh"

namespace kiln {
    // C# tokens and literals, as consumed by Windows.UI.Composition
    class knCSharpStringifier final : public knStringifier
    {
    public:
        char const* deref() const noexcept override { return "."; }
        char const* newKeyword() const noexcept override { return "new"; }
        char const* null() const noexcept override { return "null"; }
        char const* scopeResolve() const noexcept override { return "."; }
        char const* var() const noexcept override { return "var"; }
        char const* readonly() const noexcept override { return "readonly"; }
        char const* listAdd() const noexcept override { return "Add"; }
        char const* int64TypeName() const noexcept override { return "long"; }

        KN_EXTRA_API void writeBool(knStringBuilder& out, bool value) const override;
        KN_EXTRA_API void writeInt32(knStringBuilder& out, int32_t value) const override;
        KN_EXTRA_API void writeInt64(knStringBuilder& out, int64_t value) const override;
        KN_EXTRA_API void writeFloat(knStringBuilder& out, float value) const override;
        KN_EXTRA_API void writeVector2(knStringBuilder& out, knVector2 value) const override;
        KN_EXTRA_API void writeVector3(knStringBuilder& out, knVector3 value) const override;
        KN_EXTRA_API void writeMatrix3x2(knStringBuilder& out, knMatrix3x2 const& value) const override;
        KN_EXTRA_API void writeColor(knStringBuilder& out, knColor value) const override;
        KN_EXTRA_API void writeTimeSpan(knStringBuilder& out, knTimeSpan value) const override;
        KN_EXTRA_API void writeTimeSpan(knStringBuilder& out, knName ticksName) const override;
        KN_EXTRA_API void writeString(knStringBuilder& out, knName value) const override;
        KN_EXTRA_API void writeReferenceTypeName(knStringBuilder& out, knName typeName) const override;
        KN_EXTRA_API void writeFactoryCall(knStringBuilder& out, knName call) const override;
    };

    // Wraps the generated factories in an IAnimatedVisualSource class and writes Win2D
    // geometry bodies.
    class knCSharpClassWriter final : public knClassWriter
    {
    public:
        explicit knCSharpClassWriter(knAllocator& alloc, knName namespaceName) noexcept : allocator_(alloc), namespace_(namespaceName) {}

        knCSharpStringifier const& stringifier() const noexcept { return stringifier_; }

        KN_EXTRA_API void writePreamble(knCodeBuilder& builder, bool requiresGeometryLibrary) override;
        KN_EXTRA_API void writeClassStart(knCodeBuilder& builder,
            knName className,
            knVector2 size,
            knPropertySet const* progressPropertySet,
            knTimeSpan duration) override;
        KN_EXTRA_API void writeClassEnd(knCodeBuilder& builder, knCompiledNodeInfo const& root, knName reusableExpressionAnimationField) override;

        KN_EXTRA_API void writeGeometryCombinationFactory(
            knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName, knName geometryA, knName geometryB) override;
        KN_EXTRA_API void writeGeometryEllipseFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) override;
        KN_EXTRA_API void writeGeometryPathFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) override;
        KN_EXTRA_API void writeGeometryRoundedRectangleFactory(
            knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) override;

    private:
        // "field = " when the geometry is cached, nothing otherwise
        knStringBuilder fieldAssignment(knName fieldName);
        knStringBuilder literal(float value);
        knStringBuilder literal(knVector2 value);

        knAllocator& allocator_;
        knName namespace_;
        knCSharpStringifier stringifier_;
        knVector2 size_;
        knPropertySet const* progressPropertySet_ = nullptr;
    };
} // namespace kiln
