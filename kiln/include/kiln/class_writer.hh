// kiln

#pragma once

#include "kiln/code_builder.hh"
#include "kiln/generate_types.hh"
#include "kiln/object.hh"
#include "kiln/types.hh"

namespace kiln {
    // Writes the language-specific parts of a generated unit: the text around the class
    // and the bodies of drawing-library geometry factories.
    //
    // Geometry body writers are called between the factory signature and the final
    // "return result;". They must declare and assign a local named result. fieldName is
    // empty when the geometry has no storage; otherwise result must be stored in it too.
    class knClassWriter
    {
    public:
        virtual void writePreamble(knCodeBuilder& builder, bool requiresGeometryLibrary) = 0;
        virtual void writeClassStart(
            knCodeBuilder& builder, knName className, knVector2 size, knPropertySet const* progressPropertySet, knTimeSpan duration) = 0;
        virtual void writeClassEnd(knCodeBuilder& builder, knCompiledNodeInfo const& root, knName reusableExpressionAnimationField) = 0;

        // geometryA and geometryB are the expressions producing the combined geometries
        virtual void writeGeometryCombinationFactory(
            knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName, knName geometryA, knName geometryB) = 0;
        virtual void writeGeometryEllipseFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) = 0;
        virtual void writeGeometryPathFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) = 0;
        virtual void writeGeometryRoundedRectangleFactory(knCodeBuilder& builder, knObject const& obj, knName typeName, knName fieldName) = 0;

    protected:
        ~knClassWriter() = default;
    };
} // namespace kiln
