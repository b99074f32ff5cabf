// kiln

#pragma once

#include "kiln/export.hh"
#include "kiln/object.hh"
#include "kiln/string_builder.hh"
#include "kiln/types.hh"

namespace kiln {
    class knSceneGraphView;

    // a float for use in an identifier: at most 3 decimals, '.' as 'p' and '-' as 'm'
    KN_API void knAppendFloatId(knStringBuilder& out, float value);
    // "x" when both components match, otherwise "XxY"
    KN_API void knAppendVector2Id(knStringBuilder& out, knVector2 value);
    // well-known color name, or AARRGGBB
    KN_API void knAppendColorName(knStringBuilder& out, knColor color);

    // the composition type name used for signatures and fields, e.g. CompositionSpriteShape
    [[nodiscard]] KN_API char const* knObjectTypeName(knObjectType type) noexcept;

    // readable base name for a method, before uniquing and without the Composition prefix
    KN_API void knAppendBaseName(knStringBuilder& out, knSceneGraphView const& graph, knObject const& obj);

    // "_" followed by the name with its first character lowercased
    KN_API void knAppendFieldName(knStringBuilder& out, knName name);

    [[nodiscard]] constexpr bool knIsCanvasGeometry(knObjectType type) noexcept
    {
        switch (type)
        {
        case knObjectType::CanvasGeometryCombination:
        case knObjectType::CanvasGeometryEllipse:
        case knObjectType::CanvasGeometryPath:
        case knObjectType::CanvasGeometryRoundedRectangle: return true;
        default: return false;
        }
    }
} // namespace kiln
