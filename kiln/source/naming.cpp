// kiln

#include "naming.hh"

#include "kiln/graph_view.hh"

#include "utility.hh"

#include <fmt/format.h>

#include <cctype>
#include <cstring>

namespace kiln {
    namespace {
        struct KnownColor
        {
            knColor color;
            char const* name = nullptr;
        };

        static constexpr KnownColor knownColors[] = {
            {{.a = 0x00, .r = 0xff, .g = 0xff, .b = 0xff}, "Transparent"},
            {{.a = 0xff, .r = 0x00, .g = 0x00, .b = 0x00}, "Black"},
            {{.a = 0xff, .r = 0xff, .g = 0xff, .b = 0xff}, "White"},
            {{.a = 0xff, .r = 0xff, .g = 0x00, .b = 0x00}, "Red"},
            {{.a = 0xff, .r = 0x00, .g = 0xff, .b = 0x00}, "Lime"},
            {{.a = 0xff, .r = 0x00, .g = 0x00, .b = 0xff}, "Blue"},
            {{.a = 0xff, .r = 0xff, .g = 0xff, .b = 0x00}, "Yellow"},
            {{.a = 0xff, .r = 0x00, .g = 0xff, .b = 0xff}, "Cyan"},
            {{.a = 0xff, .r = 0xff, .g = 0x00, .b = 0xff}, "Magenta"},
            {{.a = 0xff, .r = 0x80, .g = 0x80, .b = 0x80}, "Gray"},
            {{.a = 0xff, .r = 0xc0, .g = 0xc0, .b = 0xc0}, "Silver"},
            {{.a = 0xff, .r = 0x80, .g = 0x00, .b = 0x00}, "Maroon"},
            {{.a = 0xff, .r = 0x80, .g = 0x80, .b = 0x00}, "Olive"},
            {{.a = 0xff, .r = 0x00, .g = 0x80, .b = 0x00}, "Green"},
            {{.a = 0xff, .r = 0x80, .g = 0x00, .b = 0x80}, "Purple"},
            {{.a = 0xff, .r = 0x00, .g = 0x80, .b = 0x80}, "Teal"},
            {{.a = 0xff, .r = 0x00, .g = 0x00, .b = 0x80}, "Navy"},
            {{.a = 0xff, .r = 0xff, .g = 0xa5, .b = 0x00}, "Orange"},
        };

        static constexpr char compositionPrefix[] = "Composition";

        // first and last value keyframes of an animation, or nothing if either is an expression
        bool firstAndLastValues(knObject const& animation, knKeyFrame const*& out_first, knKeyFrame const*& out_last) noexcept
        {
            knSpan<knKeyFrame const> const& keyFrames = animation.animation.keyFrames;
            if (keyFrames.empty())
                return false;

            out_first = &keyFrames[0];
            out_last = &keyFrames[keyFrames.count - 1];
            return out_first->kind == knKeyFrameKind::Value && out_last->kind == knKeyFrameKind::Value;
        }

        void appendColorRange(knStringBuilder& out, knObject const& animation)
        {
            knKeyFrame const* first = nullptr;
            knKeyFrame const* last = nullptr;
            if (!firstAndLastValues(animation, first, last))
                return;

            out.append('_');
            knAppendColorName(out, first->color);
            out.append("_to_");
            knAppendColorName(out, last->color);
        }

        void appendScalarRange(knStringBuilder& out, knObject const& animation)
        {
            knKeyFrame const* first = nullptr;
            knKeyFrame const* last = nullptr;
            if (!firstAndLastValues(animation, first, last))
                return;

            out.append('_');
            knAppendFloatId(out, first->scalar);
            out.append("_to_");
            knAppendFloatId(out, last->scalar);
        }

        knObject const* findColorAnimation(knSceneGraphView const& graph, knSpan<knAnimator const> animators) noexcept
        {
            for (knAnimator const& animator : animators)
            {
                if (animator.animation.value() >= graph.nodeCount())
                    continue;
                knObject const& animation = graph.object(animator.animation);
                if (animation.type == knObjectType::ColorKeyFrameAnimation)
                    return &animation;
            }
            return nullptr;
        }

        void appendDescription(knStringBuilder& out, knSceneGraphView const& graph, knObject const& obj)
        {
            switch (obj.type)
            {
            case knObjectType::ColorKeyFrameAnimation:
                out.append("ColorAnimation");
                appendColorRange(out, obj);
                break;
            case knObjectType::ScalarKeyFrameAnimation:
                out.append("ScalarAnimation");
                appendScalarRange(out, obj);
                break;
            case knObjectType::Vector2KeyFrameAnimation: out.append("Vector2Animation"); break;
            case knObjectType::ColorBrush:
                if (!obj.animators.empty() || !obj.properties.animators.empty())
                {
                    out.append("AnimatedColorBrush");
                    knObject const* animation = findColorAnimation(graph, obj.animators);
                    if (animation == nullptr)
                        animation = findColorAnimation(graph, obj.properties.animators);
                    if (animation != nullptr)
                        appendColorRange(out, *animation);
                }
                else
                {
                    out.append("ColorBrush_");
                    knAppendColorName(out, obj.color);
                }
                break;
            case knObjectType::RectangleGeometry:
                out.append("Rectangle_");
                knAppendVector2Id(out, obj.geometry.size);
                break;
            case knObjectType::RoundedRectangleGeometry:
                out.append("RoundedRectangle_");
                knAppendVector2Id(out, obj.geometry.size);
                break;
            case knObjectType::EllipseGeometry:
                out.append("Ellipse_");
                knAppendVector2Id(out, obj.geometry.radius);
                break;
            case knObjectType::ExpressionAnimation:
                if (!knIsNameBlank(obj.animation.expressionType))
                    out.append(obj.animation.expressionType);
                out.append("ExpressionAnimation");
                break;
            case knObjectType::CanvasGeometryCombination:
            case knObjectType::CanvasGeometryEllipse:
            case knObjectType::CanvasGeometryPath:
            case knObjectType::CanvasGeometryRoundedRectangle: out.append("Geometry"); break;
            default: out.append(knObjectTypeName(obj.type)); break;
            }
        }
    } // namespace

    void knAppendFloatId(knStringBuilder& out, float value)
    {
        fmt::memory_buffer buffer;
        fmt::format_to(fmt::appender(buffer), "{:.3f}", value);

        char const* first = buffer.data();
        char const* last = buffer.data() + buffer.size();

        // only a decimal point is ever present, there is no exponent with a fixed format
        if (std::memchr(first, '.', last - first) != nullptr)
        {
            while (last != first && last[-1] == '0')
                --last;
            if (last != first && last[-1] == '.')
                --last;
        }

        if (last - first == 2 && first[0] == '-' && first[1] == '0')
            ++first;

        for (; first != last; ++first)
        {
            switch (*first)
            {
            case '.': out.append('p'); break;
            case '-': out.append('m'); break;
            default: out.append(*first); break;
            }
        }
    }

    void knAppendVector2Id(knStringBuilder& out, knVector2 value)
    {
        knAppendFloatId(out, value.x);
        if (value.x == value.y)
            return;
        out.append('x');
        knAppendFloatId(out, value.y);
    }

    void knAppendColorName(knStringBuilder& out, knColor color)
    {
        for (KnownColor const& known : knownColors)
        {
            if (known.color == color)
            {
                out.append(known.name);
                return;
            }
        }

        out.format("{:02X}{:02X}{:02X}{:02X}", color.a, color.r, color.g, color.b);
    }

    char const* knObjectTypeName(knObjectType type) noexcept
    {
        switch (type)
        {
        case knObjectType::Invalid: return "Invalid";
        case knObjectType::AnimationController: return "AnimationController";
        case knObjectType::PropertySet: return "CompositionPropertySet";
        case knObjectType::ColorBrush: return "CompositionColorBrush";
        case knObjectType::ContainerShape: return "CompositionContainerShape";
        case knObjectType::SpriteShape: return "CompositionSpriteShape";
        case knObjectType::ViewBox: return "CompositionViewBox";
        case knObjectType::ContainerVisual: return "ContainerVisual";
        case knObjectType::ShapeVisual: return "ShapeVisual";
        case knObjectType::InsetClip: return "InsetClip";
        case knObjectType::EllipseGeometry: return "CompositionEllipseGeometry";
        case knObjectType::PathGeometry: return "CompositionPathGeometry";
        case knObjectType::RectangleGeometry: return "CompositionRectangleGeometry";
        case knObjectType::RoundedRectangleGeometry: return "CompositionRoundedRectangleGeometry";
        case knObjectType::CubicBezierEasingFunction: return "CubicBezierEasingFunction";
        case knObjectType::LinearEasingFunction: return "LinearEasingFunction";
        case knObjectType::StepEasingFunction: return "StepEasingFunction";
        case knObjectType::ExpressionAnimation: return "ExpressionAnimation";
        case knObjectType::ColorKeyFrameAnimation: return "ColorKeyFrameAnimation";
        case knObjectType::PathKeyFrameAnimation: return "PathKeyFrameAnimation";
        case knObjectType::ScalarKeyFrameAnimation: return "ScalarKeyFrameAnimation";
        case knObjectType::Vector2KeyFrameAnimation: return "Vector2KeyFrameAnimation";
        case knObjectType::Vector3KeyFrameAnimation: return "Vector3KeyFrameAnimation";
        case knObjectType::Path: return "CompositionPath";
        case knObjectType::CanvasGeometryCombination:
        case knObjectType::CanvasGeometryEllipse:
        case knObjectType::CanvasGeometryPath:
        case knObjectType::CanvasGeometryRoundedRectangle: return "CanvasGeometry";
        }
        return "Invalid";
    }

    void knAppendBaseName(knStringBuilder& out, knSceneGraphView const& graph, knObject const& obj)
    {
        knStringBuilder description(out.allocator());
        appendDescription(description, graph, obj);

        knName name = description.name();
        if (knNameStartsWith(name, compositionPrefix))
            name.name += knCountOf(compositionPrefix) - 1;
        out.append(name);
    }

    void knAppendFieldName(knStringBuilder& out, knName name)
    {
        out.append('_');
        uint32_t const length = knNameLen(name);
        if (length == 0)
            return;

        out.append(static_cast<char>(std::tolower(static_cast<unsigned char>(name.name[0]))));
        out.append(name.name + 1, name.name + length);
    }
} // namespace kiln
