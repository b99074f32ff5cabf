// kiln

#pragma once

#include "kiln/types.hh"

#include <cstdint>
#include <optional>

namespace kiln {
    enum class knObjectType : uint8_t
    {
        Invalid,

        // implicitly constructed by their owners, never compiled on their own
        AnimationController,
        PropertySet,

        // brushes
        ColorBrush,

        // shapes
        ContainerShape,
        SpriteShape,
        ViewBox,

        // visuals
        ContainerVisual,
        ShapeVisual,

        // clips
        InsetClip,

        // composition geometries
        EllipseGeometry,
        PathGeometry,
        RectangleGeometry,
        RoundedRectangleGeometry,

        // easing functions
        CubicBezierEasingFunction,
        LinearEasingFunction,
        StepEasingFunction,

        // animations
        ExpressionAnimation,
        ColorKeyFrameAnimation,
        PathKeyFrameAnimation,
        ScalarKeyFrameAnimation,
        Vector2KeyFrameAnimation,
        Vector3KeyFrameAnimation,

        // wraps a canvas geometry for use by a path geometry
        Path,

        // drawing-library geometries
        CanvasGeometryCombination,
        CanvasGeometryEllipse,
        CanvasGeometryPath,
        CanvasGeometryRoundedRectangle,
    };

    enum class knKeyFrameKind : uint8_t
    {
        Value,
        Expression,
    };

    // binds an animation to a property of the owning object
    struct knAnimator
    {
        knName property;
        knNodeId animation = knInvalidNodeId;
        knNodeId controller = knInvalidNodeId;
    };

    struct knReferenceParameter
    {
        knName key;
        knNodeId value = knInvalidNodeId;
    };

    struct knScalarProperty
    {
        knName name;
        float value = 0.f;
    };

    struct knVector2Property
    {
        knName name;
        knVector2 value;
    };

    // the implicit property bag every object carries
    struct knPropertySet
    {
        knSpan<knScalarProperty const> scalars;
        knSpan<knVector2Property const> vector2s;
        knSpan<knAnimator const> animators;
    };

    // only the member matching the animation's type is read for value keyframes
    struct knKeyFrame
    {
        float progress = 0.f;
        knKeyFrameKind kind = knKeyFrameKind::Value;
        float scalar = 0.f;
        knVector2 vector2;
        knVector3 vector3;
        knColor color;
        knNodeId path = knInvalidNodeId;
        knName expression;
        knNodeId easing = knInvalidNodeId;
    };

    enum class knPathCommandType : uint8_t
    {
        BeginFigure,
        AddLine,
        AddCubicBezier,
        EndFigure,
    };

    struct knPathCommand
    {
        knPathCommandType type = knPathCommandType::BeginFigure;
        knVector2 point0;
        knVector2 point1;
        knVector2 point2;
        knFigureLoop loop = knFigureLoop::Open;
    };

    struct knVisualData
    {
        std::optional<knVector3> centerPoint;
        std::optional<knVector3> offset;
        std::optional<float> rotationAngleInDegrees;
        std::optional<knVector3> scale;
        std::optional<knVector2> size;
        knNodeId clip = knInvalidNodeId;
        knSpan<knNodeId const> children;
    };

    struct knShapeData
    {
        std::optional<knVector2> centerPoint;
        std::optional<knVector2> offset;
        std::optional<float> rotationAngleInDegrees;
        std::optional<knVector2> scale;

        // ShapeVisual and ContainerShape
        knSpan<knNodeId const> shapes;
    };

    struct knSpriteShapeData
    {
        knNodeId fillBrush = knInvalidNodeId;
        knNodeId geometry = knInvalidNodeId;
        knNodeId strokeBrush = knInvalidNodeId;
        bool isStrokeNonScaling = false;
        knStrokeCap strokeDashCap = knStrokeCap::Flat;
        float strokeDashOffset = 0.f;
        knSpan<float const> strokeDashArray;
        knStrokeCap strokeEndCap = knStrokeCap::Flat;
        knStrokeLineJoin strokeLineJoin = knStrokeLineJoin::Miter;
        knStrokeCap strokeStartCap = knStrokeCap::Flat;
        float strokeMiterLimit = 1.f;
        float strokeThickness = 1.f;
    };

    struct knGeometryData
    {
        float trimEnd = 1.f;
        float trimOffset = 0.f;
        float trimStart = 0.f;

        // RectangleGeometry, RoundedRectangleGeometry and ViewBox
        knVector2 size;
        knVector2 cornerRadius;

        // EllipseGeometry
        knVector2 center;
        knVector2 radius;

        // PathGeometry
        knNodeId path = knInvalidNodeId;
    };

    struct knClipData
    {
        knVector2 centerPoint;
        knVector2 scale{1.f, 1.f};
        float leftInset = 0.f;
        float rightInset = 0.f;
        float topInset = 0.f;
        float bottomInset = 0.f;
    };

    struct knEasingData
    {
        knVector2 controlPoint1;
        knVector2 controlPoint2;
        int32_t finalStep = 1;
        int32_t initialStep = 0;
        bool isFinalStepSingleFrame = false;
        bool isInitialStepSingleFrame = false;
        int32_t stepCount = 1;
    };

    struct knAnimationData
    {
        knName target;
        knSpan<knReferenceParameter const> referenceParameters;

        // ExpressionAnimation
        knName expression;
        knName expressionType;

        // keyframe animations
        knTimeSpan duration;
        knSpan<knKeyFrame const> keyFrames;
    };

    struct knCanvasGeometryData
    {
        // CanvasGeometryEllipse and CanvasGeometryRoundedRectangle
        float x = 0.f;
        float y = 0.f;
        float width = 0.f;
        float height = 0.f;
        float radiusX = 0.f;
        float radiusY = 0.f;

        // CanvasGeometryCombination
        knNodeId a = knInvalidNodeId;
        knNodeId b = knInvalidNodeId;
        knMatrix3x2 matrix;
        knGeometryCombine combine = knGeometryCombine::Union;

        // CanvasGeometryPath
        knSpan<knPathCommand const> commands;
        knFilledRegionDetermination filledRegionDetermination = knFilledRegionDetermination::Alternate;
    };

    // one object of a scene graph; only the data matching the type is meaningful
    struct knObject
    {
        knObjectType type = knObjectType::Invalid;

        knName comment;
        knName shortDescription;
        knName longDescription;

        knPropertySet properties;
        knSpan<knAnimator const> animators;

        knColor color;
        knVisualData visual;
        knShapeData shape;
        knSpriteShapeData sprite;
        knGeometryData geometry;
        knClipData clip;
        knEasingData easing;
        knAnimationData animation;
        knCanvasGeometryData canvas;

        // Path
        knNodeId source = knInvalidNodeId;
    };
} // namespace kiln
