// kiln

#include "instantiator.hh"

#include "assert.hh"
#include "naming.hh"
#include "utility.hh"

#include <algorithm>

namespace kiln {
    void knInstantiator::writeNode(CompiledNode const& node)
    {
        knObject const& obj = graph_->object(node.nodeId);

        switch (node.type)
        {
        case knObjectType::Invalid:
        case knObjectType::AnimationController:
        case knObjectType::PropertySet: error(knGenerateErrorCode::UnknownObjectType, node.nodeId); return;
        case knObjectType::ColorBrush: generateColorBrushFactory(obj, node); return;
        case knObjectType::ContainerShape: generateContainerShapeFactory(obj, node); return;
        case knObjectType::SpriteShape: generateSpriteShapeFactory(obj, node); return;
        case knObjectType::ViewBox: generateViewBoxFactory(obj, node); return;
        case knObjectType::ContainerVisual: generateContainerVisualFactory(obj, node); return;
        case knObjectType::ShapeVisual: generateShapeVisualFactory(obj, node); return;
        case knObjectType::InsetClip: generateInsetClipFactory(obj, node); return;
        case knObjectType::EllipseGeometry: generateEllipseGeometryFactory(obj, node); return;
        case knObjectType::PathGeometry: generatePathGeometryFactory(obj, node); return;
        case knObjectType::RectangleGeometry: generateRectangleGeometryFactory(obj, node); return;
        case knObjectType::RoundedRectangleGeometry: generateRoundedRectangleGeometryFactory(obj, node); return;
        case knObjectType::CubicBezierEasingFunction: generateCubicBezierEasingFunctionFactory(obj, node); return;
        case knObjectType::LinearEasingFunction: generateLinearEasingFunctionFactory(obj, node); return;
        case knObjectType::StepEasingFunction: generateStepEasingFunctionFactory(obj, node); return;
        case knObjectType::ExpressionAnimation: generateExpressionAnimationFactory(obj, node); return;
        case knObjectType::ColorKeyFrameAnimation: generateKeyFrameAnimationFactory(obj, node, "CreateColorKeyFrameAnimation"); return;
        case knObjectType::PathKeyFrameAnimation: generateKeyFrameAnimationFactory(obj, node, "CreatePathKeyFrameAnimation"); return;
        case knObjectType::ScalarKeyFrameAnimation: generateKeyFrameAnimationFactory(obj, node, "CreateScalarKeyFrameAnimation"); return;
        case knObjectType::Vector2KeyFrameAnimation: generateKeyFrameAnimationFactory(obj, node, "CreateVector2KeyFrameAnimation"); return;
        case knObjectType::Vector3KeyFrameAnimation: generateKeyFrameAnimationFactory(obj, node, "CreateVector3KeyFrameAnimation"); return;
        case knObjectType::Path: generatePathFactory(obj, node); return;
        case knObjectType::CanvasGeometryCombination:
        case knObjectType::CanvasGeometryEllipse:
        case knObjectType::CanvasGeometryPath:
        case knObjectType::CanvasGeometryRoundedRectangle: generateCanvasGeometryFactory(obj, node); return;
        }

        error(knGenerateErrorCode::UnknownObjectType, node.nodeId);
    }

    void knInstantiator::generateCanvasGeometryFactory(knObject const& obj, CompiledNode const& node)
    {
        knStringBuilder const type = typeName(node);
        knName const fieldName = node.requiresStorage ? node.fieldName.name() : knName{};

        writeObjectFactoryStart(node);
        switch (obj.type)
        {
        case knObjectType::CanvasGeometryCombination:
        {
            knStringBuilder const geometryA = reference(node.nodeId, obj.canvas.a);
            knStringBuilder const geometryB = reference(node.nodeId, obj.canvas.b);
            classWriter_.writeGeometryCombinationFactory(code_, obj, type.name(), fieldName, geometryA.name(), geometryB.name());
            break;
        }
        case knObjectType::CanvasGeometryEllipse: classWriter_.writeGeometryEllipseFactory(code_, obj, type.name(), fieldName); break;
        case knObjectType::CanvasGeometryPath: classWriter_.writeGeometryPathFactory(code_, obj, type.name(), fieldName); break;
        case knObjectType::CanvasGeometryRoundedRectangle:
            classWriter_.writeGeometryRoundedRectangleFactory(code_, obj, type.name(), fieldName);
            break;
        default: KN_ASSERT(false, "Not a canvas geometry"); break;
        }
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateColorBrushFactory(knObject const& obj, CompiledNode const& node)
    {
        knStringBuilder create(allocator_);
        create.format("_c{}CreateColorBrush({})", deref(), literal(obj.color));

        bool const hasComment = options_.setCommentProperties && !knIsNameBlank(obj.comment);
        bool const hasProperties = !obj.properties.scalars.empty() || !obj.properties.vector2s.empty();
        bool const isAnimated = !obj.animators.empty() || !obj.properties.animators.empty();
        if (!hasComment && !hasProperties && !isAnimated)
        {
            writeSimpleObjectFactory(node, create);
            return;
        }

        writeObjectFactoryStart(node);
        writeCreateAssignment(node, create);
        initializeObject(obj);
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateContainerShapeFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateContainerShape"));
        initializeShape(obj);
        if (!obj.shape.shapes.empty())
        {
            code_.line("{} shapes = result{}Shapes;", var(), deref());
            for (knNodeId const shape : obj.shape.shapes)
                code_.line("shapes{}{}({});", deref(), stringifier_.listAdd(), reference(node.nodeId, shape));
        }
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateContainerVisualFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateContainerVisual"));
        initializeContainerVisual(obj, node);
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateCubicBezierEasingFunctionFactory(knObject const& obj, CompiledNode const& node)
    {
        knStringBuilder create(allocator_);
        create.format("_c{}CreateCubicBezierEasingFunction({}, {})",
            deref(),
            literal(obj.easing.controlPoint1),
            literal(obj.easing.controlPoint2));
        writeSimpleObjectFactory(node, create);
    }

    void knInstantiator::generateEllipseGeometryFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateEllipseGeometry"));
        initializeGeometry(obj);
        if (obj.geometry.center != knVector2{})
            code_.line("result{}Center = {};", deref(), literal(obj.geometry.center));
        if (obj.geometry.radius != knVector2{})
            code_.line("result{}Radius = {};", deref(), literal(obj.geometry.radius));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateExpressionAnimationFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateExpressionAnimation"));
        initializeAnimation(obj, node);
        code_.line("result{}Expression = {};", deref(), quoted(obj.animation.expression));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateInsetClipFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateInsetClip"));
        initializeClip(obj);
        if (obj.clip.leftInset != 0.f)
            code_.line("result{}LeftInset = {};", deref(), literal(obj.clip.leftInset));
        if (obj.clip.rightInset != 0.f)
            code_.line("result{}RightInset = {};", deref(), literal(obj.clip.rightInset));
        if (obj.clip.topInset != 0.f)
            code_.line("result{}TopInset = {};", deref(), literal(obj.clip.topInset));
        if (obj.clip.bottomInset != 0.f)
            code_.line("result{}BottomInset = {};", deref(), literal(obj.clip.bottomInset));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateKeyFrameAnimationFactory(knObject const& obj, CompiledNode const& node, char const* createMethod)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall(createMethod));
        initializeAnimation(obj, node);
        code_.line("result{}Duration = {};", deref(), literal(obj.animation.duration));
        writeKeyFrames(obj, node);
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateLinearEasingFunctionFactory(knObject const& obj, CompiledNode const& node)
    {
        writeSimpleObjectFactory(node, createCall("CreateLinearEasingFunction"));
    }

    void knInstantiator::generatePathFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);

        knStringBuilder const source = reference(node.nodeId, obj.source);
        knStringBuilder sourceCall(allocator_);
        stringifier_.writeFactoryCall(sourceCall, source.name());

        knStringBuilder create(allocator_);
        create.format("{} CompositionPath({})", stringifier_.newKeyword(), sourceCall);
        writeCreateAssignment(node, create);
        writeObjectFactoryEnd();
    }

    void knInstantiator::generatePathGeometryFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);

        knStringBuilder create(allocator_);
        create.format("_c{}CreatePathGeometry({})", deref(), reference(node.nodeId, obj.geometry.path));
        writeCreateAssignment(node, create);
        initializeGeometry(obj);
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateRectangleGeometryFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateRectangleGeometry"));
        initializeGeometry(obj);
        if (obj.geometry.size != knVector2{})
            code_.line("result{}Size = {};", deref(), literal(obj.geometry.size));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateRoundedRectangleGeometryFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateRoundedRectangleGeometry"));
        initializeGeometry(obj);
        if (obj.geometry.cornerRadius != knVector2{})
            code_.line("result{}CornerRadius = {};", deref(), literal(obj.geometry.cornerRadius));
        if (obj.geometry.size != knVector2{})
            code_.line("result{}Size = {};", deref(), literal(obj.geometry.size));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateShapeVisualFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateShapeVisual"));
        initializeContainerVisual(obj, node);
        if (!obj.shape.shapes.empty())
        {
            code_.line("{} shapes = result{}Shapes;", var(), deref());
            for (knNodeId const shape : obj.shape.shapes)
            {
                if (shape.value() < graph_->nodeCount())
                    code_.writeComment(knNameView(graph_->object(shape).shortDescription));
                code_.line("shapes{}{}({});", deref(), stringifier_.listAdd(), reference(node.nodeId, shape));
            }
        }
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateSpriteShapeFactory(knObject const& obj, CompiledNode const& node)
    {
        knSpriteShapeData const& sprite = obj.sprite;

        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateSpriteShape"));
        initializeShape(obj);

        if (sprite.fillBrush != knInvalidNodeId)
            code_.line("result{}FillBrush = {};", deref(), reference(node.nodeId, sprite.fillBrush));
        if (sprite.geometry != knInvalidNodeId)
            code_.line("result{}Geometry = {};", deref(), reference(node.nodeId, sprite.geometry));
        if (sprite.isStrokeNonScaling)
            code_.line("result{}IsStrokeNonScaling = {};", deref(), literal(true));
        if (sprite.strokeBrush != knInvalidNodeId)
            code_.line("result{}StrokeBrush = {};", deref(), reference(node.nodeId, sprite.strokeBrush));
        if (sprite.strokeDashCap != knStrokeCap::Flat)
            code_.line("result{}StrokeDashCap = {};", deref(), strokeCap(sprite.strokeDashCap));
        if (sprite.strokeDashOffset != 0.f)
            code_.line("result{}StrokeDashOffset = {};", deref(), literal(sprite.strokeDashOffset));
        if (!sprite.strokeDashArray.empty())
        {
            code_.line("{} strokeDashArray = result{}StrokeDashArray;", var(), deref());
            for (float const dash : sprite.strokeDashArray)
                code_.line("strokeDashArray{}{}({});", deref(), stringifier_.listAdd(), literal(dash));
        }
        if (sprite.strokeEndCap != knStrokeCap::Flat)
            code_.line("result{}StrokeEndCap = {};", deref(), strokeCap(sprite.strokeEndCap));
        if (sprite.strokeLineJoin != knStrokeLineJoin::Miter)
            code_.line("result{}StrokeLineJoin = {};", deref(), strokeLineJoin(sprite.strokeLineJoin));
        if (sprite.strokeStartCap != knStrokeCap::Flat)
            code_.line("result{}StrokeStartCap = {};", deref(), strokeCap(sprite.strokeStartCap));
        if (sprite.strokeMiterLimit != 1.f)
            code_.line("result{}StrokeMiterLimit = {};", deref(), literal(sprite.strokeMiterLimit));
        if (sprite.strokeThickness != 1.f)
            code_.line("result{}StrokeThickness = {};", deref(), literal(sprite.strokeThickness));

        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateStepEasingFunctionFactory(knObject const& obj, CompiledNode const& node)
    {
        knEasingData const& easing = obj.easing;

        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateStepEasingFunction"));
        if (easing.finalStep != 1)
            code_.line("result{}FinalStep = {};", deref(), literal(easing.finalStep));
        if (easing.initialStep != 0)
            code_.line("result{}InitialStep = {};", deref(), literal(easing.initialStep));
        if (easing.isFinalStepSingleFrame)
            code_.line("result{}IsFinalStepSingleFrame = {};", deref(), literal(true));
        if (easing.isInitialStepSingleFrame)
            code_.line("result{}IsInitialStepSingleFrame = {};", deref(), literal(true));
        if (easing.stepCount != 1)
            code_.line("result{}StepCount = {};", deref(), literal(easing.stepCount));
        writeObjectFactoryEnd();
    }

    void knInstantiator::generateViewBoxFactory(knObject const& obj, CompiledNode const& node)
    {
        writeObjectFactoryStart(node);
        writeCreateAssignment(node, createCall("CreateViewBox"));
        initializeObject(obj);
        if (obj.geometry.size != knVector2{})
            code_.line("result{}Size = {};", deref(), literal(obj.geometry.size));
        startAnimations(obj, node.nodeId, node, "result");
        writeObjectFactoryEnd();
    }

    void knInstantiator::initializeObject(knObject const& obj)
    {
        if (options_.setCommentProperties && !knIsNameBlank(obj.comment))
            code_.line("result{}Comment = {};", deref(), quoted(obj.comment));

        knPropertySet const& properties = obj.properties;
        if (properties.scalars.empty() && properties.vector2s.empty())
            return;

        code_.line("{} propertySet = result{}Properties;", var(), deref());
        for (knScalarProperty const& property : properties.scalars)
            code_.line("propertySet{}InsertScalar({}, {});", deref(), quoted(property.name), literal(property.value));
        for (knVector2Property const& property : properties.vector2s)
            code_.line("propertySet{}InsertVector2({}, {});", deref(), quoted(property.name), literal(property.value));
    }

    void knInstantiator::initializeVisual(knObject const& obj, CompiledNode const& node)
    {
        knVisualData const& visual = obj.visual;

        initializeObject(obj);
        if (visual.centerPoint)
            code_.line("result{}CenterPoint = {};", deref(), literal(*visual.centerPoint));
        if (visual.clip != knInvalidNodeId)
            code_.line("result{}Clip = {};", deref(), reference(node.nodeId, visual.clip));
        if (visual.offset)
            code_.line("result{}Offset = {};", deref(), literal(*visual.offset));
        if (visual.rotationAngleInDegrees)
            code_.line("result{}RotationAngleInDegrees = {};", deref(), literal(*visual.rotationAngleInDegrees));
        if (visual.scale)
            code_.line("result{}Scale = {};", deref(), literal(*visual.scale));
        if (visual.size)
            code_.line("result{}Size = {};", deref(), literal(*visual.size));
    }

    void knInstantiator::initializeContainerVisual(knObject const& obj, CompiledNode const& node)
    {
        initializeVisual(obj, node);

        if (obj.visual.children.empty())
            return;

        code_.line("{} children = result{}Children;", var(), deref());
        for (knNodeId const child : obj.visual.children)
            code_.line("children{}InsertAtTop({});", deref(), reference(node.nodeId, child));
    }

    void knInstantiator::initializeShape(knObject const& obj)
    {
        knShapeData const& shape = obj.shape;

        initializeObject(obj);
        if (shape.centerPoint)
            code_.line("result{}CenterPoint = {};", deref(), literal(*shape.centerPoint));
        if (shape.offset)
            code_.line("result{}Offset = {};", deref(), literal(*shape.offset));
        if (shape.rotationAngleInDegrees)
            code_.line("result{}RotationAngleInDegrees = {};", deref(), literal(*shape.rotationAngleInDegrees));
        if (shape.scale)
            code_.line("result{}Scale = {};", deref(), literal(*shape.scale));
    }

    void knInstantiator::initializeGeometry(knObject const& obj)
    {
        knGeometryData const& geometry = obj.geometry;

        initializeObject(obj);
        if (geometry.trimEnd != 1.f)
            code_.line("result{}TrimEnd = {};", deref(), literal(geometry.trimEnd));
        if (geometry.trimOffset != 0.f)
            code_.line("result{}TrimOffset = {};", deref(), literal(geometry.trimOffset));
        if (geometry.trimStart != 0.f)
            code_.line("result{}TrimStart = {};", deref(), literal(geometry.trimStart));
    }

    void knInstantiator::initializeClip(knObject const& obj)
    {
        initializeObject(obj);
        if (obj.clip.centerPoint != knVector2{})
            code_.line("result{}CenterPoint = {};", deref(), literal(obj.clip.centerPoint));
        if (obj.clip.scale != knVector2{1.f, 1.f})
            code_.line("result{}Scale = {};", deref(), literal(obj.clip.scale));
    }

    void knInstantiator::initializeAnimation(knObject const& obj, CompiledNode const& node)
    {
        initializeObject(obj);
        if (!knIsNameBlank(obj.animation.target))
            code_.line("result{}Target = {};", deref(), quoted(obj.animation.target));
        for (knReferenceParameter const& parameter : obj.animation.referenceParameters)
            code_.line("result{}SetReferenceParameter({}, {});", deref(), quoted(parameter.key), reference(node.nodeId, parameter.value));
    }

    void knInstantiator::writeKeyFrames(knObject const& obj, CompiledNode const& node)
    {
        for (knKeyFrame const& keyFrame : obj.animation.keyFrames)
        {
            if (keyFrame.kind == knKeyFrameKind::Expression)
            {
                knStringBuilder const expression = quoted(keyFrame.expression);
                knStringBuilder easing(allocator_);
                if (keyFrame.easing != knInvalidNodeId)
                    easing.format(", {}", reference(node.nodeId, keyFrame.easing));
                code_.line("result{}InsertExpressionKeyFrame({}, {}{});", deref(), literal(keyFrame.progress), expression, easing);
                continue;
            }

            knStringBuilder value(allocator_);
            switch (obj.type)
            {
            case knObjectType::ColorKeyFrameAnimation:
            {
                knStringBuilder colorName(allocator_);
                knAppendColorName(colorName, keyFrame.color);
                code_.writeComment(colorName.view());
                stringifier_.writeColor(value, keyFrame.color);
                break;
            }
            case knObjectType::PathKeyFrameAnimation: value = reference(node.nodeId, keyFrame.path); break;
            case knObjectType::ScalarKeyFrameAnimation: stringifier_.writeFloat(value, keyFrame.scalar); break;
            case knObjectType::Vector2KeyFrameAnimation: stringifier_.writeVector2(value, keyFrame.vector2); break;
            case knObjectType::Vector3KeyFrameAnimation: stringifier_.writeVector3(value, keyFrame.vector3); break;
            default: KN_ASSERT(false, "Not a keyframe animation"); break;
            }

            // the value is resolved before the easing so direct calls follow construction order
            knStringBuilder easing(allocator_);
            if (keyFrame.easing != knInvalidNodeId)
                easing.format(", {}", reference(node.nodeId, keyFrame.easing));
            code_.line("result{}InsertKeyFrame({}, {}{});", deref(), literal(keyFrame.progress), value, easing);
        }
    }

    void knInstantiator::startAnimations(knObject const& obj, knNodeId objId, CompiledNode const& node, char const* localName, uint32_t controllerDepth)
    {
        // each nesting depth gets its own local: controller, controller2, controller3, ...
        knStringBuilder controllerName(allocator_);
        controllerName.append("controller");
        if (controllerDepth != 0)
            controllerName.format("{}", controllerDepth + 1);

        knSpan<knAnimator const> const animatorLists[] = {obj.properties.animators, obj.animators};
        for (knSpan<knAnimator const> const& animators : animatorLists)
        {
            for (knAnimator const& animator : animators)
            {
                if (animator.animation.value() >= graph_->nodeCount())
                {
                    error(knGenerateErrorCode::ReferenceNotGenerated, node.nodeId, animator.animation);
                    continue;
                }

                knStringBuilder const property = quoted(animator.property);
                knNodeId const animationId = graph_->canonical(animator.animation);
                knObject const& animation = graph_->object(animationId);

                // unshared expressions are set up on the reusable animation instead of getting a factory
                if (animation.type == knObjectType::ExpressionAnimation && graph_->groupSize(animationId) == 1)
                {
                    code_.line("{}{}ClearAllParameters();", reusableExpressionAnimationName, deref());
                    code_.line("{}{}Expression = {};", reusableExpressionAnimationName, deref(), quoted(animation.animation.expression));
                    if (!knIsNameBlank(animation.animation.target))
                        code_.line("{}{}Target = {};", reusableExpressionAnimationName, deref(), quoted(animation.animation.target));

                    for (knReferenceParameter const& parameter : animation.animation.referenceParameters)
                    {
                        knStringBuilder value(allocator_);
                        if (parameter.value.value() < graph_->nodeCount() && graph_->canonical(parameter.value) == graph_->canonical(objId))
                            value.append(localName);
                        else
                            value = reference(animationId, parameter.value);

                        code_.line("{}{}SetReferenceParameter({}, {});", reusableExpressionAnimationName, deref(), quoted(parameter.key), value);
                    }

                    code_.line("{}{}StartAnimation({}, {});", localName, deref(), property, reusableExpressionAnimationName);
                }
                else
                {
                    code_.line("{}{}StartAnimation({}, {});", localName, deref(), property, reference(node.nodeId, animator.animation));
                }

                if (animator.controller == knInvalidNodeId)
                    continue;

                if (animator.controller.value() >= graph_->nodeCount())
                {
                    error(knGenerateErrorCode::ReferenceNotGenerated, node.nodeId, animator.controller);
                    continue;
                }

                if (controllersDeclared_ <= controllerDepth)
                {
                    code_.line("{} {} = {}{}TryGetAnimationController({});", var(), controllerName, localName, deref(), property);
                    controllersDeclared_ = controllerDepth + 1;
                }
                else
                {
                    code_.line("{} = {}{}TryGetAnimationController({});", controllerName, localName, deref(), property);
                }
                code_.line("{}{}Pause();", controllerName, deref());

                startAnimations(graph_->object(animator.controller), animator.controller, node, controllerName.cStr(), controllerDepth + 1);
            }
        }
    }

    void knInstantiator::writeLongComment(CompiledNode const& node)
    {
        // single-parent chain with short descriptions, nearest first
        knArray<knNodeId> ancestors(allocator_);
        knNodeId current = node.nodeId;
        for (uint32_t step = 0; step != graph_->nodeCount(); ++step)
        {
            // a parent using the node more than once is still the only parent
            knSpan<knNodeId const> const parents = graph_->inboundReferences(current);
            if (parents.empty() || knIsNameBlank(graph_->object(parents[0]).shortDescription))
                break;
            if (std::any_of(parents.begin(), parents.end(), [&](knNodeId parent) { return parent != parents[0]; }))
                break;

            ancestors.pushBack(parents[0]);
            current = parents[0];
        }

        knStringBuilder comment(allocator_);
        uint32_t indent = 0;
        for (uint32_t index = ancestors.size(); index != 0; --index)
        {
            for (uint32_t column = 0; column != indent; ++column)
                comment.append(' ');
            comment.append(graph_->object(ancestors[index - 1]).shortDescription);
            comment.append('\n');
            indent += 2;
        }
        comment.append(graph_->object(node.nodeId).longDescription);

        code_.writeComment(comment.view());
    }

    void knInstantiator::writeObjectFactoryStart(CompiledNode const& node)
    {
        writeLongComment(node);
        code_.line("{} {}()", typeName(node), node.name);
        code_.openScope();
        controllersDeclared_ = 0;
    }

    void knInstantiator::writeObjectFactoryEnd()
    {
        code_.writeLine("return result;");
        code_.closeScope();
        code_.writeLine();
    }

    void knInstantiator::writeCreateAssignment(CompiledNode const& node, knStringBuilder const& create)
    {
        if (node.requiresStorage)
            code_.line("{} result = {} = {};", var(), node.fieldName, create);
        else
            code_.line("{} result = {};", var(), create);
    }

    void knInstantiator::writeSimpleObjectFactory(CompiledNode const& node, knStringBuilder const& create)
    {
        writeLongComment(node);
        code_.line("{} {}()", typeName(node), node.name);
        code_.openScope();
        if (node.requiresStorage)
            code_.line("return {} = {};", node.fieldName, create);
        else
            code_.line("return {};", create);
        code_.closeScope();
        code_.writeLine();
    }

    knStringBuilder knInstantiator::createCall(char const* method)
    {
        knStringBuilder result(allocator_);
        result.format("_c{}{}()", deref(), method);
        return result;
    }

    knStringBuilder knInstantiator::typeName(CompiledNode const& node)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeReferenceTypeName(result, knName{knObjectTypeName(node.type)});
        return result;
    }

    knStringBuilder knInstantiator::quoted(knName value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeString(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(bool value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeBool(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(int32_t value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeInt32(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(float value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeFloat(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(knVector2 value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeVector2(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(knVector3 value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeVector3(result, value);
        return result;
    }

    knStringBuilder knInstantiator::literal(knColor value)
    {
        knStringBuilder result(allocator_);
        stringifier_.writeColor(result, value);
        return result;
    }

    // the composition duration is written through its ticks constant
    knStringBuilder knInstantiator::literal(knTimeSpan value)
    {
        knStringBuilder result(allocator_);
        if (value == options_.duration)
            stringifier_.writeTimeSpan(result, knName{durationTicksName});
        else
            stringifier_.writeTimeSpan(result, value);
        return result;
    }

    knStringBuilder knInstantiator::strokeCap(knStrokeCap value)
    {
        char const* name = "Flat";
        switch (value)
        {
        case knStrokeCap::Flat: name = "Flat"; break;
        case knStrokeCap::Square: name = "Square"; break;
        case knStrokeCap::Round: name = "Round"; break;
        case knStrokeCap::Triangle: name = "Triangle"; break;
        }

        knStringBuilder result(allocator_);
        result.format("CompositionStrokeCap{}{}", stringifier_.scopeResolve(), name);
        return result;
    }

    knStringBuilder knInstantiator::strokeLineJoin(knStrokeLineJoin value)
    {
        char const* name = "Miter";
        switch (value)
        {
        case knStrokeLineJoin::Miter: name = "Miter"; break;
        case knStrokeLineJoin::Bevel: name = "Bevel"; break;
        case knStrokeLineJoin::Round: name = "Round"; break;
        case knStrokeLineJoin::MiterOrBevel: name = "MiterOrBevel"; break;
        }

        knStringBuilder result(allocator_);
        result.format("CompositionStrokeLineJoin{}{}", stringifier_.scopeResolve(), name);
        return result;
    }
} // namespace kiln
