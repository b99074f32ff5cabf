// kiln

#include <kiln/alloc.hh>
#include <kiln/code_generator.hh>
#include <kiln/csharp.hh>
#include <kiln/scene_builder.hh>

#include <fmt/format.h>

#include <cstdio>
#include <string_view>

using namespace kiln;

namespace sample {
    class App
    {
    public:
        int run(int argc, char** argv);

    private:
        void buildScene();
        knNodeId addProgressAnimation(knNodeId target, char const* property);
        void printErrors(knCodeGenerator const& generator);

        knSceneBuilder scene_;
        knNodeId progressBinding_ = knInvalidNodeId;
        knPropertySet progressProperties_;
    };

    // a keyframe animation paused under a controller whose progress is bound to the root
    knNodeId App::addProgressAnimation(knNodeId target, char const* property)
    {
        knNodeId const easing = scene_.add(knObjectType::CubicBezierEasingFunction);
        scene_.edit(easing).easing.controlPoint1 = {0.167f, 0.167f};
        scene_.edit(easing).easing.controlPoint2 = {0.833f, 0.833f};

        knNodeId const animation = scene_.add(knObjectType::ScalarKeyFrameAnimation);
        {
            knObject& obj = scene_.edit(animation);
            obj.animation.duration = knMilliseconds(2000);
            obj.animation.keyFrames = scene_.keyFrames({
                {.progress = 0.f, .scalar = 0.f, .easing = easing},
                {.progress = 1.f, .scalar = 360.f, .easing = easing},
            });
        }

        knNodeId const controller = scene_.add(knObjectType::AnimationController);
        scene_.edit(controller).animators = scene_.animators({{.property = scene_.intern("Progress"), .animation = progressBinding_}});

        scene_.edit(target).animators = scene_.animators({{.property = scene_.intern(property), .animation = animation, .controller = controller}});
        return animation;
    }

    void App::buildScene()
    {
        knNodeId const root = scene_.add(knObjectType::ShapeVisual);
        scene_.setRoot(root);

        // the progress expression is shared by every controller, so it gets a cached factory
        progressBinding_ = scene_.add(knObjectType::ExpressionAnimation);
        knNodeId const progressCopy = scene_.add(knObjectType::ExpressionAnimation);
        for (knNodeId const id : {progressBinding_, progressCopy})
        {
            knObject& obj = scene_.edit(id);
            obj.animation.expression = scene_.intern("_.Progress");
            obj.animation.referenceParameters = scene_.parameters({{.key = scene_.intern("_"), .value = root}});
        }
        scene_.setCanonical(progressCopy, progressBinding_);

        progressProperties_.scalars = scene_.scalars({{.name = scene_.intern("Progress"), .value = 0.f}});

        knNodeId const sharedBrush = scene_.add(knObjectType::ColorBrush);
        scene_.edit(sharedBrush).color = {.a = 0xff, .r = 0x00, .g = 0x80, .b = 0x80};

        knNodeId const ellipse = scene_.add(knObjectType::EllipseGeometry);
        scene_.edit(ellipse).geometry.radius = {24.f, 24.f};

        knNodeId const circle = scene_.add(knObjectType::SpriteShape);
        {
            knObject& obj = scene_.edit(circle);
            obj.shortDescription = scene_.intern("Circle");
            obj.longDescription = scene_.intern("Circle\nfilled with teal");
            obj.sprite.fillBrush = sharedBrush;
            obj.sprite.geometry = ellipse;
            obj.shape.offset = knVector2{50.f, 50.f};
        }

        knNodeId const canvasRect = scene_.add(knObjectType::CanvasGeometryRoundedRectangle);
        {
            knObject& obj = scene_.edit(canvasRect);
            obj.canvas.x = -20.f;
            obj.canvas.y = -10.f;
            obj.canvas.width = 40.f;
            obj.canvas.height = 20.f;
            obj.canvas.radiusX = 4.f;
            obj.canvas.radiusY = 4.f;
        }

        knNodeId const path = scene_.add(knObjectType::Path);
        scene_.edit(path).source = canvasRect;

        knNodeId const pathGeometry = scene_.add(knObjectType::PathGeometry);
        scene_.edit(pathGeometry).geometry.path = path;

        knNodeId const strokeBrush = scene_.add(knObjectType::ColorBrush);
        scene_.edit(strokeBrush).color = {.a = 0xff, .r = 0xff, .g = 0xa5, .b = 0x00};

        knNodeId const bar = scene_.add(knObjectType::SpriteShape);
        {
            knObject& obj = scene_.edit(bar);
            obj.shortDescription = scene_.intern("Bar");
            obj.sprite.fillBrush = sharedBrush;
            obj.sprite.geometry = pathGeometry;
            obj.sprite.strokeBrush = strokeBrush;
            obj.sprite.strokeThickness = 2.f;
            obj.sprite.strokeLineJoin = knStrokeLineJoin::Round;
        }

        knNodeId const spinner = scene_.add(knObjectType::ContainerShape);
        {
            knObject& obj = scene_.edit(spinner);
            obj.shortDescription = scene_.intern("Spinner");
            obj.shape.centerPoint = knVector2{50.f, 50.f};
            obj.shape.shapes = scene_.nodes({bar});
        }
        addProgressAnimation(spinner, "RotationAngleInDegrees");

        knObject& rootObj = scene_.edit(root);
        rootObj.visual.size = knVector2{100.f, 100.f};
        rootObj.properties.scalars = progressProperties_.scalars;
        rootObj.shape.shapes = scene_.nodes({circle, spinner});

        scene_.link();
    }

    void App::printErrors(knCodeGenerator const& generator)
    {
        for (uint32_t index = 0; index != generator.getErrorCount(); ++index)
        {
            knGenerateError const error = generator.getError(index);
            fmt::print(stderr, "error: {} (node {}, reference {})\n", knGenerateErrorCodeName(error.code), error.nodeId.value(),
                error.referenceId.value());
        }
    }

    int App::run(int argc, char** argv)
    {
        char const* const className = argc > 1 ? argv[1] : "Spinner";

        buildScene();

        knDefaultAllocator alloc;
        knCSharpClassWriter classWriter(alloc, knName{"KilnSamples"});
        knCodeGenerator* const generator = knCreateCodeGenerator(alloc, classWriter.stringifier(), classWriter);

        knGenerateOptions options;
        options.className = knName{className};
        options.size = knVector2{100.f, 100.f};
        options.duration = knMilliseconds(2000);
        options.progressPropertySet = &progressProperties_;

        int result = 0;
        if (generator->generate(scene_, options))
            fmt::print("{}", std::string_view(generator->text(), generator->textSize()));
        else
        {
            printErrors(*generator);
            result = 1;
        }

        knDestroyCodeGenerator(generator);
        return result;
    }
} // namespace sample

int main(int argc, char** argv)
{
    sample::App app;
    return app.run(argc, argv);
}
