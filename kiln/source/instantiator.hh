// kiln

#pragma once

#include "kiln/alloc.hh"
#include "kiln/class_writer.hh"
#include "kiln/code_builder.hh"
#include "kiln/code_generator.hh"
#include "kiln/graph_view.hh"
#include "kiln/object.hh"
#include "kiln/string_builder.hh"
#include "kiln/stringifier.hh"

#include "array.hh"
#include "index.hh"

#include <cstdint>

namespace kiln {
    class knInstantiator final : public knCodeGenerator
    {
    public:
        explicit knInstantiator(knAllocator& alloc, knStringifier const& stringifier, knClassWriter& classWriter) noexcept
            : allocator_(alloc), stringifier_(stringifier), classWriter_(classWriter), nodes_(alloc), order_(alloc), nodeLookup_(alloc),
              factoriesCalled_(alloc), errors_(alloc), code_(alloc)
        {
        }

        void reset() override;

        bool generate(knSceneGraphView const& graph, knGenerateOptions const& options) override;

        uint32_t getErrorCount() const noexcept override { return errors_.size(); }
        knGenerateError getError(uint32_t index) const noexcept override;

        uint32_t getNodeCount() const noexcept override { return order_.size(); }
        knCompiledNodeInfo getNode(uint32_t index) const noexcept override;
        bool findNode(knNodeId nodeId, knCompiledNodeInfo& out_info) const noexcept override;

        char const* text() const noexcept override { return code_.data(); }
        uint32_t textSize() const noexcept override { return code_.size(); }

        knAllocator& allocator() noexcept { return allocator_; }

    private:
        KN_DEFINE_INDEX(CompiledIndex);

        static constexpr char durationTicksName[] = "c_durationTicks";
        static constexpr char reusableExpressionAnimationName[] = "_reusableExpressionAnimation";

        struct CompiledNode
        {
            explicit CompiledNode(knAllocator& alloc) noexcept : name(alloc), fieldName(alloc), inlineCall(alloc) {}

            knNodeId nodeId = knInvalidNodeId;
            knObjectType type = knObjectType::Invalid;

            knStringBuilder name;
            knStringBuilder fieldName;
            // replaces the factory call when the node is inlined
            knStringBuilder inlineCall;

            uint64_t baseNameHash = 0;
            uint32_t preorder = 0;
            bool requiresStorage = false;
            bool inlined = false;
        };

        // a direct factory call already emitted from caller to callee
        struct FactoryCall
        {
            knNodeId caller = knInvalidNodeId;
            knNodeId callee = knInvalidNodeId;
        };

        // annotation
        bool annotate();
        void collectNodes();
        void assignNames();
        uint32_t filteredInboundCount(CompiledNode const& node) const noexcept;
        bool animatesExpression(knObject const& obj, knName expression) const noexcept;
        void inlinePaths();

        // reference resolution
        knStringBuilder reference(knNodeId callerId, knNodeId calleeId);
        CompiledIndex lookup(knNodeId nodeId) const noexcept;

        // unit assembly
        void assemble();
        void writeField(knName typeName, knName fieldName, bool readonly);

        // variant emitters
        void writeNode(CompiledNode const& node);

        void generateCanvasGeometryFactory(knObject const& obj, CompiledNode const& node);
        void generateColorBrushFactory(knObject const& obj, CompiledNode const& node);
        void generateContainerShapeFactory(knObject const& obj, CompiledNode const& node);
        void generateContainerVisualFactory(knObject const& obj, CompiledNode const& node);
        void generateCubicBezierEasingFunctionFactory(knObject const& obj, CompiledNode const& node);
        void generateEllipseGeometryFactory(knObject const& obj, CompiledNode const& node);
        void generateExpressionAnimationFactory(knObject const& obj, CompiledNode const& node);
        void generateInsetClipFactory(knObject const& obj, CompiledNode const& node);
        void generateKeyFrameAnimationFactory(knObject const& obj, CompiledNode const& node, char const* createMethod);
        void generateLinearEasingFunctionFactory(knObject const& obj, CompiledNode const& node);
        void generatePathFactory(knObject const& obj, CompiledNode const& node);
        void generatePathGeometryFactory(knObject const& obj, CompiledNode const& node);
        void generateRectangleGeometryFactory(knObject const& obj, CompiledNode const& node);
        void generateRoundedRectangleGeometryFactory(knObject const& obj, CompiledNode const& node);
        void generateShapeVisualFactory(knObject const& obj, CompiledNode const& node);
        void generateSpriteShapeFactory(knObject const& obj, CompiledNode const& node);
        void generateStepEasingFunctionFactory(knObject const& obj, CompiledNode const& node);
        void generateViewBoxFactory(knObject const& obj, CompiledNode const& node);

        void initializeObject(knObject const& obj);
        void initializeVisual(knObject const& obj, CompiledNode const& node);
        void initializeContainerVisual(knObject const& obj, CompiledNode const& node);
        void initializeShape(knObject const& obj);
        void initializeGeometry(knObject const& obj);
        void initializeClip(knObject const& obj);
        void initializeAnimation(knObject const& obj, CompiledNode const& node);
        void writeKeyFrames(knObject const& obj, CompiledNode const& node);

        // animation binding
        void startAnimations(knObject const& obj, knNodeId objId, CompiledNode const& node, char const* localName, uint32_t controllerDepth = 0);

        void writeLongComment(CompiledNode const& node);
        void writeObjectFactoryStart(CompiledNode const& node);
        void writeObjectFactoryEnd();
        void writeCreateAssignment(CompiledNode const& node, knStringBuilder const& create);
        void writeSimpleObjectFactory(CompiledNode const& node, knStringBuilder const& create);

        // literals and tokens
        knStringBuilder createCall(char const* method);
        knStringBuilder typeName(CompiledNode const& node);
        knStringBuilder quoted(knName value);
        knStringBuilder literal(bool value);
        knStringBuilder literal(int32_t value);
        knStringBuilder literal(float value);
        knStringBuilder literal(knVector2 value);
        knStringBuilder literal(knVector3 value);
        knStringBuilder literal(knColor value);
        knStringBuilder literal(knTimeSpan value);
        knStringBuilder strokeCap(knStrokeCap value);
        knStringBuilder strokeLineJoin(knStrokeLineJoin value);

        char const* deref() const noexcept { return stringifier_.deref(); }
        char const* var() const noexcept { return stringifier_.var(); }

        knCompiledNodeInfo info(CompiledNode const& node) const noexcept;

        // return false, for convenience
        bool error(knGenerateErrorCode code, knNodeId nodeId, knNodeId referenceId = knInvalidNodeId);

        knAllocator& allocator_;
        knStringifier const& stringifier_;
        knClassWriter& classWriter_;
        knSceneGraphView const* graph_ = nullptr;
        knGenerateOptions options_;
        knArray<CompiledNode, CompiledIndex> nodes_;
        knArray<CompiledIndex> order_;
        knArray<CompiledIndex> nodeLookup_;
        knArray<FactoryCall> factoriesCalled_;
        knArray<knGenerateError> errors_;
        knCodeBuilder code_;
        CompiledIndex rootIndex_ = knInvalidIndex;
        // controller locals declared so far in the factory being written, one per nesting depth
        uint32_t controllersDeclared_ = 0;
    };
} // namespace kiln
