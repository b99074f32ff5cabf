// kiln

#include "instantiator.hh"

#include "kiln/alloc.hh"

#include "assert.hh"
#include "fnv.hh"
#include "naming.hh"
#include "utility.hh"

#include <algorithm>
#include <cstring>
#include <new>

namespace kiln {
    namespace {
        // ordinal byte comparison
        bool nameLess(knStringBuilder const& lhs, knStringBuilder const& rhs) noexcept
        {
            uint32_t const common = lhs.size() < rhs.size() ? lhs.size() : rhs.size();
            int const compare = common != 0 ? std::memcmp(lhs.data(), rhs.data(), common) : 0;
            return compare != 0 ? compare < 0 : lhs.size() < rhs.size();
        }
    } // namespace

    knCodeGenerator* knCreateCodeGenerator(knAllocator& alloc, knStringifier const& stringifier, knClassWriter& classWriter)
    {
        return new (alloc.allocate(sizeof(knInstantiator), alignof(knInstantiator))) knInstantiator(alloc, stringifier, classWriter);
    }

    void knDestroyCodeGenerator(knCodeGenerator* generator)
    {
        if (generator == nullptr)
            return;

        knInstantiator* const impl = static_cast<knInstantiator*>(generator);
        knAllocator& alloc = impl->allocator();
        impl->~knInstantiator();
        alloc.free(impl, sizeof(knInstantiator), alignof(knInstantiator));
    }

    char const* knGenerateErrorCodeName(knGenerateErrorCode code) noexcept
    {
        switch (code)
        {
        case knGenerateErrorCode::Unknown: return "Unknown";
        case knGenerateErrorCode::InvalidRoot: return "InvalidRoot";
        case knGenerateErrorCode::UnknownObjectType: return "UnknownObjectType";
        case knGenerateErrorCode::MissingStorage: return "MissingStorage";
        case knGenerateErrorCode::DuplicateFactoryCall: return "DuplicateFactoryCall";
        case knGenerateErrorCode::ReferenceNotGenerated: return "ReferenceNotGenerated";
        }
        return "Unknown";
    }

    void knInstantiator::reset()
    {
        graph_ = nullptr;
        options_ = knGenerateOptions{};
        nodes_.clear();
        order_.clear();
        nodeLookup_.clear();
        factoriesCalled_.clear();
        errors_.clear();
        code_.clear();
        rootIndex_ = knInvalidIndex;
        controllersDeclared_ = 0;
    }

    bool knInstantiator::generate(knSceneGraphView const& graph, knGenerateOptions const& options)
    {
        reset();

        graph_ = &graph;
        options_ = options;

        if (annotate())
            assemble();

        if (!errors_.empty())
        {
            code_.clear();
            return false;
        }

        return true;
    }

    knGenerateError knInstantiator::getError(uint32_t index) const noexcept
    {
        KN_GUARD_OR(index < errors_.size(), knGenerateError{});
        return errors_[index];
    }

    knCompiledNodeInfo knInstantiator::getNode(uint32_t index) const noexcept
    {
        KN_GUARD_OR(index < order_.size(), knCompiledNodeInfo{});
        return info(nodes_[order_[index]]);
    }

    bool knInstantiator::findNode(knNodeId nodeId, knCompiledNodeInfo& out_info) const noexcept
    {
        CompiledIndex const index = lookup(nodeId);
        if (index == knInvalidIndex)
            return false;

        out_info = info(nodes_[index]);
        return true;
    }

    knCompiledNodeInfo knInstantiator::info(CompiledNode const& node) const noexcept
    {
        return knCompiledNodeInfo{
            .nodeId = node.nodeId,
            .type = node.type,
            .name = node.name.name(),
            .fieldName = node.fieldName.name(),
            .preorderPosition = node.preorder,
            .requiresStorage = node.requiresStorage,
            .inlined = node.inlined,
        };
    }

    bool knInstantiator::error(knGenerateErrorCode code, knNodeId nodeId, knNodeId referenceId)
    {
        errors_.pushBack(knGenerateError{.code = code, .nodeId = nodeId, .referenceId = referenceId});
        return false;
    }

    auto knInstantiator::lookup(knNodeId nodeId) const noexcept -> CompiledIndex
    {
        if (!nodeLookup_.contains(nodeId.value()))
            return knInvalidIndex;
        return nodeLookup_[nodeId.value()];
    }

    bool knInstantiator::annotate()
    {
        knNodeId const root = graph_->root();
        if (root.value() >= graph_->nodeCount())
            return error(knGenerateErrorCode::InvalidRoot, root);

        collectNodes();
        if (!errors_.empty())
            return false;

        rootIndex_ = lookup(graph_->canonical(root));
        if (rootIndex_ == knInvalidIndex)
            return error(knGenerateErrorCode::InvalidRoot, root);

        assignNames();

        for (CompiledNode& node : nodes_)
            node.requiresStorage = filteredInboundCount(node) > 1;

        inlinePaths();

        // the entry point references the root too, which the graph does not count
        CompiledNode& rootNode = nodes_[rootIndex_];
        if (!graph_->inboundReferences(rootNode.nodeId).empty())
            rootNode.requiresStorage = true;

        order_.reserve(nodes_.size());
        for (auto&& [index, node] : knEnumerate(nodes_))
            order_.pushBack(CompiledIndex{index});
        std::sort(order_.begin(), order_.end(), [this](CompiledIndex lhs, CompiledIndex rhs) {
            return nameLess(nodes_[lhs].name, nodes_[rhs].name);
        });

        return errors_.empty();
    }

    void knInstantiator::collectNodes()
    {
        uint32_t const count = graph_->nodeCount();
        nodeLookup_.resize(count, CompiledIndex{knInvalidIndex});

        for (uint32_t id = 0; id != count; ++id)
        {
            knNodeId const nodeId{id};

            // unshared expression animations are initialized inline through the reusable animation
            if (graph_->object(nodeId).type == knObjectType::ExpressionAnimation && graph_->groupSize(nodeId) <= 1)
                continue;

            knNodeId const canonicalId = graph_->canonical(nodeId);
            if (nodeLookup_[canonicalId.value()] != knInvalidIndex)
                continue;

            knObject const& obj = graph_->object(canonicalId);
            switch (obj.type)
            {
            case knObjectType::Invalid: error(knGenerateErrorCode::UnknownObjectType, canonicalId); continue;
            case knObjectType::AnimationController:
            case knObjectType::PropertySet: continue;
            default: break;
            }

            nodeLookup_[canonicalId.value()] = CompiledIndex{nodes_.size()};

            CompiledNode& node = nodes_.emplaceBack(allocator_);
            node.nodeId = canonicalId;
            node.type = obj.type;
            node.preorder = graph_->preorderPosition(canonicalId);
        }
    }

    void knInstantiator::assignNames()
    {
        for (CompiledNode& node : nodes_)
        {
            knAppendBaseName(node.name, *graph_, graph_->object(node.nodeId));
            node.baseNameHash = knHashFnv1a64(node.name.name());
        }

        // nodes sharing a base name are numbered in the order they were first seen
        knArray<uint32_t> ordinals(allocator_);
        knArray<uint32_t> groupSizes(allocator_);
        ordinals.resize(nodes_.size(), 0);
        groupSizes.resize(nodes_.size(), 0);
        for (auto&& [index, node] : knEnumerate(nodes_))
        {
            for (auto&& [otherIndex, other] : knEnumerate(nodes_))
            {
                if (other.baseNameHash != node.baseNameHash || !knNameEqual(other.name.name(), node.name.name()))
                    continue;

                if (otherIndex < index)
                    ++ordinals[index];
                ++groupSizes[index];
            }
        }

        for (auto&& [index, node] : knEnumerate(nodes_))
        {
            if (groupSizes[index] > 1)
                node.name.format("_{:03}", ordinals[index]);
        }

        CompiledNode& rootNode = nodes_[rootIndex_];
        rootNode.name.clear();
        rootNode.name.append("Root");

        for (CompiledNode& node : nodes_)
            knAppendFieldName(node.fieldName, node.name.name());
    }

    uint32_t knInstantiator::filteredInboundCount(CompiledNode const& node) const noexcept
    {
        knObject const& obj = graph_->object(node.nodeId);

        uint32_t count = 0;
        for (knNodeId const referrerId : graph_->inboundReferences(node.nodeId))
        {
            // a unique expression animating this node refers to it through the local, not the field
            knObject const& referrer = graph_->object(referrerId);
            if (referrer.type == knObjectType::ExpressionAnimation && graph_->groupSize(referrerId) <= 1 &&
                animatesExpression(obj, referrer.animation.expression))
                continue;

            ++count;
        }
        return count;
    }

    bool knInstantiator::animatesExpression(knObject const& obj, knName expression) const noexcept
    {
        knSpan<knAnimator const> const animatorLists[] = {obj.animators, obj.properties.animators};
        for (knSpan<knAnimator const> const& animators : animatorLists)
        {
            for (knAnimator const& animator : animators)
            {
                if (animator.animation.value() >= graph_->nodeCount())
                    continue;

                knObject const& animation = graph_->object(animator.animation);
                if (animation.type == knObjectType::ExpressionAnimation && knNameEqual(animation.animation.expression, expression))
                    return true;
            }
        }
        return false;
    }

    void knInstantiator::inlinePaths()
    {
        for (auto&& [index, node] : knEnumerate(nodes_))
        {
            if (node.type != knObjectType::Path || CompiledIndex{index} == rootIndex_)
                continue;
            if (filteredInboundCount(node) > 1)
                continue;

            knStringBuilder const source = reference(node.nodeId, graph_->object(node.nodeId).source);
            knStringBuilder sourceCall(allocator_);
            stringifier_.writeFactoryCall(sourceCall, source.name());

            node.inlineCall.format("{} CompositionPath({})", stringifier_.newKeyword(), sourceCall);
            node.inlined = true;
            node.requiresStorage = false;
        }
    }

    knStringBuilder knInstantiator::reference(knNodeId callerId, knNodeId calleeId)
    {
        knStringBuilder result(allocator_);

        if (calleeId.value() >= graph_->nodeCount())
        {
            error(knGenerateErrorCode::ReferenceNotGenerated, callerId, calleeId);
            return result;
        }

        CompiledIndex const calleeIndex = lookup(graph_->canonical(calleeId));
        if (calleeIndex == knInvalidIndex)
        {
            error(knGenerateErrorCode::ReferenceNotGenerated, callerId, calleeId);
            return result;
        }

        CompiledNode const& callee = nodes_[calleeIndex];
        if (callee.inlined)
        {
            result.append(callee.inlineCall.view());
            return result;
        }

        // a callee at or before the caller in construction order already exists
        if (graph_->preorderPosition(graph_->canonical(callerId)) >= callee.preorder)
        {
            if (!callee.requiresStorage)
                error(knGenerateErrorCode::MissingStorage, callerId, callee.nodeId);
            result.append(callee.fieldName.view());
            return result;
        }

        bool alreadyCalled = false;
        for (FactoryCall const& call : factoriesCalled_)
        {
            if (call.caller == callerId && call.callee == callee.nodeId)
            {
                alreadyCalled = true;
                break;
            }
        }

        if (alreadyCalled && callee.requiresStorage)
        {
            result.append(callee.fieldName.view());
            return result;
        }

        // without a field the caller would construct the callee a second time
        if (alreadyCalled)
            error(knGenerateErrorCode::DuplicateFactoryCall, callerId, callee.nodeId);
        else
            factoriesCalled_.pushBack(FactoryCall{.caller = callerId, .callee = callee.nodeId});

        result.format("{}()", callee.name);
        return result;
    }

    void knInstantiator::assemble()
    {
        code_.writeLine("//------------------------------------------------------------------------------");
        code_.writeLine("// <auto-generated>");
        code_.writeLine("//     This code was generated by a tool.");
        code_.writeLine("//");
        code_.writeLine("//     Changes to this file may cause incorrect behavior and will be lost if");
        code_.writeLine("//     the code is regenerated.");
        code_.writeLine("// </auto-generated>");
        code_.writeLine("//------------------------------------------------------------------------------");

        bool requiresGeometryLibrary = false;
        for (CompiledNode const& node : nodes_)
            requiresGeometryLibrary = requiresGeometryLibrary || knIsCanvasGeometry(node.type);

        classWriter_.writePreamble(code_, requiresGeometryLibrary);
        classWriter_.writeClassStart(code_, options_.className, options_.size, options_.progressPropertySet, options_.duration);

        knStringBuilder ticks(allocator_);
        stringifier_.writeInt64(ticks, options_.duration.ticks);
        code_.line("const {} {} = {};", stringifier_.int64TypeName(), durationTicksName, ticks);

        writeField(knName{"Compositor"}, knName{"_c"}, true);
        writeField(knName{"ExpressionAnimation"}, knName{reusableExpressionAnimationName}, true);
        for (CompiledIndex const index : order_)
        {
            CompiledNode const& node = nodes_[index];
            if (node.requiresStorage)
                writeField(knName{knObjectTypeName(node.type)}, node.fieldName.name(), false);
        }
        code_.writeLine();

        for (CompiledIndex const index : order_)
        {
            CompiledNode const& node = nodes_[index];
            if (node.inlined)
                continue;

            writeNode(node);
            if (!errors_.empty())
                return;
        }

        classWriter_.writeClassEnd(code_, info(nodes_[rootIndex_]), knName{reusableExpressionAnimationName});
    }

    void knInstantiator::writeField(knName typeName, knName fieldName, bool readonly)
    {
        knStringBuilder type(allocator_);
        if (readonly && !knIsNameBlank(knName{stringifier_.readonly()}))
            type.format("{} ", stringifier_.readonly());
        stringifier_.writeReferenceTypeName(type, typeName);

        code_.line("{} {};", type, fieldName);
    }
} // namespace kiln
