// kiln

#include "kiln/scene_builder.hh"

#include <algorithm>

namespace kiln {
    namespace {
        bool isValid(knNodeId nodeId, uint32_t nodeCount) noexcept { return nodeId.value() < nodeCount; }

        void appendAnimators(knSpan<knAnimator const> animators, std::vector<knNodeId>& out_references)
        {
            for (knAnimator const& animator : animators)
            {
                out_references.push_back(animator.animation);
                out_references.push_back(animator.controller);
            }
        }
    } // namespace

    knNodeId knSceneBuilder::add(knObjectType type)
    {
        knNodeId const nodeId{static_cast<uint32_t>(objects_.size())};

        knObject& obj = objects_.emplace_back();
        obj.type = type;

        Node& node = nodes_.emplace_back();
        node.canonical = nodeId;

        return nodeId;
    }

    knObject& knSceneBuilder::edit(knNodeId nodeId) { return objects_[nodeId.value()]; }

    knName knSceneBuilder::intern(std::string_view text)
    {
        std::string const& stored = strings_.emplace_back(text);
        return knName{stored.data(), stored.data() + stored.size()};
    }

    void knSceneBuilder::setRoot(knNodeId nodeId) { root_ = nodeId; }

    void knSceneBuilder::setCanonical(knNodeId nodeId, knNodeId canonicalId)
    {
        if (!isValid(nodeId, nodeCount()) || !isValid(canonicalId, nodeCount()))
            return;

        knNodeId const representative = nodes_[canonicalId.value()].canonical;
        knNodeId const previous = nodes_[nodeId.value()].canonical;

        // fold the whole previous group so that chains of calls stay flat
        for (Node& node : nodes_)
        {
            if (node.canonical == previous)
                node.canonical = representative;
        }
    }

    void knSceneBuilder::collectReferences(knObject const& obj, std::vector<knNodeId>& out_references) const
    {
        switch (obj.type)
        {
        case knObjectType::ContainerVisual:
            out_references.push_back(obj.visual.clip);
            out_references.insert(out_references.end(), obj.visual.children.begin(), obj.visual.children.end());
            break;
        case knObjectType::ShapeVisual:
            out_references.push_back(obj.visual.clip);
            out_references.insert(out_references.end(), obj.visual.children.begin(), obj.visual.children.end());
            out_references.insert(out_references.end(), obj.shape.shapes.begin(), obj.shape.shapes.end());
            break;
        case knObjectType::ContainerShape:
            out_references.insert(out_references.end(), obj.shape.shapes.begin(), obj.shape.shapes.end());
            break;
        case knObjectType::SpriteShape:
            out_references.push_back(obj.sprite.fillBrush);
            out_references.push_back(obj.sprite.geometry);
            out_references.push_back(obj.sprite.strokeBrush);
            break;
        case knObjectType::PathGeometry: out_references.push_back(obj.geometry.path); break;
        case knObjectType::Path: out_references.push_back(obj.source); break;
        case knObjectType::ExpressionAnimation:
        case knObjectType::ColorKeyFrameAnimation:
        case knObjectType::PathKeyFrameAnimation:
        case knObjectType::ScalarKeyFrameAnimation:
        case knObjectType::Vector2KeyFrameAnimation:
        case knObjectType::Vector3KeyFrameAnimation:
            for (knReferenceParameter const& parameter : obj.animation.referenceParameters)
                out_references.push_back(parameter.value);
            for (knKeyFrame const& keyFrame : obj.animation.keyFrames)
            {
                out_references.push_back(keyFrame.path);
                out_references.push_back(keyFrame.easing);
            }
            break;
        case knObjectType::CanvasGeometryCombination:
            out_references.push_back(obj.canvas.a);
            out_references.push_back(obj.canvas.b);
            break;
        default: break;
        }

        appendAnimators(obj.properties.animators, out_references);
        appendAnimators(obj.animators, out_references);

        auto const invalid = [count = nodeCount()](knNodeId id) { return !isValid(id, count); };
        out_references.erase(std::remove_if(out_references.begin(), out_references.end(), invalid), out_references.end());
    }

    void knSceneBuilder::link()
    {
        uint32_t const count = nodeCount();

        for (Node& node : nodes_)
        {
            node.groupSize = 0;
            node.preorder = count;
            node.inboundReferences.clear();
        }
        for (Node const& node : nodes_)
            ++nodes_[node.canonical.value()].groupSize;
        for (Node& node : nodes_)
            node.groupSize = nodes_[node.canonical.value()].groupSize;

        std::vector<std::vector<knNodeId>> references(count);
        for (uint32_t index = 0; index != count; ++index)
        {
            collectReferences(objects_[index], references[index]);

            // only the representative is constructed, so only its edges count; a node
            // referenced twice by the same referrer is listed twice
            knNodeId const referrer = nodes_[index].canonical;
            if (referrer.value() != index)
                continue;
            for (knNodeId const target : references[index])
                nodes_[nodes_[target.value()].canonical.value()].inboundReferences.push_back(referrer);
        }

        // depth-first from the root in the order references are resolved; children are
        // pushed in reverse so that the first reference is visited first
        uint32_t position = 0;
        std::vector<knNodeId> pending;
        if (isValid(root_, count))
            pending.push_back(nodes_[root_.value()].canonical);

        while (!pending.empty())
        {
            knNodeId const nodeId = pending.back();
            pending.pop_back();

            Node& node = nodes_[nodeId.value()];
            if (node.preorder != count)
                continue;
            node.preorder = position++;

            std::vector<knNodeId> const& children = references[nodeId.value()];
            for (auto it = children.rbegin(); it != children.rend(); ++it)
                pending.push_back(nodes_[it->value()].canonical);
        }

        // unreachable representatives are constructed last, in id order
        for (Node& node : nodes_)
        {
            if (node.canonical == knNodeId{static_cast<uint32_t>(&node - nodes_.data())} && node.preorder == count)
                node.preorder = position++;
        }
    }

    knObject const& knSceneBuilder::object(knNodeId nodeId) const noexcept { return objects_[nodeId.value()]; }

    knNodeId knSceneBuilder::canonical(knNodeId nodeId) const noexcept
    {
        if (!isValid(nodeId, nodeCount()))
            return nodeId;
        return nodes_[nodeId.value()].canonical;
    }

    uint32_t knSceneBuilder::groupSize(knNodeId nodeId) const noexcept
    {
        if (!isValid(nodeId, nodeCount()))
            return 0;
        return nodes_[nodeId.value()].groupSize;
    }

    uint32_t knSceneBuilder::preorderPosition(knNodeId nodeId) const noexcept
    {
        if (!isValid(nodeId, nodeCount()))
            return nodeCount();
        return nodes_[canonical(nodeId).value()].preorder;
    }

    knSpan<knNodeId const> knSceneBuilder::inboundReferences(knNodeId nodeId) const noexcept
    {
        if (!isValid(nodeId, nodeCount()))
            return {};
        std::vector<knNodeId> const& inbound = nodes_[canonical(nodeId).value()].inboundReferences;
        return knSpan<knNodeId const>(inbound.data(), static_cast<uint32_t>(inbound.size()));
    }
} // namespace kiln
