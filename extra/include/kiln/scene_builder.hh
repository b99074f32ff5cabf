// kiln

#pragma once

#include "kiln/export.hh"
#include "kiln/graph_view.hh"
#include "kiln/object.hh"
#include "kiln/types.hh"

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace kiln {
    // Builds a scene graph in memory and serves it as a graph view.
    //
    // Objects, strings and lists keep stable addresses for the lifetime of the builder.
    // Grouping is explicit: setCanonical() folds a node into another node's group. Call
    // link() after the last change and before handing the builder to a generator.
    class knSceneBuilder final : public knSceneGraphView
    {
    public:
        KN_EXTRA_API knNodeId add(knObjectType type);
        KN_EXTRA_API knObject& edit(knNodeId nodeId);

        KN_EXTRA_API knName intern(std::string_view text);

        knSpan<knNodeId const> nodes(std::initializer_list<knNodeId> items) { return store(nodeLists_, items); }
        knSpan<knAnimator const> animators(std::initializer_list<knAnimator> items) { return store(animatorLists_, items); }
        knSpan<knKeyFrame const> keyFrames(std::initializer_list<knKeyFrame> items) { return store(keyFrameLists_, items); }
        knSpan<knReferenceParameter const> parameters(std::initializer_list<knReferenceParameter> items) { return store(parameterLists_, items); }
        knSpan<knScalarProperty const> scalars(std::initializer_list<knScalarProperty> items) { return store(scalarLists_, items); }
        knSpan<knVector2Property const> vector2s(std::initializer_list<knVector2Property> items) { return store(vector2Lists_, items); }
        knSpan<float const> floats(std::initializer_list<float> items) { return store(floatLists_, items); }
        knSpan<knPathCommand const> commands(std::initializer_list<knPathCommand> items) { return store(commandLists_, items); }

        KN_EXTRA_API void setRoot(knNodeId nodeId);
        // nodeId becomes an interchangeable instance of canonicalId's group
        KN_EXTRA_API void setCanonical(knNodeId nodeId, knNodeId canonicalId);

        // computes groups, inbound references and construction order
        KN_EXTRA_API void link();

        uint32_t nodeCount() const noexcept override { return static_cast<uint32_t>(objects_.size()); }
        knNodeId root() const noexcept override { return root_; }

        KN_EXTRA_API knObject const& object(knNodeId nodeId) const noexcept override;

        KN_EXTRA_API knNodeId canonical(knNodeId nodeId) const noexcept override;
        KN_EXTRA_API uint32_t groupSize(knNodeId nodeId) const noexcept override;

        KN_EXTRA_API uint32_t preorderPosition(knNodeId nodeId) const noexcept override;
        KN_EXTRA_API knSpan<knNodeId const> inboundReferences(knNodeId nodeId) const noexcept override;

    private:
        struct Node
        {
            knNodeId canonical = knInvalidNodeId;
            uint32_t groupSize = 1;
            uint32_t preorder = 0;
            std::vector<knNodeId> inboundReferences;
        };

        template <typename T>
        knSpan<T const> store(std::deque<std::vector<T>>& lists, std::initializer_list<T> items)
        {
            std::vector<T>& list = lists.emplace_back(items);
            return knSpan<T const>(list.data(), static_cast<uint32_t>(list.size()));
        }

        // references in the order the generator resolves them
        void collectReferences(knObject const& obj, std::vector<knNodeId>& out_references) const;

        std::deque<knObject> objects_;
        std::vector<Node> nodes_;
        std::deque<std::string> strings_;
        std::deque<std::vector<knNodeId>> nodeLists_;
        std::deque<std::vector<knAnimator>> animatorLists_;
        std::deque<std::vector<knKeyFrame>> keyFrameLists_;
        std::deque<std::vector<knReferenceParameter>> parameterLists_;
        std::deque<std::vector<knScalarProperty>> scalarLists_;
        std::deque<std::vector<knVector2Property>> vector2Lists_;
        std::deque<std::vector<float>> floatLists_;
        std::deque<std::vector<knPathCommand>> commandLists_;
        knNodeId root_ = knInvalidNodeId;
    };
} // namespace kiln
