// kiln

#pragma once

#include "kiln/object.hh"
#include "kiln/types.hh"

#include <cstdint>

namespace kiln {
    // Read-only view of a canonicalized scene graph. Node ids are dense, in [0, nodeCount()).
    //
    // Every node belongs to a group of interchangeable nodes; canonical() picks the group's
    // representative. preorderPosition() and inboundReferences() are only queried for
    // representatives, and inbound references are themselves representatives. There is one
    // inbound entry per reference, so a referrer using a node twice appears twice.
    class knSceneGraphView
    {
    public:
        virtual uint32_t nodeCount() const noexcept = 0;
        virtual knNodeId root() const noexcept = 0;

        virtual knObject const& object(knNodeId nodeId) const noexcept = 0;

        virtual knNodeId canonical(knNodeId nodeId) const noexcept = 0;
        virtual uint32_t groupSize(knNodeId nodeId) const noexcept = 0;

        // position of the node in a depth-first construction from the root
        virtual uint32_t preorderPosition(knNodeId nodeId) const noexcept = 0;
        virtual knSpan<knNodeId const> inboundReferences(knNodeId nodeId) const noexcept = 0;

    protected:
        ~knSceneGraphView() = default;
    };
} // namespace kiln
