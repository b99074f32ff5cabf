// kiln

#pragma once

#include "kiln/export.hh"
#include "kiln/generate_types.hh"
#include "kiln/types.hh"

#include <cstdint>

namespace kiln {
    class knAllocator;
    class knClassWriter;
    class knSceneGraphView;
    class knStringifier;

    // Compiles a scene graph into the source of a class that rebuilds it.
    //
    // Each generate() call is a complete, independent compilation; the results of the
    // previous call are discarded first.
    class knCodeGenerator
    {
    public:
        virtual void reset() = 0;

        // annotates and emits the graph; on failure the errors are available and the text is empty
        [[nodiscard]] virtual bool generate(knSceneGraphView const& graph, knGenerateOptions const& options) = 0;

        [[nodiscard]] virtual uint32_t getErrorCount() const noexcept = 0;
        [[nodiscard]] virtual knGenerateError getError(uint32_t index) const noexcept = 0;

        // compiled nodes, in emission (name) order
        [[nodiscard]] virtual uint32_t getNodeCount() const noexcept = 0;
        [[nodiscard]] virtual knCompiledNodeInfo getNode(uint32_t index) const noexcept = 0;
        [[nodiscard]] virtual bool findNode(knNodeId nodeId, knCompiledNodeInfo& out_info) const noexcept = 0;

        // the generated unit, only valid after generate() returns true
        [[nodiscard]] virtual char const* text() const noexcept = 0;
        [[nodiscard]] virtual uint32_t textSize() const noexcept = 0;

    protected:
        ~knCodeGenerator() = default;
    };

    [[nodiscard]] KN_API knCodeGenerator* knCreateCodeGenerator(knAllocator& alloc, knStringifier const& stringifier, knClassWriter& classWriter);
    KN_API void knDestroyCodeGenerator(knCodeGenerator* generator);

    [[nodiscard]] KN_API char const* knGenerateErrorCodeName(knGenerateErrorCode code) noexcept;
} // namespace kiln
