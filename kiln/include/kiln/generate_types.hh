// kiln

#pragma once

#include "kiln/object.hh"
#include "kiln/types.hh"

#include <cstdint>

namespace kiln {
    enum class knGenerateErrorCode
    {
        Unknown,
        // the view's root is out of range or is not a compilable node
        InvalidRoot,
        // a node carries a type with no emitter
        UnknownObjectType,
        // a cached field is read for a node that was given no storage
        MissingStorage,
        // an uncached factory was called twice from the same caller
        DuplicateFactoryCall,
        // a reference targets a node that does not get a factory, e.g. a property set
        ReferenceNotGenerated,
    };

    struct knGenerateError final
    {
        knGenerateErrorCode code = knGenerateErrorCode::Unknown;
        knNodeId nodeId = knInvalidNodeId;
        knNodeId referenceId = knInvalidNodeId;
    };

    struct knGenerateOptions
    {
        knName className;
        knVector2 size;
        knTimeSpan duration;
        knPropertySet const* progressPropertySet = nullptr;

        // emit the Comment property of objects that have one
        bool setCommentProperties = false;
    };

    // the annotations computed for one compiled node
    struct knCompiledNodeInfo
    {
        knNodeId nodeId = knInvalidNodeId;
        knObjectType type = knObjectType::Invalid;
        knName name;
        knName fieldName;
        uint32_t preorderPosition = 0;
        bool requiresStorage = false;
        bool inlined = false;
    };
} // namespace kiln
