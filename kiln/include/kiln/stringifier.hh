// kiln

#pragma once

#include "kiln/string_builder.hh"
#include "kiln/types.hh"

#include <cstdint>

namespace kiln {
    // Renders target-language tokens and literals.
    class knStringifier
    {
    public:
        // member access on a reference, e.g. "." or "->"
        virtual char const* deref() const noexcept = 0;
        virtual char const* newKeyword() const noexcept = 0;
        virtual char const* null() const noexcept = 0;
        virtual char const* scopeResolve() const noexcept = 0;
        // local variable declaration with inferred type
        virtual char const* var() const noexcept = 0;
        // may be empty if the language has no such qualifier
        virtual char const* readonly() const noexcept = 0;
        virtual char const* listAdd() const noexcept = 0;
        virtual char const* int64TypeName() const noexcept = 0;

        virtual void writeBool(knStringBuilder& out, bool value) const = 0;
        virtual void writeInt32(knStringBuilder& out, int32_t value) const = 0;
        virtual void writeInt64(knStringBuilder& out, int64_t value) const = 0;
        virtual void writeFloat(knStringBuilder& out, float value) const = 0;
        virtual void writeVector2(knStringBuilder& out, knVector2 value) const = 0;
        virtual void writeVector3(knStringBuilder& out, knVector3 value) const = 0;
        virtual void writeMatrix3x2(knStringBuilder& out, knMatrix3x2 const& value) const = 0;
        virtual void writeColor(knStringBuilder& out, knColor value) const = 0;
        virtual void writeTimeSpan(knStringBuilder& out, knTimeSpan value) const = 0;
        // a time span built from a named constant holding a tick count
        virtual void writeTimeSpan(knStringBuilder& out, knName ticksName) const = 0;
        virtual void writeString(knStringBuilder& out, knName value) const = 0;
        virtual void writeReferenceTypeName(knStringBuilder& out, knName typeName) const = 0;
        // wraps the result of a factory call where the language needs it, e.g. to unwrap a smart pointer
        virtual void writeFactoryCall(knStringBuilder& out, knName call) const = 0;

    protected:
        ~knStringifier() = default;
    };
} // namespace kiln
