// kiln

#pragma once

#include "kiln/types.hh"

#include <cstdint>

namespace kiln {
    constexpr uint64_t knHashFnv1a64(char const* start, char const* end, uint64_t hash = 0xcbf2'9ce4'8422'2325ull) noexcept
    {
        constexpr uint64_t prime = 0x0000'0100'0000'01b3ull;

        for (; start != end; ++start)
        {
            hash ^= static_cast<uint8_t>(*start);
            hash *= prime;
        }

        return hash;
    }

    constexpr uint64_t knHashFnv1a64(knName name) noexcept
    {
        if (name.name == nullptr)
            return knHashFnv1a64(name.name, name.name);

        char const* end = name.nameEnd;
        if (end == nullptr)
            for (end = name.name; *end != '\0'; ++end)
                ;

        return knHashFnv1a64(name.name, end);
    }
} // namespace kiln
