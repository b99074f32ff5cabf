// kiln

#pragma once

#include "kiln/export.hh"

#include <cstdint>

namespace kiln {
    class knAllocator
    {
    public:
        [[nodiscard]] virtual void* allocate(uint32_t size, uint32_t alignment) = 0;
        virtual void free(void* block, uint32_t size, uint32_t alignment) = 0;

    protected:
        ~knAllocator() = default;
    };

    class KN_API knDefaultAllocator final : public knAllocator
    {
    public:
        [[nodiscard]] void* allocate(uint32_t size, uint32_t alignment) override;
        void free(void* block, uint32_t size, uint32_t alignment) override;
    };
} // namespace kiln
