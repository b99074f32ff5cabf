// kiln

#include "kiln/alloc.hh"

#include <new>

namespace kiln {
    void* knDefaultAllocator::allocate(uint32_t size, uint32_t alignment) { return ::operator new(size, std::align_val_t(alignment)); }

    void knDefaultAllocator::free(void* block, uint32_t size, uint32_t alignment)
    {
        ::operator delete(block, size, std::align_val_t(alignment));
    }
} // namespace kiln
