// kiln

#include "kiln/string_builder.hh"

#include "assert.hh"
#include "utility.hh"

#include <cstring>

namespace kiln {
    knStringBuilder::~knStringBuilder() { deallocate(); }

    knStringBuilder::knStringBuilder(knStringBuilder&& rhs) noexcept
        : allocator_(rhs.allocator_), first_(rhs.first_), size_(rhs.size_), capacity_(rhs.capacity_)
    {
        rhs.first_ = nullptr;
        rhs.size_ = rhs.capacity_ = 0;
    }

    knStringBuilder& knStringBuilder::operator=(knStringBuilder&& rhs) noexcept
    {
        if (this != &rhs)
        {
            deallocate();
            allocator_ = rhs.allocator_;
            first_ = rhs.first_;
            size_ = rhs.size_;
            capacity_ = rhs.capacity_;
            rhs.first_ = nullptr;
            rhs.size_ = rhs.capacity_ = 0;
        }
        return *this;
    }

    void knStringBuilder::clear() noexcept
    {
        size_ = 0;
        if (first_ != nullptr)
            first_[0] = '\0';
    }

    void knStringBuilder::reserve(uint32_t minimumCapacity)
    {
        // capacity_ includes the NUL
        if (minimumCapacity + 1 <= capacity_)
            return;

        uint32_t required = capacity_ < 64 ? 64 : capacity_ + (capacity_ >> 1);
        if (required < minimumCapacity + 1)
            required = minimumCapacity + 1;

        char* const memory = static_cast<char*>(allocator_->allocate(required, 1));
        if (first_ != nullptr)
        {
            std::memcpy(memory, first_, size_);
            allocator_->free(first_, capacity_, 1);
        }
        memory[size_] = '\0';

        first_ = memory;
        capacity_ = required;
    }

    void knStringBuilder::append(char c)
    {
        reserve(size_ + 1);
        first_[size_++] = c;
        first_[size_] = '\0';
    }

    void knStringBuilder::append(char const* first, char const* last)
    {
        if (first == nullptr)
            return;

        if (last == nullptr)
            last = first + std::strlen(first);

        uint32_t const length = static_cast<uint32_t>(last - first);
        if (length == 0)
            return;

        // reserve before reading so a sub-range of this builder may be appended to itself
        uint32_t const offset = first_ != nullptr && first >= first_ && first < first_ + capacity_ ? static_cast<uint32_t>(first - first_) : ~0u;
        reserve(size_ + length);
        if (offset != ~0u)
            first = first_ + offset;

        std::memmove(first_ + size_, first, length);
        size_ += length;
        first_[size_] = '\0';
    }

    void knStringBuilder::append(knName name)
    {
        if (knIsNameEmpty(name))
            return;
        append(name.name, name.name + knNameLen(name));
    }

    void knStringBuilder::append(std::string_view text) { append(text.data(), text.data() + text.size()); }

    void knStringBuilder::deallocate() noexcept
    {
        if (first_ != nullptr)
            allocator_->free(first_, capacity_, 1);
        first_ = nullptr;
        size_ = capacity_ = 0;
    }
} // namespace kiln
