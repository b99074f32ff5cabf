// kiln

#pragma once

#include "kiln/alloc.hh"

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <new>
#include <type_traits>
#include <utility>

namespace kiln {
    template <typename Value, typename IndexT = uint32_t>
    class knArray
    {
    public:
        static_assert(std::is_nothrow_destructible_v<Value>);
        static_assert(std::is_nothrow_move_constructible_v<Value>);

        using index_type = IndexT;

        explicit knArray(knAllocator& allocator) noexcept : allocator_(&allocator) {}
        ~knArray() noexcept { deallocate(); }

        knArray(knArray&& rhs) noexcept : first_(rhs.first_), sentinel_(rhs.sentinel_), last_(rhs.last_), allocator_(rhs.allocator_)
        {
            rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
        }

        knArray& operator=(knArray&& rhs) noexcept
        {
            if (this != &rhs)
            {
                deallocate();
                first_ = rhs.first_;
                sentinel_ = rhs.sentinel_;
                last_ = rhs.last_;
                allocator_ = rhs.allocator_;
                rhs.first_ = rhs.sentinel_ = rhs.last_ = nullptr;
            }
            return *this;
        }

        uint32_t size() const noexcept { return static_cast<uint32_t>(sentinel_ - first_); }
        bool empty() const noexcept { return first_ == sentinel_; }

        Value* data() noexcept { return first_; }
        Value const* data() const noexcept { return first_; }

        Value* begin() noexcept { return first_; }
        Value const* begin() const noexcept { return first_; }

        Value* end() noexcept { return sentinel_; }
        Value const* end() const noexcept { return sentinel_; }

        Value& operator[](index_type index) noexcept
        {
            KN_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }
        Value const& operator[](index_type index) const noexcept
        {
            KN_ASSERT(static_cast<uint32_t>(index) < size());
            return first_[static_cast<uint32_t>(index)];
        }

        Value& back() noexcept
        {
            KN_ASSERT(first_ != sentinel_);
            return *(sentinel_ - 1);
        }

        bool contains(index_type index) const noexcept { return static_cast<uint32_t>(index) < size(); }

        // fills new slots with copies of value
        void resize(uint32_t size, Value const& value);
        void reserve(uint32_t minimumCapacity);
        void clear() noexcept;

        Value& pushBack(Value const& value) { return emplaceBack(value); }
        Value& pushBack(Value&& value) { return emplaceBack(static_cast<Value&&>(value)); }

        template <typename... Args>
        Value& emplaceBack(Args&&... args);

        knAllocator& allocator() const noexcept { return *allocator_; }

    private:
        void grow(uint32_t required);
        void deallocate() noexcept;

        Value* first_ = nullptr;
        Value* sentinel_ = nullptr;
        Value* last_ = nullptr;
        knAllocator* allocator_ = nullptr;
    };

    template <typename Value, typename IndexT>
    void knArray<Value, IndexT>::resize(uint32_t size, Value const& value)
    {
        while (this->size() > size)
            (--sentinel_)->~Value();

        reserve(size);
        while (this->size() < size)
            new (sentinel_++) Value(value);
    }

    template <typename Value, typename IndexT>
    void knArray<Value, IndexT>::reserve(uint32_t minimumCapacity)
    {
        if (minimumCapacity > static_cast<uint32_t>(last_ - first_))
            grow(minimumCapacity);
    }

    template <typename Value, typename IndexT>
    void knArray<Value, IndexT>::clear() noexcept
    {
        if constexpr (std::is_trivially_destructible_v<Value>)
        {
            sentinel_ = first_;
        }
        else
        {
            while (sentinel_ != first_)
                (--sentinel_)->~Value();
        }
    }

    template <typename Value, typename IndexT>
    template <typename... Args>
    Value& knArray<Value, IndexT>::emplaceBack(Args&&... args)
    {
        if (sentinel_ == last_)
        {
            uint32_t const capacity = static_cast<uint32_t>(last_ - first_);
            grow(capacity < 16 ? 16 : capacity + (capacity >> 1));
        }

        return *new (sentinel_++) Value(static_cast<Args&&>(args)...);
    }

    template <typename Value, typename IndexT>
    void knArray<Value, IndexT>::grow(uint32_t required)
    {
        uint32_t const count = size();

        Value* const memory = static_cast<Value*>(allocator_->allocate(required * sizeof(Value), alignof(Value)));
        if constexpr (std::is_trivially_copyable_v<Value>)
        {
            if (count != 0)
                std::memcpy(static_cast<void*>(memory), first_, count * sizeof(Value));
        }
        else
        {
            for (Value *item = first_, *out = memory; item != sentinel_; ++item, ++out)
            {
                new (out) Value(static_cast<Value&&>(*item));
                item->~Value();
            }
        }

        if (first_ != nullptr)
            allocator_->free(first_, static_cast<uint32_t>(last_ - first_) * sizeof(Value), alignof(Value));

        first_ = memory;
        sentinel_ = memory + count;
        last_ = memory + required;
    }

    template <typename Value, typename IndexT>
    void knArray<Value, IndexT>::deallocate() noexcept
    {
        clear();
        if (first_ != nullptr)
            allocator_->free(first_, static_cast<uint32_t>(last_ - first_) * sizeof(Value), alignof(Value));
        first_ = sentinel_ = last_ = nullptr;
    }
} // namespace kiln
