// kiln

#pragma once

#include "kiln/types.hh"

#include "assert.hh"

#include <cstdint>
#include <cstring>
#include <string_view>

namespace kiln {
    template <typename T, uint32_t Count>
    constexpr uint32_t knCountOf(T (&)[Count]) noexcept
    {
        return Count;
    }

    template <typename ValueT, typename IndexT = uint32_t>
    class knEnumerated
    {
    public:
        struct Entry
        {
            IndexT index = 0;
            ValueT& item;
        };

        class Iterator
        {
        public:
            constexpr Iterator(ValueT* items, uint32_t index) noexcept : item_(items), index_(index) {}

            constexpr Iterator& operator++() noexcept
            {
                ++index_;
                ++item_;
                return *this;
            }

            constexpr Entry operator*() const noexcept { return {.index = IndexT{index_}, .item = *item_}; }

            constexpr bool operator==(Iterator const&) const noexcept = default;

        private:
            ValueT* item_ = nullptr;
            uint32_t index_{};
        };

        constexpr knEnumerated(ValueT* items, uint32_t size) noexcept : items_(items), size_(size) {}

        constexpr Iterator begin() const noexcept { return Iterator(items_, 0); }
        constexpr Iterator end() const noexcept { return Iterator(items_ + size_, size_); }

    private:
        ValueT* items_ = nullptr;
        uint32_t size_ = 0;
    };

    template <typename ContainerT>
    constexpr auto knEnumerate(ContainerT& container) noexcept
    {
        return knEnumerated{container.data(), container.size()};
    }

    constexpr uint32_t knNameLen(knName name) noexcept
    {
        if (name.name == nullptr)
            return 0;

        if (name.nameEnd != nullptr)
            return static_cast<uint32_t>(name.nameEnd - name.name);

        return static_cast<uint32_t>(std::strlen(name.name));
    }

    inline std::string_view knNameView(knName name) noexcept { return std::string_view(name.name, knNameLen(name)); }

    constexpr bool knIsNameEmpty(knName name) noexcept
    {
        if (name.name == nullptr)
            return true;

        if (name.nameEnd != nullptr && name.nameEnd == name.name)
            return true;

        return name.name[0] == '\0';
    }

    // true for empty names and names made only of whitespace
    constexpr bool knIsNameBlank(knName name) noexcept
    {
        uint32_t const length = knNameLen(name);
        for (uint32_t index = 0; index != length; ++index)
        {
            char const c = name.name[index];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
                return false;
        }
        return true;
    }

    inline bool knNameEqual(knName lhs, knName rhs) noexcept
    {
        uint32_t const length = knNameLen(lhs);
        if (length != knNameLen(rhs))
            return false;
        return length == 0 || std::memcmp(lhs.name, rhs.name, length) == 0;
    }

    inline bool knNameStartsWith(knName name, char const* prefix) noexcept
    {
        uint32_t const prefixLength = static_cast<uint32_t>(std::strlen(prefix));
        return knNameLen(name) >= prefixLength && std::memcmp(name.name, prefix, prefixLength) == 0;
    }
} // namespace kiln
