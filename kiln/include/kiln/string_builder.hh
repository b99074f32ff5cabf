// kiln

#pragma once

#include "kiln/alloc.hh"
#include "kiln/export.hh"
#include "kiln/types.hh"

#include <fmt/format.h>

#include <cstdint>
#include <string_view>
#include <utility>

namespace kiln {
    // growable text buffer; memory comes from the allocator and the text is always NUL terminated
    class knStringBuilder
    {
    public:
        explicit knStringBuilder(knAllocator& alloc) noexcept : allocator_(&alloc) {}
        KN_API ~knStringBuilder();

        KN_API knStringBuilder(knStringBuilder&& rhs) noexcept;
        KN_API knStringBuilder& operator=(knStringBuilder&& rhs) noexcept;

        bool empty() const noexcept { return size_ == 0; }
        uint32_t size() const noexcept { return size_; }

        char const* data() const noexcept { return first_ != nullptr ? first_ : ""; }
        char const* cStr() const noexcept { return data(); }

        std::string_view view() const noexcept { return {data(), size_}; }
        knName name() const noexcept { return {data(), data() + size_}; }

        KN_API void clear() noexcept;
        KN_API void reserve(uint32_t minimumCapacity);

        KN_API void append(char c);
        KN_API void append(char const* first, char const* last = nullptr);
        KN_API void append(knName name);
        KN_API void append(std::string_view text);

        template <typename... Args>
        void format(fmt::format_string<Args...> format, Args&&... args)
        {
            fmt::memory_buffer buffer;
            fmt::format_to(fmt::appender(buffer), format, std::forward<Args>(args)...);
            append(buffer.data(), buffer.data() + buffer.size());
        }

        knAllocator& allocator() const noexcept { return *allocator_; }

    private:
        void deallocate() noexcept;

        knAllocator* allocator_ = nullptr;
        char* first_ = nullptr;
        uint32_t size_ = 0;
        uint32_t capacity_ = 0;
    };
} // namespace kiln

template <>
struct fmt::formatter<kiln::knStringBuilder> : fmt::formatter<fmt::string_view>
{
    template <typename FormatContext>
    auto format(kiln::knStringBuilder const& value, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<fmt::string_view>::format(fmt::string_view(value.data(), value.size()), ctx);
    }
};

template <>
struct fmt::formatter<kiln::knName> : fmt::formatter<fmt::string_view>
{
    template <typename FormatContext>
    auto format(kiln::knName const& value, FormatContext& ctx) const -> decltype(ctx.out())
    {
        if (value.name == nullptr)
            return fmt::formatter<fmt::string_view>::format(fmt::string_view(), ctx);
        fmt::string_view const text =
            value.nameEnd != nullptr ? fmt::string_view(value.name, value.nameEnd - value.name) : fmt::string_view(value.name);
        return fmt::formatter<fmt::string_view>::format(text, ctx);
    }
};
