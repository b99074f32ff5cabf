// kiln

#pragma once

#include "kiln/export.hh"
#include "kiln/string_builder.hh"

#include <cstdint>
#include <string_view>
#include <utility>

namespace kiln {
    // line-oriented source text with brace scopes and indentation
    class knCodeBuilder
    {
    public:
        static constexpr uint32_t indentWidth = 4;

        explicit knCodeBuilder(knAllocator& alloc) noexcept : text_(alloc), line_(alloc) {}

        // writes an empty line
        KN_API void writeLine();
        KN_API void writeLine(std::string_view text);

        template <typename... Args>
        void line(fmt::format_string<Args...> format, Args&&... args)
        {
            line_.clear();
            line_.format(format, std::forward<Args>(args)...);
            writeLine(line_.view());
        }

        // writes each line of text as a // comment; empty text writes nothing
        KN_API void writeComment(std::string_view text);

        KN_API void openScope();
        KN_API void closeScope();

        KN_API void clear() noexcept;

        uint32_t indent() const noexcept { return indent_; }

        char const* data() const noexcept { return text_.data(); }
        uint32_t size() const noexcept { return text_.size(); }
        std::string_view view() const noexcept { return text_.view(); }

    private:
        knStringBuilder text_;
        knStringBuilder line_;
        uint32_t indent_ = 0;
    };
} // namespace kiln
