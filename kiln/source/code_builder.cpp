// kiln

#include "kiln/code_builder.hh"

#include "assert.hh"

namespace kiln {
    void knCodeBuilder::writeLine() { text_.append('\n'); }

    void knCodeBuilder::writeLine(std::string_view text)
    {
        if (!text.empty())
        {
            for (uint32_t column = 0; column != indent_ * indentWidth; ++column)
                text_.append(' ');
            text_.append(text);
        }
        text_.append('\n');
    }

    void knCodeBuilder::writeComment(std::string_view text)
    {
        while (!text.empty())
        {
            size_t const newline = text.find('\n');
            std::string_view commentLine = text.substr(0, newline);
            if (!commentLine.empty() && commentLine.back() == '\r')
                commentLine.remove_suffix(1);

            if (commentLine.empty())
                writeLine("//");
            else
                line("// {}", commentLine);

            if (newline == std::string_view::npos)
                break;
            text.remove_prefix(newline + 1);
        }
    }

    void knCodeBuilder::openScope()
    {
        writeLine("{");
        ++indent_;
    }

    void knCodeBuilder::closeScope()
    {
        KN_GUARD_VOID(indent_ != 0);
        --indent_;
        writeLine("}");
    }

    void knCodeBuilder::clear() noexcept
    {
        text_.clear();
        line_.clear();
        indent_ = 0;
    }
} // namespace kiln
