#include "position_index.hpp"

namespace flakeedit::edit
{
    namespace
    {
        bool isContinuationByte(char ch)
        {
            return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
        }
    } // namespace

    std::optional<std::size_t> positionToOffset(std::string_view text, const frontend::SourceLocation& position)
    {
        std::uint32_t line = 1;
        std::uint32_t column = 1;

        for (std::size_t index = 0; index < text.size(); ++index)
        {
            const char ch = text[index];
            if (isContinuationByte(ch))
            {
                continue;
            }

            if (line == position.line && column == position.column)
            {
                return index;
            }

            if (ch == '\n')
            {
                ++line;
                column = 1;
            }
            else
            {
                ++column;
            }
        }

        if (line == position.line && column == position.column)
        {
            return text.size();
        }

        return std::nullopt;
    }

    std::optional<ByteRange> spanToOffsets(std::string_view text, const frontend::SourceSpan& span)
    {
        const std::optional<std::size_t> begin = positionToOffset(text, span.begin);
        if (!begin.has_value())
        {
            return std::nullopt;
        }

        const std::optional<std::size_t> end = positionToOffset(text, span.end);
        if (!end.has_value())
        {
            return std::nullopt;
        }

        return ByteRange{*begin, *end};
    }
} // namespace flakeedit::edit
