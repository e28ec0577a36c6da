#pragma once

#include "token.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace flakeedit::edit
{
    struct ByteRange
    {
        std::size_t begin{0};
        std::size_t end{0};
    };

    // Byte offset of the character at `position` (1-based line and column, one column per
    // UTF-8 encoded character). The position just past the final character maps to
    // `text.size()`; anything else that the scan never reaches yields std::nullopt.
    [[nodiscard]] std::optional<std::size_t> positionToOffset(std::string_view text, const frontend::SourceLocation& position);

    // Both ends of `span` as a half-open byte range; fails if either end is missing.
    [[nodiscard]] std::optional<ByteRange> spanToOffsets(std::string_view text, const frontend::SourceSpan& span);
} // namespace flakeedit::edit
