#pragma once

#include <string>
#include <string_view>

namespace flakeedit::edit
{
    // Escapes `text` for the body of a double-quoted string: `"`, `\` and `${`.
    [[nodiscard]] std::string escapeString(std::string_view text);

    // Escapes `text` for the body of an indented ('' ... '') string: `''` and `${`.
    [[nodiscard]] std::string escapeIndentedString(std::string_view text);

    // `text` as a complete double-quoted string literal.
    [[nodiscard]] std::string quoteString(std::string_view text);

    // `name` as it must be spelled in an attribute path or a parameter set: unchanged when
    // it is a plain identifier, quoted otherwise.
    [[nodiscard]] std::string formatAttributeName(std::string_view name);

    [[nodiscard]] bool isPlainIdentifier(std::string_view name) noexcept;
} // namespace flakeedit::edit
