#pragma once

#include "ast.hpp"
#include "diagnostic.hpp"
#include "text_buffer.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::edit
{
    // One comma-separated entry of a `{ a, b ? x, ... }` parameter set, as offsets relative
    // to the start of the set's text.
    struct FormalEntry
    {
        std::string identifier;
        std::size_t begin{0};
        std::size_t end{0};
        bool isEllipsis{false};
    };

    // Splits the text of a parameter set (braces included) into its entries. Comments,
    // strings and bracketed default values are skipped over, never split.
    [[nodiscard]] std::vector<FormalEntry> scanParameterSet(std::string_view text);

    class OutputsFunctionPatcher
    {
    public:
        OutputsFunctionPatcher() = default;

        // Adds `inputName` to the destructured parameter set of the `outputs` function.
        // Already-listed names are left alone with a warning. Returns false on error.
        bool patch(const frontend::FunctionHead& head, std::string_view inputName, TextBuffer& buffer);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        std::vector<Diagnostic> m_diagnostics;
    };
} // namespace flakeedit::edit
