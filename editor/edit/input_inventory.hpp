#pragma once

#include "ast.hpp"
#include "diagnostic.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flakeedit::edit
{
    struct InputEntry
    {
        std::string name;
        // Only known when written as a single literal string or a URI.
        std::optional<std::string> url;
        const frontend::Binding* binding{nullptr};
    };

    class InputInventory
    {
    public:
        InputInventory() = default;

        // Every input declared at the top level of `root`, in declaration order, one entry
        // per name. std::nullopt on error.
        [[nodiscard]] std::optional<std::vector<InputEntry>> listInputs(const frontend::Expression& root);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        std::optional<std::string> readUrl(const frontend::Binding& binding, bool keyEndsInUrl);

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

    // The literal text of a single-part string or a URI literal.
    [[nodiscard]] std::optional<std::string> literalValue(const frontend::Expression& value);
} // namespace flakeedit::edit
