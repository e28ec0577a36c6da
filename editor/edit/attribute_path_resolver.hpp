#pragma once

#include "ast.hpp"
#include "diagnostic.hpp"

#include <optional>
#include <string>
#include <vector>

namespace flakeedit::edit
{
    using AttrPath = std::vector<std::string>;

    // Locates key-value bindings by dotted attribute path. Keys may be split across nesting
    // levels in any way: `inputs.nixpkgs.url = ...;`, `inputs.nixpkgs = { url = ...; };`
    // and `inputs = { nixpkgs.url = ...; };` all resolve for ["inputs", "nixpkgs", "url"].
    //
    // A binding matches once the whole requested path has been consumed by its key, even
    // if the key continues past it. A binding whose key is a strict prefix of the path is
    // descended into. Searching a non-attribute-set, or meeting an `inherit`, is an error.
    //
    // A std::nullopt path (or an empty one) selects the first key-value binding of the set.
    class AttributePathResolver
    {
    public:
        AttributePathResolver() = default;

        [[nodiscard]] const frontend::Binding* findFirst(const frontend::Expression& expression, const std::optional<AttrPath>& path);
        [[nodiscard]] std::vector<const frontend::Binding*> findAll(const frontend::Expression& expression, const std::optional<AttrPath>& path);

        // Flattens top-level `inputs` bindings into one binding per input:
        // `inputs = { a = ...; b.url = ...; }` contributes its children, while `inputs.a = ...`
        // and `inputs.a.url = ...` pass through unchanged. Other shapes are skipped.
        [[nodiscard]] std::vector<const frontend::Binding*> collectAllInputs(const std::vector<const frontend::Binding*>& topLevelInputs);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] bool hasErrors() const noexcept;

    private:
        enum class SearchMode
        {
            First,
            All
        };

        bool search(const frontend::Expression& expression,
            const AttrPath* path,
            std::size_t consumed,
            SearchMode mode,
            std::vector<const frontend::Binding*>& results);

        void reportInherit(const frontend::Binding& binding);
        void reportUnsupportedExpression(const frontend::Expression& expression);

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

    // Raw key segments of a binding; std::nullopt when any segment is interpolated.
    [[nodiscard]] std::optional<AttrPath> keySegments(const frontend::Binding& binding);
} // namespace flakeedit::edit
