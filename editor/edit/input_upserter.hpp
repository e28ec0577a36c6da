#pragma once

#include "ast.hpp"
#include "attribute_path_resolver.hpp"
#include "diagnostic.hpp"
#include "insertion_planner.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flakeedit::edit
{
    struct UpsertRequest
    {
        std::string inputName;
        std::string inputUrl;
        // Defaults to ["inputs", inputName, "url"].
        std::optional<AttrPath> attributePath;
        InsertionLocation insertionLocation{InsertionLocation::Top};
    };

    // Adds or updates one input of a manifest. Returns the complete new manifest text, or
    // std::nullopt with the reason in diagnostics(). The source text is never modified in
    // place and no partially edited text is ever returned.
    class InputUpserter
    {
    public:
        InputUpserter() = default;

        [[nodiscard]] std::optional<std::string> upsert(const frontend::Expression& root, std::string_view source, const UpsertRequest& request);

        // Rewrites the value of an already located binding to `url`.
        [[nodiscard]] std::optional<std::string> updateValue(const frontend::Binding& binding, std::string_view url, std::string_view source);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;
        [[nodiscard]] bool hasErrors() const noexcept;

    private:
        bool replaceValue(const frontend::Expression& value, std::string_view url, TextBuffer& buffer);

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

    [[nodiscard]] AttrPath defaultInputPath(std::string_view inputName);
} // namespace flakeedit::edit
