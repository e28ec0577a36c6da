#pragma once

#include "ast.hpp"
#include "diagnostic.hpp"
#include "text_buffer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace flakeedit::edit
{
    enum class InsertionLocation
    {
        Top,
        Bottom
    };

    [[nodiscard]] std::string_view toString(InsertionLocation location);
    [[nodiscard]] std::optional<InsertionLocation> parseInsertionLocation(std::string_view text);

    // Where a new input declaration is attached.
    struct InputsAnchor
    {
        // The sibling declaration the new one is placed next to. For an empty
        // `inputs = { };` set this is the `inputs` binding itself.
        const frontend::Binding* binding{nullptr};
        // Spell the declaration as `inputs.<name>.url` rather than `<name>.url`.
        bool qualified{false};
        bool emptySet{false};
    };

    struct HasInputs
    {
        InputsAnchor anchor;
    };

    struct HasOutputs
    {
        const frontend::Binding* binding{nullptr};
    };

    struct MissingInputs
    {
        // The `outputs` binding the new declaration goes above.
        SourceSpan outputsSpan;
    };

    struct MissingOutputs
    {
        SourceSpan inputsSpan;
    };

    struct MissingInputsAndOutputs
    {
        SourceSpan rootSpan;
    };

    using AttrClassification = std::variant<HasInputs, HasOutputs, MissingInputs, MissingOutputs, MissingInputsAndOutputs>;

    // Inserts a brand-new `<name>.url = "<url>";` declaration next to the existing inputs and
    // threads the name into a destructured `outputs` parameter set.
    class InsertionPlanner
    {
    public:
        InsertionPlanner() = default;

        [[nodiscard]] std::optional<std::string> insert(const frontend::Expression& root,
            std::string_view source,
            std::string_view inputName,
            std::string_view inputUrl,
            InsertionLocation location);

        // The top-level shape of the manifest: one of (HasInputs, HasOutputs),
        // (HasInputs, MissingOutputs), (MissingInputs, HasOutputs) or (MissingInputsAndOutputs).
        // Empty on error.
        [[nodiscard]] std::vector<AttrClassification> classify(const frontend::Expression& root, InsertionLocation location);

        [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept;

    private:
        struct Request
        {
            std::string_view inputName;
            std::string_view inputUrl;
            InsertionLocation location{InsertionLocation::Top};
        };

        std::optional<InputsAnchor> findAnchor(const frontend::Expression& root, InsertionLocation location);
        SourceLocation editLocation(const AttrClassification& classification, InsertionLocation location) const;

        bool apply(const HasInputs& item, const Request& request, TextBuffer& buffer);
        bool apply(const HasOutputs& item, const Request& request, TextBuffer& buffer);
        bool apply(const MissingInputs& item, const Request& request, TextBuffer& buffer);
        bool apply(const MissingOutputs& item, const Request& request, TextBuffer& buffer);
        bool apply(const MissingInputsAndOutputs& item, const Request& request, TextBuffer& buffer);

        bool insertIntoEmptySet(const frontend::Binding& inputs, const std::string& declaration, TextBuffer& buffer);
        bool insertAbove(const SourceSpan& anchor, const std::string& declaration, bool separate, TextBuffer& buffer);
        bool insertBelow(const SourceSpan& anchor, const std::string& declaration, TextBuffer& buffer);

    private:
        std::vector<Diagnostic> m_diagnostics;
    };

    // `inputs.<name>.url = "<url>";` or `<name>.url = "<url>";`.
    [[nodiscard]] std::string formatInputDeclaration(std::string_view inputName, std::string_view inputUrl, bool qualified);
} // namespace flakeedit::edit
