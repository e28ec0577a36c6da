#include "insertion_planner.hpp"

#include "attribute_path_resolver.hpp"
#include "literal_writer.hpp"
#include "outputs_function_patcher.hpp"

#include <algorithm>
#include <utility>

namespace flakeedit::edit
{
    using frontend::Binding;
    using frontend::Expression;
    using frontend::ExpressionKind;

    namespace
    {
        const AttrPath kInputsPath{"inputs"};
        const AttrPath kOutputsPath{"outputs"};

        void append(std::vector<Diagnostic>& into, const std::vector<Diagnostic>& from)
        {
            into.insert(into.end(), from.begin(), from.end());
        }

        bool isQualifiedInput(const Binding& binding)
        {
            return !binding.from.empty() && !binding.from.front().isInterpolation && binding.from.front().content == "inputs";
        }
    } // namespace

    std::string_view toString(InsertionLocation location)
    {
        switch (location)
        {
        case InsertionLocation::Top: return "top";
        case InsertionLocation::Bottom: return "bottom";
        }

        return "top";
    }

    std::optional<InsertionLocation> parseInsertionLocation(std::string_view text)
    {
        if (text == "top")
        {
            return InsertionLocation::Top;
        }
        if (text == "bottom")
        {
            return InsertionLocation::Bottom;
        }
        return std::nullopt;
    }

    std::string formatInputDeclaration(std::string_view inputName, std::string_view inputUrl, bool qualified)
    {
        std::string declaration = qualified ? "inputs." : "";
        declaration += formatAttributeName(inputName);
        declaration += ".url = ";
        declaration += quoteString(inputUrl);
        declaration += ';';
        return declaration;
    }

    std::optional<std::string> InsertionPlanner::insert(const Expression& root,
        std::string_view source,
        std::string_view inputName,
        std::string_view inputUrl,
        InsertionLocation location)
    {
        std::vector<AttrClassification> items = classify(root, location);
        if (items.empty())
        {
            return std::nullopt;
        }

        // Later edits go first so that the spans of the earlier ones stay valid.
        std::stable_sort(items.begin(), items.end(), [this, location](const AttrClassification& lhs, const AttrClassification& rhs) {
            return editLocation(rhs, location) < editLocation(lhs, location);
        });

        TextBuffer buffer{std::string{source}};
        const Request request{inputName, inputUrl, location};

        for (const AttrClassification& item : items)
        {
            const bool applied = std::visit([&](const auto& entry) { return apply(entry, request, buffer); }, item);
            if (!applied)
            {
                return std::nullopt;
            }
        }

        return buffer.release();
    }

    std::vector<AttrClassification> InsertionPlanner::classify(const Expression& root, InsertionLocation location)
    {
        m_diagnostics.clear();

        const std::optional<InputsAnchor> anchor = findAnchor(root, location);
        if (!anchor.has_value())
        {
            return {};
        }

        AttributePathResolver resolver;
        const Binding* outputs = resolver.findFirst(root, kOutputsPath);
        if (resolver.hasErrors())
        {
            append(m_diagnostics, resolver.diagnostics());
            return {};
        }

        if (anchor->binding != nullptr && outputs != nullptr)
        {
            return {HasInputs{*anchor}, HasOutputs{outputs}};
        }
        if (anchor->binding != nullptr)
        {
            return {HasInputs{*anchor}, MissingOutputs{anchor->binding->span}};
        }
        if (outputs != nullptr)
        {
            return {MissingInputs{outputs->span}, HasOutputs{outputs}};
        }
        return {MissingInputsAndOutputs{root.span}};
    }

    const std::vector<Diagnostic>& InsertionPlanner::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::optional<InputsAnchor> InsertionPlanner::findAnchor(const Expression& root, InsertionLocation location)
    {
        AttributePathResolver resolver;

        // Picks the sibling to attach to inside an `inputs = { ... };` set.
        auto anchorInSet = [&](const Binding& inputs, bool last) -> std::optional<InputsAnchor> {
            const Expression& value = *inputs.to;
            if (value.kind != ExpressionKind::Map)
            {
                m_diagnostics.emplace_back(makeError(EditErrorKind::UnsupportedExpressionKind,
                    "unsupported `inputs` expression type " + std::string{frontend::toString(value.kind)}
                        + " (at " + describeLocation(value.span.begin) + ")",
                    value.span));
                return std::nullopt;
            }

            if (value.bindings.empty())
            {
                return InputsAnchor{&inputs, false, true};
            }

            if (!last)
            {
                const Binding* first = resolver.findFirst(value, std::nullopt);
                if (resolver.hasErrors())
                {
                    append(m_diagnostics, resolver.diagnostics());
                    return std::nullopt;
                }
                return InputsAnchor{first, false, false};
            }

            return InputsAnchor{&value.bindings.back(), false, false};
        };

        if (location == InsertionLocation::Top)
        {
            const Binding* first = resolver.findFirst(root, kInputsPath);
            if (resolver.hasErrors())
            {
                append(m_diagnostics, resolver.diagnostics());
                return std::nullopt;
            }

            if (first == nullptr)
            {
                return InputsAnchor{};
            }
            if (first->from.size() == 1)
            {
                return anchorInSet(*first, false);
            }
            return InputsAnchor{first, true, false};
        }

        const std::vector<const Binding*> topLevel = resolver.findAll(root, kInputsPath);
        if (resolver.hasErrors())
        {
            append(m_diagnostics, resolver.diagnostics());
            return std::nullopt;
        }

        if (topLevel.empty())
        {
            return InputsAnchor{};
        }

        const std::vector<const Binding*> inputs = resolver.collectAllInputs(topLevel);
        if (resolver.hasErrors())
        {
            append(m_diagnostics, resolver.diagnostics());
            return std::nullopt;
        }

        if (!inputs.empty())
        {
            const Binding* last = inputs.back();
            return InputsAnchor{last, isQualifiedInput(*last), false};
        }

        // Only `inputs` declarations that do not name a url, e.g. `inputs = { };`.
        const Binding* last = topLevel.back();
        if (last->from.size() == 1)
        {
            return anchorInSet(*last, true);
        }
        return InputsAnchor{last, true, false};
    }

    SourceLocation InsertionPlanner::editLocation(const AttrClassification& classification, InsertionLocation location) const
    {
        struct Locator
        {
            InsertionLocation location;

            SourceLocation operator()(const HasInputs& item) const
            {
                const SourceSpan& span = item.anchor.binding->span;
                return (location == InsertionLocation::Bottom && !item.anchor.emptySet) ? span.end : span.begin;
            }

            SourceLocation operator()(const HasOutputs& item) const
            {
                return (item.binding->to != nullptr) ? item.binding->to->span.begin : item.binding->span.begin;
            }

            SourceLocation operator()(const MissingInputs& item) const { return item.outputsSpan.begin; }
            SourceLocation operator()(const MissingOutputs& item) const { return item.inputsSpan.begin; }
            SourceLocation operator()(const MissingInputsAndOutputs& item) const { return item.rootSpan.begin; }
        };

        return std::visit(Locator{location}, classification);
    }

    bool InsertionPlanner::apply(const HasInputs& item, const Request& request, TextBuffer& buffer)
    {
        const std::string declaration = formatInputDeclaration(request.inputName, request.inputUrl, item.anchor.qualified);

        if (item.anchor.emptySet)
        {
            return insertIntoEmptySet(*item.anchor.binding, declaration, buffer);
        }
        if (request.location == InsertionLocation::Top)
        {
            return insertAbove(item.anchor.binding->span, declaration, false, buffer);
        }
        return insertBelow(item.anchor.binding->span, declaration, buffer);
    }

    bool InsertionPlanner::apply(const HasOutputs& item, const Request& request, TextBuffer& buffer)
    {
        const Expression* value = item.binding->to.get();
        if (value == nullptr || value->kind != ExpressionKind::Function)
        {
            const SourceSpan span = (value != nullptr) ? value->span : item.binding->span;
            const std::string_view kind = (value != nullptr) ? frontend::toString(value->kind) : "Invalid";
            m_diagnostics.emplace_back(makeError(EditErrorKind::UnsupportedExpressionKind,
                "unsupported `outputs` expression type " + std::string{kind} + " (at " + describeLocation(span.begin) + ")",
                span));
            return false;
        }

        // A bare parameter already receives every input.
        if (value->head.kind == frontend::FunctionHeadKind::Simple)
        {
            return true;
        }

        OutputsFunctionPatcher patcher;
        const bool patched = patcher.patch(value->head, request.inputName, buffer);
        append(m_diagnostics, patcher.diagnostics());
        return patched;
    }

    bool InsertionPlanner::apply(const MissingInputs& item, const Request& request, TextBuffer& buffer)
    {
        const std::string declaration = formatInputDeclaration(request.inputName, request.inputUrl, true);
        return insertAbove(item.outputsSpan, declaration, true, buffer);
    }

    bool InsertionPlanner::apply(const MissingOutputs& item, const Request&, TextBuffer&)
    {
        m_diagnostics.emplace_back(makeError(EditErrorKind::MissingOutputs,
            "flake was missing an `outputs` attribute (inputs declared at " + describeLocation(item.inputsSpan.begin) + ")",
            item.inputsSpan));
        return false;
    }

    bool InsertionPlanner::apply(const MissingInputsAndOutputs& item, const Request&, TextBuffer&)
    {
        m_diagnostics.emplace_back(makeError(EditErrorKind::MissingInputsAndOutputs,
            "flake was missing both the `inputs` and `outputs` attributes",
            item.rootSpan));
        return false;
    }

    bool InsertionPlanner::insertIntoEmptySet(const Binding& inputs, const std::string& declaration, TextBuffer& buffer)
    {
        const std::optional<ByteRange> range = buffer.rangeOf(inputs.to->span, m_diagnostics);
        if (!range.has_value())
        {
            return false;
        }

        const std::string& text = buffer.text();
        const std::size_t open = text.find('{', range->begin);
        if (open == std::string::npos || open >= range->end || range->end == 0)
        {
            m_diagnostics.emplace_back(makeError(EditErrorKind::PositionNotFound,
                "could not find the braces of the `inputs` set at " + describeLocation(inputs.to->span.begin),
                inputs.to->span));
            return false;
        }

        const std::size_t close = range->end - 1;
        const std::string_view inside = std::string_view{text}.substr(open + 1, close - open - 1);
        if (inside.find_first_not_of(" \t\r\n") == std::string_view::npos)
        {
            buffer.replace(ByteRange{open, range->end}, "{ " + declaration + " }");
            return true;
        }

        // Only comments inside; keep them.
        buffer.insert(close, " " + declaration + " ");
        return true;
    }

    bool InsertionPlanner::insertAbove(const SourceSpan& anchor, const std::string& declaration, bool separate, TextBuffer& buffer)
    {
        const std::optional<std::string> indentation = buffer.linePrefix(anchor.begin, m_diagnostics);
        if (!indentation.has_value())
        {
            return false;
        }

        if (!isBlank(*indentation))
        {
            const std::optional<std::size_t> offset = buffer.offsetOf(anchor.begin, m_diagnostics);
            if (!offset.has_value())
            {
                return false;
            }
            buffer.insert(*offset, declaration + " ");
            return true;
        }

        const std::optional<std::size_t> lineStart = buffer.offsetOf(SourceLocation{anchor.begin.line, 1}, m_diagnostics);
        if (!lineStart.has_value())
        {
            return false;
        }

        // Reuse the anchor line's terminator so CRLF files stay CRLF.
        const std::size_t lineEnd = buffer.text().find('\n', *lineStart);
        const bool crlf = lineEnd != std::string::npos && lineEnd > *lineStart && buffer.text()[lineEnd - 1] == '\r';
        const std::string newline = crlf ? "\r\n" : "\n";

        std::string text = *indentation + declaration + newline;
        if (separate)
        {
            text += newline;
        }
        buffer.insert(*lineStart, text);
        return true;
    }

    bool InsertionPlanner::insertBelow(const SourceSpan& anchor, const std::string& declaration, TextBuffer& buffer)
    {
        const std::optional<std::string> indentation = buffer.linePrefix(anchor.begin, m_diagnostics);
        if (!indentation.has_value())
        {
            return false;
        }

        const std::optional<std::size_t> end = buffer.offsetOf(anchor.end, m_diagnostics);
        if (!end.has_value())
        {
            return false;
        }

        const std::string& text = buffer.text();
        std::size_t lineEnd = text.find('\n', *end);
        if (lineEnd == std::string::npos)
        {
            lineEnd = text.size();
        }

        std::string_view rest = std::string_view{text}.substr(*end, lineEnd - *end);
        const std::size_t firstVisible = rest.find_first_not_of(" \t\r");
        const bool restIsTrivia = firstVisible == std::string_view::npos || rest[firstVisible] == '#';

        if (!isBlank(*indentation) || !restIsTrivia)
        {
            buffer.insert(*end, " " + declaration);
            return true;
        }

        std::string newline = "\n";
        if (lineEnd > *end && text[lineEnd - 1] == '\r')
        {
            --lineEnd;
            newline = "\r\n";
        }

        buffer.insert(lineEnd, newline + *indentation + declaration);
        return true;
    }
} // namespace flakeedit::edit
