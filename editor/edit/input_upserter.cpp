#include "input_upserter.hpp"

#include "literal_writer.hpp"
#include "text_buffer.hpp"

#include <algorithm>

namespace flakeedit::edit
{
    using frontend::Binding;
    using frontend::Expression;
    using frontend::ExpressionKind;

    AttrPath defaultInputPath(std::string_view inputName)
    {
        return AttrPath{"inputs", std::string{inputName}, "url"};
    }

    std::optional<std::string> InputUpserter::upsert(const Expression& root, std::string_view source, const UpsertRequest& request)
    {
        m_diagnostics.clear();

        const AttrPath path = request.attributePath.value_or(defaultInputPath(request.inputName));

        AttributePathResolver resolver;
        const Binding* existing = resolver.findFirst(root, path);
        if (resolver.hasErrors())
        {
            m_diagnostics = resolver.diagnostics();
            return std::nullopt;
        }

        if (existing != nullptr)
        {
            return updateValue(*existing, request.inputUrl, source);
        }

        InsertionPlanner planner;
        std::optional<std::string> result = planner.insert(root, source, request.inputName, request.inputUrl, request.insertionLocation);
        m_diagnostics = planner.diagnostics();
        return result;
    }

    std::optional<std::string> InputUpserter::updateValue(const Binding& binding, std::string_view url, std::string_view source)
    {
        m_diagnostics.clear();

        if (binding.kind != frontend::BindingKind::KeyValue || binding.to == nullptr)
        {
            m_diagnostics.emplace_back(makeError(EditErrorKind::InheritNotSupported,
                "`inherit` not supported (at " + describeLocation(binding.span.begin) + ")",
                binding.span));
            return std::nullopt;
        }

        TextBuffer buffer{std::string{source}};
        if (!replaceValue(*binding.to, url, buffer))
        {
            return std::nullopt;
        }

        return buffer.release();
    }

    bool InputUpserter::replaceValue(const Expression& value, std::string_view url, TextBuffer& buffer)
    {
        switch (value.kind)
        {
        case ExpressionKind::String:
        case ExpressionKind::IndentedString:
        {
            if (value.parts.size() != 1 || value.parts.front().isInterpolation)
            {
                m_diagnostics.emplace_back(makeError(EditErrorKind::MultiPartValueUnsupported,
                    "input value at " + describeLocation(value.span.begin)
                        + " is built from interpolation; only a plain literal can be replaced",
                    value.span));
                return false;
            }

            const std::optional<ByteRange> range = buffer.rangeOf(value.parts.front().span, m_diagnostics);
            if (!range.has_value())
            {
                return false;
            }

            const std::string escaped = (value.kind == ExpressionKind::String) ? escapeString(url) : escapeIndentedString(url);
            buffer.replace(*range, escaped);
            return true;
        }
        case ExpressionKind::Uri:
        {
            const std::optional<ByteRange> range = buffer.rangeOf(value.span, m_diagnostics);
            if (!range.has_value())
            {
                return false;
            }

            buffer.replace(*range, quoteString(url));
            return true;
        }
        default:
            break;
        }

        m_diagnostics.emplace_back(makeError(EditErrorKind::AmbiguousOrUnknownValueShape,
            "unsupported input value type " + std::string{frontend::toString(value.kind)} + " (at "
                + describeLocation(value.span.begin) + "); expected a string or URI literal",
            value.span));
        return false;
    }

    const std::vector<Diagnostic>& InputUpserter::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool InputUpserter::hasErrors() const noexcept
    {
        return std::any_of(m_diagnostics.begin(), m_diagnostics.end(), [](const Diagnostic& diag) { return !diag.isWarning; });
    }
} // namespace flakeedit::edit
