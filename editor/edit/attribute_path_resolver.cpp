#include "attribute_path_resolver.hpp"

#include <algorithm>

namespace flakeedit::edit
{
    using frontend::Binding;
    using frontend::BindingKind;
    using frontend::Expression;
    using frontend::ExpressionKind;

    const Binding* AttributePathResolver::findFirst(const Expression& expression, const std::optional<AttrPath>& path)
    {
        m_diagnostics.clear();

        std::vector<const Binding*> results;
        const AttrPath* requested = (path.has_value() && !path->empty()) ? &*path : nullptr;
        if (!search(expression, requested, 0, SearchMode::First, results) || results.empty())
        {
            return nullptr;
        }

        return results.front();
    }

    std::vector<const Binding*> AttributePathResolver::findAll(const Expression& expression, const std::optional<AttrPath>& path)
    {
        m_diagnostics.clear();

        std::vector<const Binding*> results;
        const AttrPath* requested = (path.has_value() && !path->empty()) ? &*path : nullptr;
        if (!search(expression, requested, 0, SearchMode::All, results))
        {
            results.clear();
        }

        return results;
    }

    bool AttributePathResolver::search(const Expression& expression,
        const AttrPath* path,
        std::size_t consumed,
        SearchMode mode,
        std::vector<const Binding*>& results)
    {
        if (expression.kind != ExpressionKind::Map)
        {
            reportUnsupportedExpression(expression);
            return false;
        }

        for (const Binding& binding : expression.bindings)
        {
            if (binding.kind == BindingKind::Inherit)
            {
                reportInherit(binding);
                return false;
            }

            if (path == nullptr)
            {
                results.push_back(&binding);
                if (mode == SearchMode::First)
                {
                    return true;
                }
                continue;
            }

            // Walk the requested path and this binding's key side by side. A differing
            // segment means the key is neither a prefix nor an extension of the path.
            std::size_t target = consumed;
            std::size_t key = 0;
            bool mostRecentMatched = false;
            bool mismatched = false;

            while (target < path->size() && key < binding.from.size())
            {
                const frontend::AttributePart& part = binding.from[key];
                if (part.isInterpolation || part.content != (*path)[target])
                {
                    mostRecentMatched = false;
                    mismatched = true;
                    break;
                }

                mostRecentMatched = true;
                ++target;
                ++key;
            }

            if (mismatched)
            {
                continue;
            }

            if (target == path->size() && mostRecentMatched)
            {
                results.push_back(&binding);
                if (mode == SearchMode::First)
                {
                    return true;
                }
                continue;
            }

            if (key == binding.from.size() && binding.to != nullptr)
            {
                const std::size_t before = results.size();
                if (!search(*binding.to, path, target, mode, results))
                {
                    return false;
                }

                if (mode == SearchMode::First && results.size() > before)
                {
                    return true;
                }
            }
        }

        return true;
    }

    std::vector<const Binding*> AttributePathResolver::collectAllInputs(const std::vector<const Binding*>& topLevelInputs)
    {
        m_diagnostics.clear();

        std::vector<const Binding*> inputs;

        auto isInputKey = [](const AttrPath& key, std::size_t first) {
            const std::size_t length = key.size() - first;
            return length == 1 || (length == 2 && key.back() == "url");
        };

        for (const Binding* binding : topLevelInputs)
        {
            const std::optional<AttrPath> key = keySegments(*binding);
            if (!key.has_value() || key->empty() || key->front() != "inputs")
            {
                continue;
            }

            if (key->size() > 1)
            {
                if (isInputKey(*key, 1))
                {
                    inputs.push_back(binding);
                }
                continue;
            }

            // inputs = { ... };
            const Expression& value = *binding->to;
            if (value.kind != ExpressionKind::Map)
            {
                reportUnsupportedExpression(value);
                return {};
            }

            for (const Binding& child : value.bindings)
            {
                if (child.kind == BindingKind::Inherit)
                {
                    reportInherit(child);
                    return {};
                }

                const std::optional<AttrPath> childKey = keySegments(child);
                if (childKey.has_value() && !childKey->empty() && isInputKey(*childKey, 0))
                {
                    inputs.push_back(&child);
                }
            }
        }

        return inputs;
    }

    const std::vector<Diagnostic>& AttributePathResolver::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    bool AttributePathResolver::hasErrors() const noexcept
    {
        return std::any_of(m_diagnostics.begin(), m_diagnostics.end(), [](const Diagnostic& diag) { return !diag.isWarning; });
    }

    void AttributePathResolver::reportInherit(const Binding& binding)
    {
        m_diagnostics.emplace_back(makeError(EditErrorKind::InheritNotSupported,
            "`inherit` not supported (at " + describeLocation(binding.span.begin) + ")",
            binding.span));
    }

    void AttributePathResolver::reportUnsupportedExpression(const Expression& expression)
    {
        m_diagnostics.emplace_back(makeError(EditErrorKind::UnsupportedExpressionKind,
            "unsupported expression type " + std::string{frontend::toString(expression.kind)}
                + " (at " + describeLocation(expression.span.begin) + ")",
            expression.span));
    }

    std::optional<AttrPath> keySegments(const Binding& binding)
    {
        AttrPath segments;
        segments.reserve(binding.from.size());
        for (const frontend::AttributePart& part : binding.from)
        {
            if (part.isInterpolation)
            {
                return std::nullopt;
            }
            segments.push_back(part.content);
        }
        return segments;
    }
} // namespace flakeedit::edit
