#include "input_inventory.hpp"

#include "attribute_path_resolver.hpp"

#include <algorithm>
#include <utility>

namespace flakeedit::edit
{
    using frontend::Binding;
    using frontend::Expression;
    using frontend::ExpressionKind;

    std::optional<std::vector<InputEntry>> InputInventory::listInputs(const Expression& root)
    {
        m_diagnostics.clear();

        AttributePathResolver resolver;
        const std::vector<const Binding*> topLevel = resolver.findAll(root, AttrPath{"inputs"});
        if (resolver.hasErrors())
        {
            m_diagnostics = resolver.diagnostics();
            return std::nullopt;
        }

        const std::vector<const Binding*> bindings = resolver.collectAllInputs(topLevel);
        if (resolver.hasErrors())
        {
            m_diagnostics = resolver.diagnostics();
            return std::nullopt;
        }

        std::vector<InputEntry> entries;
        for (const Binding* binding : bindings)
        {
            const std::optional<AttrPath> key = keySegments(*binding);
            if (!key.has_value())
            {
                continue;
            }

            // inputs.<name>.url, inputs.<name>, <name>.url or <name>.
            const std::size_t first = (key->front() == "inputs" && key->size() > 1) ? 1 : 0;
            const std::string& name = (*key)[first];
            const bool keyEndsInUrl = key->size() - first == 2;

            std::optional<std::string> url = readUrl(*binding, keyEndsInUrl);
            if (!m_diagnostics.empty())
            {
                return std::nullopt;
            }

            auto existing = std::find_if(entries.begin(), entries.end(), [&](const InputEntry& entry) { return entry.name == name; });
            if (existing == entries.end())
            {
                entries.push_back(InputEntry{name, std::move(url), binding});
            }
            else if (!existing->url.has_value() && url.has_value())
            {
                existing->url = std::move(url);
                existing->binding = binding;
            }
        }

        return entries;
    }

    const std::vector<Diagnostic>& InputInventory::diagnostics() const noexcept
    {
        return m_diagnostics;
    }

    std::optional<std::string> InputInventory::readUrl(const Binding& binding, bool keyEndsInUrl)
    {
        if (binding.to == nullptr)
        {
            return std::nullopt;
        }

        if (keyEndsInUrl)
        {
            return literalValue(*binding.to);
        }

        if (binding.to->kind != ExpressionKind::Map)
        {
            return std::nullopt;
        }

        AttributePathResolver resolver;
        const Binding* url = resolver.findFirst(*binding.to, AttrPath{"url"});
        if (resolver.hasErrors())
        {
            m_diagnostics = resolver.diagnostics();
            return std::nullopt;
        }

        if (url == nullptr || url->to == nullptr)
        {
            return std::nullopt;
        }
        return literalValue(*url->to);
    }

    std::optional<std::string> literalValue(const Expression& value)
    {
        switch (value.kind)
        {
        case ExpressionKind::String:
        case ExpressionKind::IndentedString:
            if (value.parts.size() == 1 && !value.parts.front().isInterpolation)
            {
                return value.parts.front().content;
            }
            return std::nullopt;
        case ExpressionKind::Uri:
            return value.text;
        default:
            return std::nullopt;
        }
    }
} // namespace flakeedit::edit
