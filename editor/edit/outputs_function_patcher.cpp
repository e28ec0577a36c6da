#include "outputs_function_patcher.hpp"

#include "literal_writer.hpp"

#include <cctype>

namespace flakeedit::edit
{
    namespace
    {
        bool isIdentifierStart(char ch)
        {
            return std::isalpha(static_cast<unsigned char>(ch)) || ch == '_';
        }

        bool isIdentifierPart(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '\'' || ch == '-';
        }

        std::size_t skipDoubleQuoted(std::string_view text, std::size_t index)
        {
            ++index; // opening quote
            while (index < text.size() && text[index] != '"')
            {
                index += (text[index] == '\\') ? 2 : 1;
            }
            return (index < text.size()) ? index + 1 : text.size();
        }

        std::size_t skipIndented(std::string_view text, std::size_t index)
        {
            index += 2; // opening ''
            while (index + 1 < text.size())
            {
                if (text[index] == '\'' && text[index + 1] == '\'')
                {
                    const char escaped = (index + 2 < text.size()) ? text[index + 2] : '\0';
                    if (escaped == '\'' || escaped == '$')
                    {
                        index += 3;
                        continue;
                    }
                    if (escaped == '\\')
                    {
                        index += 4;
                        continue;
                    }
                    return index + 2;
                }
                ++index;
            }
            return text.size();
        }
    } // namespace

    std::vector<FormalEntry> scanParameterSet(std::string_view text)
    {
        std::vector<FormalEntry> entries;
        FormalEntry current;
        bool started = false;
        int depth = 0;

        auto mark = [&](std::size_t begin, std::size_t end) {
            if (!started)
            {
                current.begin = begin;
                started = true;
            }
            current.end = end;
        };

        auto finish = [&]() {
            if (started)
            {
                entries.push_back(current);
            }
            current = FormalEntry{};
            started = false;
        };

        std::size_t index = 0;
        while (index < text.size())
        {
            const char ch = text[index];

            if (ch == '#')
            {
                while (index < text.size() && text[index] != '\n')
                {
                    ++index;
                }
                continue;
            }

            if (ch == '/' && index + 1 < text.size() && text[index + 1] == '*')
            {
                const std::size_t close = text.find("*/", index + 2);
                index = (close == std::string_view::npos) ? text.size() : close + 2;
                continue;
            }

            if (ch == '"')
            {
                const std::size_t end = skipDoubleQuoted(text, index);
                mark(index, end);
                index = end;
                continue;
            }

            if (ch == '\'' && index + 1 < text.size() && text[index + 1] == '\'')
            {
                const std::size_t end = skipIndented(text, index);
                mark(index, end);
                index = end;
                continue;
            }

            if (ch == '{' || ch == '[' || ch == '(')
            {
                ++depth;
                if (depth > 1)
                {
                    mark(index, index + 1);
                }
                ++index;
                continue;
            }

            if (ch == '}' || ch == ']' || ch == ')')
            {
                --depth;
                if (depth <= 0)
                {
                    finish();
                    break;
                }
                mark(index, index + 1);
                ++index;
                continue;
            }

            if (depth == 1 && ch == ',')
            {
                finish();
                ++index;
                continue;
            }

            if (std::isspace(static_cast<unsigned char>(ch)))
            {
                ++index;
                continue;
            }

            if (depth == 1 && !started)
            {
                if (text.compare(index, 3, "...") == 0)
                {
                    current.isEllipsis = true;
                    mark(index, index + 3);
                    index += 3;
                    continue;
                }

                if (isIdentifierStart(ch))
                {
                    std::size_t end = index + 1;
                    while (end < text.size() && isIdentifierPart(text[end]))
                    {
                        ++end;
                    }
                    current.identifier = std::string{text.substr(index, end - index)};
                    mark(index, end);
                    index = end;
                    continue;
                }
            }

            mark(index, index + 1);
            ++index;
        }

        return entries;
    }

    bool OutputsFunctionPatcher::patch(const frontend::FunctionHead& head, std::string_view inputName, TextBuffer& buffer)
    {
        m_diagnostics.clear();

        for (const frontend::Formal& formal : head.arguments)
        {
            if (formal.identifier == inputName)
            {
                m_diagnostics.emplace_back(makeWarning(EditErrorKind::InputAlreadyInParameterList,
                    "input " + std::string{inputName} + " was already in the `outputs` function args, not adding it again",
                    formal.span));
                return true;
            }
        }

        // A formal must be a bare identifier; `"my.repo"` is only valid as an attribute name.
        if (!isPlainIdentifier(inputName))
        {
            m_diagnostics.emplace_back(makeError(EditErrorKind::ParameterNameNotIdentifier,
                "input " + std::string{inputName} + " is not a valid identifier, so it cannot be added to the `outputs` function args (at "
                    + describeLocation(head.span.begin) + "); pick another name with `--input-name`",
                head.span));
            return false;
        }

        const std::optional<ByteRange> range = buffer.rangeOf(head.span, m_diagnostics);
        if (!range.has_value())
        {
            return false;
        }

        const std::string_view setText = std::string_view{buffer.text()}.substr(range->begin, range->end - range->begin);
        const std::vector<FormalEntry> entries = scanParameterSet(setText);

        if (!head.arguments.empty())
        {
            const std::string& finalArgument = head.arguments.back().identifier;
            for (auto it = entries.rbegin(); it != entries.rend(); ++it)
            {
                if (!it->isEllipsis && it->identifier == finalArgument)
                {
                    buffer.insert(range->begin + it->end, ", " + std::string{inputName});
                    return true;
                }
            }

            m_diagnostics.emplace_back(makeError(EditErrorKind::ParameterListTokenMissing,
                "could not find `" + finalArgument + "` in the outputs function, but it existed when parsing it",
                head.span));
            return false;
        }

        if (head.ellipsis)
        {
            // The ellipsis is always the final entry, so the new name goes in front of it.
            for (const FormalEntry& entry : entries)
            {
                if (entry.isEllipsis)
                {
                    buffer.insert(range->begin + entry.begin, std::string{inputName} + ", ");
                    return true;
                }
            }

            m_diagnostics.emplace_back(makeError(EditErrorKind::ParameterListTokenMissing,
                "could not find the ellipsis (`...`) in the outputs function, but it existed when parsing it",
                head.span));
            return false;
        }

        m_diagnostics.emplace_back(makeError(EditErrorKind::EmptyParameterListUnsupported,
            "the `outputs` function doesn't take any arguments, and adding an input to it isn't supported; "
            "replace it with `outputs = { ... }:` and try again (at " + describeLocation(head.span.begin) + ")",
            head.span));
        return false;
    }

    const std::vector<Diagnostic>& OutputsFunctionPatcher::diagnostics() const noexcept
    {
        return m_diagnostics;
    }
} // namespace flakeedit::edit
