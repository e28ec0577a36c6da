#include "literal_writer.hpp"

#include <array>
#include <cctype>

namespace flakeedit::edit
{
    namespace
    {
        constexpr std::array<std::string_view, 10> kKeywords{
            "let", "in", "rec", "inherit", "if", "then", "else", "with", "assert", "or"};
    }

    std::string escapeString(std::string_view text)
    {
        std::string escaped;
        escaped.reserve(text.size());

        for (std::size_t index = 0; index < text.size(); ++index)
        {
            const char ch = text[index];
            if (ch == '"' || ch == '\\')
            {
                escaped.push_back('\\');
            }
            else if (ch == '$' && index + 1 < text.size() && text[index + 1] == '{')
            {
                escaped.push_back('\\');
            }
            escaped.push_back(ch);
        }

        return escaped;
    }

    std::string escapeIndentedString(std::string_view text)
    {
        std::string escaped;
        escaped.reserve(text.size());

        for (std::size_t index = 0; index < text.size(); ++index)
        {
            const char ch = text[index];
            if (ch == '\'' && index + 1 < text.size() && text[index + 1] == '\'')
            {
                escaped.append("'''");
                ++index;
                continue;
            }
            if (ch == '$' && index + 1 < text.size() && text[index + 1] == '{')
            {
                escaped.append("''");
            }
            escaped.push_back(ch);
        }

        return escaped;
    }

    std::string quoteString(std::string_view text)
    {
        return "\"" + escapeString(text) + "\"";
    }

    bool isPlainIdentifier(std::string_view name) noexcept
    {
        if (name.empty())
        {
            return false;
        }

        const unsigned char first = static_cast<unsigned char>(name.front());
        if (!std::isalpha(first) && first != '_')
        {
            return false;
        }

        for (const char ch : name)
        {
            const unsigned char value = static_cast<unsigned char>(ch);
            if (!std::isalnum(value) && ch != '_' && ch != '\'' && ch != '-')
            {
                return false;
            }
        }

        for (const std::string_view keyword : kKeywords)
        {
            if (name == keyword)
            {
                return false;
            }
        }

        return true;
    }

    std::string formatAttributeName(std::string_view name)
    {
        if (isPlainIdentifier(name))
        {
            return std::string{name};
        }
        return quoteString(name);
    }
} // namespace flakeedit::edit
