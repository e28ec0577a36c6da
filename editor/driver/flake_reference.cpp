#include "flake_reference.hpp"

#include <cctype>
#include <vector>

namespace flakeedit
{
    namespace
    {
        struct ParsedUrl
        {
            std::string_view scheme;
            std::string_view authority;
            std::string_view path;
            bool hasAuthority{false};
        };

        bool isSchemeCharacter(char ch)
        {
            return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
        }

        std::optional<ParsedUrl> parseUrl(std::string_view text)
        {
            const std::size_t colon = text.find(':');
            if (colon == std::string_view::npos || colon == 0 || !std::isalpha(static_cast<unsigned char>(text.front())))
            {
                return std::nullopt;
            }

            for (std::size_t index = 0; index < colon; ++index)
            {
                if (!isSchemeCharacter(text[index]))
                {
                    return std::nullopt;
                }
            }

            ParsedUrl url;
            url.scheme = text.substr(0, colon);
            std::string_view rest = text.substr(colon + 1);

            if (rest.rfind("//", 0) == 0)
            {
                rest.remove_prefix(2);
                const std::size_t authorityEnd = rest.find_first_of("/?#");
                url.authority = rest.substr(0, authorityEnd);
                url.hasAuthority = !url.authority.empty();
                rest = (authorityEnd == std::string_view::npos) ? std::string_view{} : rest.substr(authorityEnd);
            }

            url.path = rest.substr(0, rest.find_first_of("?#"));
            return url;
        }

        std::vector<std::string_view> split(std::string_view text, char separator)
        {
            std::vector<std::string_view> pieces;
            std::size_t start = 0;
            while (true)
            {
                const std::size_t next = text.find(separator, start);
                if (next == std::string_view::npos)
                {
                    pieces.push_back(text.substr(start));
                    return pieces;
                }
                pieces.push_back(text.substr(start, next - start));
                start = next + 1;
            }
        }
    } // namespace

    bool isPlausibleVersion(std::string_view version)
    {
        constexpr std::string_view archiveSuffix = ".tar.gz";
        if (version.size() >= archiveSuffix.size() && version.substr(version.size() - archiveSuffix.size()) == archiveSuffix)
        {
            version.remove_suffix(archiveSuffix.size());
        }
        if (!version.empty() && version.front() == 'v')
        {
            version.remove_prefix(1);
        }

        const std::vector<std::string_view> components = split(version, '.');
        if (components.size() > 3)
        {
            return false;
        }

        for (const std::string_view component : components)
        {
            if (component.empty())
            {
                return false;
            }
            if (component == "*" || component == "x" || component == "X")
            {
                continue;
            }
            for (const char ch : component)
            {
                if (!std::isdigit(static_cast<unsigned char>(ch)))
                {
                    return false;
                }
            }
        }

        return true;
    }

    std::optional<FlakeInput> inferInput(std::string_view reference,
        const std::optional<std::string>& explicitName,
        ReferenceError& error)
    {
        while (!reference.empty() && reference.back() == '/')
        {
            reference.remove_suffix(1);
        }

        if (reference.empty())
        {
            error = {"FLAKEEDIT-E3006", "the input reference is empty"};
            return std::nullopt;
        }

        const std::optional<ParsedUrl> url = parseUrl(reference);

        if (url.has_value() && !url->hasAuthority)
        {
            if (explicitName.has_value())
            {
                return FlakeInput{*explicitName, std::string{reference}};
            }

            // `github:NixOS/nixpkgs`: the first segment is the owner, the second the project.
            const std::vector<std::string_view> segments = split(url->path, '/');
            if (segments.size() >= 2 && !segments[1].empty())
            {
                return FlakeInput{std::string{segments[1]}, std::string{reference}};
            }

            error = {"FLAKEEDIT-E3003",
                "cannot infer an input name for `" + std::string{reference} + "`; please specify one with the `--input-name` flag"};
            return std::nullopt;
        }

        if (url.has_value())
        {
            if (explicitName.has_value())
            {
                return FlakeInput{*explicitName, std::string{reference}};
            }

            error = {"FLAKEEDIT-E3003",
                "cannot infer an input name for `" + std::string{reference} + "`; please specify one with the `--input-name` flag"};
            return std::nullopt;
        }

        const std::vector<std::string_view> parts = split(reference, '/');
        if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() || parts[1].empty())
        {
            error = {"FLAKEEDIT-E3006",
                "input reference `" + std::string{reference} + "` did not match the expected format of `org/project` or `org/project/version`"};
            return std::nullopt;
        }

        if (parts.size() == 3 && !isPlausibleVersion(parts[2]))
        {
            error = {"FLAKEEDIT-E3005",
                "version '" + std::string{parts[2]} + "' was not a valid version requirement"};
            return std::nullopt;
        }

        error = {"FLAKEEDIT-E3004",
            "`" + std::string{reference} + "` must be resolved through the flake registry, which is not available here; "
            "pass a full flake URL (for example `https://flakehub.com/f/" + std::string{parts[0]} + "/" + std::string{parts[1]}
                + "/*`) together with `--input-name`"};
        return std::nullopt;
    }
} // namespace flakeedit
