#include "manifest_io.hpp"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace flakeedit
{
    namespace
    {
        bool isWhitespaceOnly(std::string_view text)
        {
            return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
        }
    } // namespace

    bool isEmptyAttributeSet(const frontend::Expression& root) noexcept
    {
        return root.kind == frontend::ExpressionKind::Map && root.bindings.empty();
    }

    std::optional<LoadedManifest> loadManifest(const std::filesystem::path& path, std::string& errorMessage)
    {
        LoadedManifest manifest;

        std::error_code existsError;
        const bool exists = std::filesystem::exists(path, existsError);
        if (existsError)
        {
            errorMessage = "failed to inspect '" + path.string() + "': " + existsError.message();
            return std::nullopt;
        }

        if (exists)
        {
            std::ifstream stream(path, std::ios::binary);
            if (!stream)
            {
                errorMessage = "unable to open '" + path.string() + "'.";
                return std::nullopt;
            }

            std::ostringstream buffer;
            buffer << stream.rdbuf();
            manifest.text = buffer.str();
        }

        if (!exists || isWhitespaceOnly(manifest.text))
        {
            manifest.text = std::string{kFallbackManifest};
            manifest.usedFallback = true;
        }

        manifest.parsed = frontend::parseManifest(manifest.text, path.string());

        if (!manifest.usedFallback && manifest.parsed.diagnostics.empty() && isEmptyAttributeSet(manifest.parsed.root))
        {
            manifest.text = std::string{kFallbackManifest};
            manifest.parsed = frontend::parseManifest(manifest.text, path.string());
            manifest.usedFallback = true;
        }

        return manifest;
    }

    bool writeManifest(const std::filesystem::path& path, std::string_view text, std::string& errorMessage)
    {
        const auto parentDirectory = path.parent_path();
        if (!parentDirectory.empty())
        {
            std::error_code createError;
            std::filesystem::create_directories(parentDirectory, createError);
            if (createError)
            {
                errorMessage = "failed to create directories for '" + path.string() + "': " + createError.message();
                return false;
            }
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + path.string() + "' for writing.";
            return false;
        }

        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        if (!file.good())
        {
            errorMessage = "failed while writing '" + path.string() + "'.";
            return false;
        }

        return true;
    }
} // namespace flakeedit
