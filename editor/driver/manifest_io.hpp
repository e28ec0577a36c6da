#pragma once

#include "parser.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace flakeedit
{
    // Used in place of a missing, blank or empty (`{ }`) manifest.
    inline constexpr std::string_view kFallbackManifest =
        "{\n"
        "  description = \"My new flake.\";\n"
        "\n"
        "  outputs = { ... } @ inputs: { };\n"
        "}\n";

    struct LoadedManifest
    {
        std::string text;
        frontend::ParsedManifest parsed;
        bool usedFallback{false};
    };

    // Reads and parses the manifest at `path`. Parse diagnostics are left in
    // `parsed.diagnostics`; only I/O failures make this return std::nullopt.
    [[nodiscard]] std::optional<LoadedManifest> loadManifest(const std::filesystem::path& path, std::string& errorMessage);

    [[nodiscard]] bool writeManifest(const std::filesystem::path& path, std::string_view text, std::string& errorMessage);

    [[nodiscard]] bool isEmptyAttributeSet(const frontend::Expression& root) noexcept;
} // namespace flakeedit
