#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace flakeedit
{
    struct FlakeInput
    {
        std::string name;
        std::string url;
    };

    struct ReferenceError
    {
        std::string code;
        std::string message;
    };

    // Turns a command-line reference into an input name and url. Accepted forms:
    //   github:NixOS/nixpkgs/nixos-23.05   name defaults to the second path segment
    //   https://example.com/flake.tar.gz   name must be given explicitly
    //   NixOS/nixpkgs[/version]            registry reference, rejected (no registry access)
    [[nodiscard]] std::optional<FlakeInput> inferInput(std::string_view reference,
        const std::optional<std::string>& explicitName,
        ReferenceError& error);

    // True for version requirements such as `0.2411`, `1.*`, `v2` or `*.tar.gz`.
    [[nodiscard]] bool isPlausibleVersion(std::string_view version);
} // namespace flakeedit
