#pragma once

#include "insertion_planner.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace flakeedit
{
    struct CommandLineOptions
    {
        std::optional<std::string> inputReference;
        std::string flakePath{"./flake.nix"};
        std::optional<std::string> inputName;
        edit::InsertionLocation insertionLocation{edit::InsertionLocation::Top};
        bool dryRun{false};
        bool listInputs{false};
        bool verbose{false};
        bool showHelp{false};
        bool showVersion{false};
    };

    class CommandLineParser
    {
    public:
        std::optional<CommandLineOptions> parse(int argc, char** argv) const
        {
            CommandLineOptions options;

            // Value of `--name <value>` or `--name=<value>`; empty when `argument` is another option.
            auto takeValue = [&](std::string_view argument, std::string_view name, int& index, std::optional<std::string>& value) {
                if (argument.rfind(name, 0) != 0)
                {
                    return false;
                }

                const std::string_view rest = argument.substr(name.size());
                if (rest.empty())
                {
                    if (index + 1 < argc)
                    {
                        value = std::string{argv[++index]};
                    }
                    return true;
                }

                if (rest.front() != '=')
                {
                    return false;
                }

                value = std::string{rest.substr(1)};
                return true;
            };

            for (int index = 1; index < argc; ++index)
            {
                std::string_view argument{argv[index]};

                if (argument == "--help" || argument == "-h")
                {
                    options.showHelp = true;
                    return options;
                }

                if (argument == "--version")
                {
                    options.showVersion = true;
                    return options;
                }

                if (argument == "--dry-run")
                {
                    options.dryRun = true;
                    continue;
                }

                if (argument == "--list")
                {
                    options.listInputs = true;
                    continue;
                }

                if (argument == "--verbose")
                {
                    options.verbose = true;
                    continue;
                }

                std::optional<std::string> value;

                if (takeValue(argument, "--flake-path", index, value))
                {
                    if (!value.has_value() || value->empty())
                    {
                        std::cerr << "FLAKEEDIT-E1000 MissingValue: expected path after --flake-path option.\n";
                        return std::nullopt;
                    }
                    options.flakePath = *value;
                    continue;
                }

                if (takeValue(argument, "--input-name", index, value))
                {
                    if (!value.has_value() || value->empty())
                    {
                        std::cerr << "FLAKEEDIT-E1000 MissingValue: expected name after --input-name option.\n";
                        return std::nullopt;
                    }
                    options.inputName = *value;
                    continue;
                }

                if (takeValue(argument, "--insertion-location", index, value))
                {
                    if (!value.has_value())
                    {
                        std::cerr << "FLAKEEDIT-E1000 MissingValue: expected top or bottom after --insertion-location option.\n";
                        return std::nullopt;
                    }

                    const std::optional<edit::InsertionLocation> location = edit::parseInsertionLocation(*value);
                    if (!location.has_value())
                    {
                        std::cerr << "FLAKEEDIT-E1003 InvalidInsertionLocation: '" << *value << "' is not one of top, bottom.\n";
                        return std::nullopt;
                    }
                    options.insertionLocation = *location;
                    continue;
                }

                if (!argument.empty() && argument[0] == '-')
                {
                    std::cerr << "FLAKEEDIT-E1001 UnknownOption: unrecognised option '" << argument << "'.\n";
                    return std::nullopt;
                }

                if (options.inputReference.has_value())
                {
                    std::cerr << "FLAKEEDIT-E1004 UnexpectedArgument: only one input reference may be given, found '" << argument << "'.\n";
                    return std::nullopt;
                }

                options.inputReference = std::string{argument};
            }

            if (!options.listInputs && !options.inputReference.has_value())
            {
                std::cerr << "FLAKEEDIT-E1002 MissingInput: an input reference such as github:NixOS/nixpkgs is required.\n";
                return std::nullopt;
            }

            return options;
        }
    };
} // namespace flakeedit
