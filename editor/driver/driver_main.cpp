#include "command_line.hpp"
#include "flake_reference.hpp"
#include "input_inventory.hpp"
#include "input_upserter.hpp"
#include "manifest_io.hpp"
#include "parser.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifndef FLAKEEDIT_BUILD_PROFILE
#define FLAKEEDIT_BUILD_PROFILE "local"
#endif

namespace flakeedit
{
    namespace
    {
        // Progress output on stdout. Silent in --dry-run so the manifest can be redirected.
        class ProgressLog
        {
        public:
            ProgressLog(bool quiet, bool verbose)
                : m_quiet(quiet)
                , m_verbose(verbose)
            {
            }

            void information(std::string_view message) const { write("[information] ", message, true); }
            void notice(std::string_view message) const { write("[notice] ", message, true); }
            void debug(std::string_view message) const { write("[debug] ", message, m_verbose); }

        private:
            void write(std::string_view tag, std::string_view message, bool enabled) const
            {
                if (m_quiet || !enabled)
                {
                    return;
                }
                std::cout << tag << message << '\n';
            }

            bool m_quiet{false};
            bool m_verbose{false};
        };

        template <typename DiagnosticList>
        void reportDiagnostics(const DiagnosticList& diagnostics)
        {
            for (const auto& diagnostic : diagnostics)
            {
                std::cerr << diagnostic.code << ' '
                          << "L" << diagnostic.span.begin.line << ":C" << diagnostic.span.begin.column
                          << " -> "
                          << diagnostic.message << '\n';
            }
        }

        std::optional<LoadedManifest> openManifest(const CommandLineOptions& options, const ProgressLog& log)
        {
            std::string errorMessage;
            std::optional<LoadedManifest> manifest = loadManifest(options.flakePath, errorMessage);
            if (!manifest.has_value())
            {
                std::cerr << "FLAKEEDIT-E3000 ManifestReadFailed: " << errorMessage << '\n';
                return std::nullopt;
            }

            if (manifest->usedFallback)
            {
                log.notice("'" + options.flakePath + "' is missing or empty; starting from a minimal flake.");
            }

            if (!manifest->parsed.diagnostics.empty())
            {
                reportDiagnostics(manifest->parsed.diagnostics);
                return std::nullopt;
            }

            log.debug("Parsed '" + options.flakePath + "' (" + std::to_string(manifest->text.size()) + " bytes).");
            return manifest;
        }
    } // namespace

    void printHelp()
    {
        std::cout << "flakeedit - add or update inputs of a flake.nix\n"
                  << "Usage: flakeedit [options] <input-ref>\n"
                  << "       flakeedit --list [--flake-path <path>]\n\n"
                  << "Input references:\n"
                  << "  github:NixOS/nixpkgs/nixos-23.05   Name inferred from the second path segment.\n"
                  << "  https://host/path                  Requires --input-name.\n\n"
                  << "Options:\n"
                  << "  --help                         Show this help text and exit.\n"
                  << "  --version                      Show version information and exit.\n"
                  << "  --flake-path <path>            Manifest to edit. Default: ./flake.nix.\n"
                  << "  --input-name <name>            Name of the input. Default: inferred from the reference.\n"
                  << "  --insertion-location <where>   Place new inputs at the top or bottom. Default: top.\n"
                  << "  --dry-run                      Print the edited manifest instead of writing it.\n"
                  << "  --list                         List the inputs the manifest declares.\n"
                  << "  --verbose                      Show debug output.\n";
    }

    void printVersion()
    {
        std::cout << "flakeedit 0.1.0 (build profile: " << FLAKEEDIT_BUILD_PROFILE << ")\n";
    }

    int runList(const CommandLineOptions& options)
    {
        const ProgressLog log{false, options.verbose};
        log.information("Listing inputs of '" + options.flakePath + "'.");

        const std::optional<LoadedManifest> manifest = openManifest(options, log);
        if (!manifest.has_value())
        {
            return 1;
        }

        edit::InputInventory inventory;
        const std::optional<std::vector<edit::InputEntry>> inputs = inventory.listInputs(manifest->parsed.root);
        if (!inputs.has_value())
        {
            reportDiagnostics(inventory.diagnostics());
            return 1;
        }

        if (inputs->empty())
        {
            log.notice("No inputs declared.");
            return 0;
        }

        for (const edit::InputEntry& input : *inputs)
        {
            std::cout << input.name << '\t' << input.url.value_or("(no literal url)") << '\n';
        }
        return 0;
    }

    int runUpsert(const CommandLineOptions& options)
    {
        const ProgressLog log{options.dryRun, options.verbose};

        ReferenceError referenceError;
        const std::optional<FlakeInput> input = inferInput(*options.inputReference, options.inputName, referenceError);
        if (!input.has_value())
        {
            std::cerr << referenceError.code << ' ' << referenceError.message << '\n';
            return 1;
        }

        log.information("Adding input '" + input->name + "' -> " + input->url);
        log.debug("flake path: " + options.flakePath);
        log.debug("insertion location: " + std::string{edit::toString(options.insertionLocation)});

        const std::optional<LoadedManifest> manifest = openManifest(options, log);
        if (!manifest.has_value())
        {
            return 1;
        }

        edit::UpsertRequest request;
        request.inputName = input->name;
        request.inputUrl = input->url;
        request.insertionLocation = options.insertionLocation;

        edit::InputUpserter upserter;
        const std::optional<std::string> updated = upserter.upsert(manifest->parsed.root, manifest->text, request);
        reportDiagnostics(upserter.diagnostics());
        if (!updated.has_value())
        {
            std::cerr << "FLAKEEDIT-W3001 Manifest left unchanged.\n";
            return 1;
        }

        const frontend::ParsedManifest check = frontend::parseManifest(*updated, options.flakePath);
        if (!check.diagnostics.empty())
        {
            reportDiagnostics(check.diagnostics);
            std::cerr << "FLAKEEDIT-E3002 EditedManifestInvalid: the edited manifest no longer parses; nothing was written.\n";
            return 1;
        }

        if (options.dryRun)
        {
            std::cout << *updated;
            return 0;
        }

        if (*updated == manifest->text && !manifest->usedFallback)
        {
            log.notice("'" + options.flakePath + "' already up to date.");
            return 0;
        }

        std::string errorMessage;
        if (!writeManifest(options.flakePath, *updated, errorMessage))
        {
            std::cerr << "FLAKEEDIT-E3001 ManifestWriteFailed: " << errorMessage << '\n';
            return 1;
        }

        log.notice("Wrote '" + options.flakePath + "'.");
        return 0;
    }
} // namespace flakeedit

int main(int argc, char** argv)
{
    flakeedit::CommandLineParser parser;
    const auto options = parser.parse(argc, argv);

    if (!options.has_value())
    {
        return 1;
    }

    if (options->showHelp)
    {
        flakeedit::printHelp();
        return 0;
    }

    if (options->showVersion)
    {
        flakeedit::printVersion();
        return 0;
    }

    if (options->listInputs)
    {
        return flakeedit::runList(options.value());
    }

    return flakeedit::runUpsert(options.value());
}
