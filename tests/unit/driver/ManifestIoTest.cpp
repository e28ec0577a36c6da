#include <gtest/gtest.h>

#include "manifest_io.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace
{
    std::string readFile(const std::filesystem::path& path)
    {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    void writeFile(const std::filesystem::path& path, const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
    }

    std::filesystem::path makeTempRoot()
    {
        const auto timestamp
            = std::chrono::high_resolution_clock::now().time_since_epoch().count();
        std::filesystem::path root = std::filesystem::temp_directory_path();
        root /= "flakeedit-manifest-" + std::to_string(timestamp);
        return root;
    }

    TEST(ManifestIoTest, LoadsExistingManifestVerbatim)
    {
        const auto tempRoot = makeTempRoot();
        const auto manifestPath = tempRoot / "flake.nix";
        const std::string content = "{\n  inputs.a.url = \"A\";\n  outputs = inputs: { };\n}\n";
        writeFile(manifestPath, content);

        std::string errorMessage;
        const auto manifest = flakeedit::loadManifest(manifestPath, errorMessage);

        ASSERT_TRUE(manifest.has_value()) << errorMessage;
        EXPECT_EQ(manifest->text, content);
        EXPECT_FALSE(manifest->usedFallback);
        EXPECT_TRUE(manifest->parsed.diagnostics.empty());
        EXPECT_EQ(manifest->parsed.root.bindings.size(), 2u);

        std::error_code cleanupError;
        std::filesystem::remove_all(tempRoot, cleanupError);
    }

    TEST(ManifestIoTest, MissingBlankOrEmptyManifestUsesFallback)
    {
        const auto tempRoot = makeTempRoot();
        writeFile(tempRoot / "blank" / "flake.nix", "  \n\t\n");
        writeFile(tempRoot / "empty" / "flake.nix", "{ }\n");

        for (const auto& path : {tempRoot / "missing" / "flake.nix", tempRoot / "blank" / "flake.nix", tempRoot / "empty" / "flake.nix"})
        {
            std::string errorMessage;
            const auto manifest = flakeedit::loadManifest(path, errorMessage);

            ASSERT_TRUE(manifest.has_value()) << errorMessage;
            EXPECT_TRUE(manifest->usedFallback) << path;
            EXPECT_EQ(manifest->text, flakeedit::kFallbackManifest);
            EXPECT_TRUE(manifest->parsed.diagnostics.empty());
        }

        std::error_code cleanupError;
        std::filesystem::remove_all(tempRoot, cleanupError);
    }

    TEST(ManifestIoTest, SyntaxErrorsAreReportedNotReplaced)
    {
        const auto tempRoot = makeTempRoot();
        const auto manifestPath = tempRoot / "flake.nix";
        writeFile(manifestPath, "{ inputs.a.url = \"A\" }");

        std::string errorMessage;
        const auto manifest = flakeedit::loadManifest(manifestPath, errorMessage);

        ASSERT_TRUE(manifest.has_value()) << errorMessage;
        EXPECT_FALSE(manifest->usedFallback);
        EXPECT_FALSE(manifest->parsed.diagnostics.empty());

        std::error_code cleanupError;
        std::filesystem::remove_all(tempRoot, cleanupError);
    }

    TEST(ManifestIoTest, WritesManifestAndCreatesDirectories)
    {
        const auto tempRoot = makeTempRoot();
        const auto manifestPath = tempRoot / "nested" / "flake.nix";

        std::string errorMessage;
        ASSERT_TRUE(flakeedit::writeManifest(manifestPath, flakeedit::kFallbackManifest, errorMessage)) << errorMessage;
        EXPECT_EQ(readFile(manifestPath), flakeedit::kFallbackManifest);

        ASSERT_TRUE(flakeedit::writeManifest(manifestPath, "{ }\n", errorMessage)) << errorMessage;
        EXPECT_EQ(readFile(manifestPath), "{ }\n");

        std::error_code cleanupError;
        std::filesystem::remove_all(tempRoot, cleanupError);
    }
} // namespace
