#include <gtest/gtest.h>

#include "command_line.hpp"

namespace
{
    TEST(CommandLineParserTest, ParsesReferenceWithDefaults)
    {
        const char* argv[] = {
            "flakeedit",
            "github:NixOS/nixpkgs"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        ASSERT_TRUE(options->inputReference.has_value());
        EXPECT_EQ(*options->inputReference, "github:NixOS/nixpkgs");
        EXPECT_EQ(options->flakePath, "./flake.nix");
        EXPECT_FALSE(options->inputName.has_value());
        EXPECT_EQ(options->insertionLocation, flakeedit::edit::InsertionLocation::Top);
        EXPECT_FALSE(options->dryRun);
    }

    TEST(CommandLineParserTest, ParsesEqualsForms)
    {
        const char* argv[] = {
            "flakeedit",
            "--flake-path=nix/flake.nix",
            "--input-name=pkgs",
            "--insertion-location=bottom",
            "https://example.com/nixpkgs.tar.gz"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_EQ(options->flakePath, "nix/flake.nix");
        ASSERT_TRUE(options->inputName.has_value());
        EXPECT_EQ(*options->inputName, "pkgs");
        EXPECT_EQ(options->insertionLocation, flakeedit::edit::InsertionLocation::Bottom);
    }

    TEST(CommandLineParserTest, ParsesSeparateArguments)
    {
        const char* argv[] = {
            "flakeedit",
            "--dry-run",
            "--flake-path",
            "../other/flake.nix",
            "--input-name",
            "nixpkgs",
            "github:NixOS/nixpkgs/nixos-23.05",
            "--verbose"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->dryRun);
        EXPECT_TRUE(options->verbose);
        EXPECT_EQ(options->flakePath, "../other/flake.nix");
        EXPECT_EQ(*options->inputName, "nixpkgs");
        EXPECT_EQ(*options->inputReference, "github:NixOS/nixpkgs/nixos-23.05");
    }

    TEST(CommandLineParserTest, MissingOptionValueFails)
    {
        const char* argv[] = {
            "flakeedit",
            "github:NixOS/nixpkgs",
            "--input-name"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, InvalidInsertionLocationFails)
    {
        const char* argv[] = {
            "flakeedit",
            "--insertion-location=middle",
            "github:NixOS/nixpkgs"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        EXPECT_FALSE(options.has_value());
    }

    TEST(CommandLineParserTest, ReferenceIsRequiredUnlessListing)
    {
        const char* bare[] = {
            "flakeedit"
        };
        const char* listing[] = {
            "flakeedit",
            "--list"
        };

        flakeedit::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(bare)), const_cast<char**>(bare)).has_value());

        auto options = parser.parse(static_cast<int>(std::size(listing)), const_cast<char**>(listing));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->listInputs);
        EXPECT_FALSE(options->inputReference.has_value());
    }

    TEST(CommandLineParserTest, RejectsUnknownOptionAndSecondReference)
    {
        const char* unknown[] = {
            "flakeedit",
            "--force",
            "github:NixOS/nixpkgs"
        };
        const char* twice[] = {
            "flakeedit",
            "github:NixOS/nixpkgs",
            "github:numtide/flake-utils"
        };

        flakeedit::CommandLineParser parser;
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(unknown)), const_cast<char**>(unknown)).has_value());
        EXPECT_FALSE(parser.parse(static_cast<int>(std::size(twice)), const_cast<char**>(twice)).has_value());
    }

    TEST(CommandLineParserTest, HelpShortCircuits)
    {
        const char* argv[] = {
            "flakeedit",
            "-h",
            "--bogus"
        };

        flakeedit::CommandLineParser parser;
        auto options = parser.parse(static_cast<int>(std::size(argv)), const_cast<char**>(argv));
        ASSERT_TRUE(options.has_value());
        EXPECT_TRUE(options->showHelp);
        EXPECT_FALSE(options->inputReference.has_value());
    }
} // namespace
