#include <gtest/gtest.h>

#include "input_upserter.hpp"
#include "parser.hpp"

namespace flakeedit::edit
{
namespace
{
    struct UpsertOutcome
    {
        std::optional<std::string> text;
        std::vector<Diagnostic> diagnostics;
    };

    UpsertOutcome runUpsert(const std::string& source,
        const std::string& inputName,
        const std::string& inputUrl,
        InsertionLocation location = InsertionLocation::Top)
    {
        const frontend::ParsedManifest parsed = frontend::parseManifest(source, "test");
        EXPECT_TRUE(parsed.diagnostics.empty())
            << "First diagnostic: " << parsed.diagnostics.front().code << " - " << parsed.diagnostics.front().message;

        UpsertRequest request;
        request.inputName = inputName;
        request.inputUrl = inputUrl;
        request.insertionLocation = location;

        InputUpserter upserter;
        UpsertOutcome outcome;
        outcome.text = upserter.upsert(parsed.root, source, request);
        outcome.diagnostics = upserter.diagnostics();

        if (outcome.text.has_value())
        {
            const frontend::ParsedManifest reparsed = frontend::parseManifest(*outcome.text, "result");
            EXPECT_TRUE(reparsed.diagnostics.empty()) << "Edited manifest no longer parses:\n" << *outcome.text;
        }
        return outcome;
    }

    const std::string kFlakeWithInputSet = R"({
  inputs = {
    nixpkgs.url = "github:NixOS/nixpkgs/nixos-22.11";
  };

  outputs = { self, ... }: { };
}
)";

    TEST(InputUpserterTest, UpdatesUrlInsideInputSet)
    {
        const UpsertOutcome outcome = runUpsert(kFlakeWithInputSet, "nixpkgs", "github:NixOS/nixpkgs/nixos-23.05");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  inputs = {
    nixpkgs.url = "github:NixOS/nixpkgs/nixos-23.05";
  };

  outputs = { self, ... }: { };
}
)");
    }

    TEST(InputUpserterTest, ReplacementOnlyTouchesTheLiteral)
    {
        const std::string oldUrl = "github:NixOS/nixpkgs/nixos-22.11";
        const std::string newUrl = "https://flakehub.com/f/NixOS/nixpkgs/0.2305.*.tar.gz";

        const UpsertOutcome outcome = runUpsert(kFlakeWithInputSet, "nixpkgs", newUrl);
        ASSERT_TRUE(outcome.text.has_value());

        const std::size_t begin = kFlakeWithInputSet.find(oldUrl);
        ASSERT_NE(begin, std::string::npos);
        const std::size_t tail = kFlakeWithInputSet.size() - begin - oldUrl.size();

        EXPECT_EQ(outcome.text->substr(0, begin), kFlakeWithInputSet.substr(0, begin));
        EXPECT_EQ(outcome.text->substr(begin, newUrl.size()), newUrl);
        EXPECT_EQ(outcome.text->substr(outcome.text->size() - tail), kFlakeWithInputSet.substr(begin + oldUrl.size()));
    }

    TEST(InputUpserterTest, UpdatesFlattenedDeclaration)
    {
        const UpsertOutcome outcome = runUpsert("{\n  inputs.nixpkgs.url = \"OLD\";\n  outputs = inputs: { };\n}\n", "nixpkgs", "NEW");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{\n  inputs.nixpkgs.url = \"NEW\";\n  outputs = inputs: { };\n}\n");
    }

    TEST(InputUpserterTest, AddsInputAboveOutputsWhenNoneDeclared)
    {
        const std::string source = R"({
  description = "demo";

  outputs = { self, ... } @ inputs: { };
}
)";

        const UpsertOutcome outcome = runUpsert(source, "nixpkgs", "github:NixOS/nixpkgs");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  description = "demo";

  inputs.nixpkgs.url = "github:NixOS/nixpkgs";

  outputs = { self, nixpkgs, ... } @ inputs: { };
}
)");
    }

    TEST(InputUpserterTest, DoesNotRepeatAnAlreadyNamedArgument)
    {
        const std::string source = R"({
  inputs.flake-utils.url = "github:numtide/flake-utils";
  outputs = { self, nixpkgs, ... }: { };
}
)";

        const UpsertOutcome outcome = runUpsert(source, "nixpkgs", "github:NixOS/nixpkgs");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  inputs.nixpkgs.url = "github:NixOS/nixpkgs";
  inputs.flake-utils.url = "github:numtide/flake-utils";
  outputs = { self, nixpkgs, ... }: { };
}
)");
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::InputAlreadyInParameterList);
        EXPECT_TRUE(outcome.diagnostics.front().isWarning);
    }

    TEST(InputUpserterTest, AppendsAtBottomOfInputSet)
    {
        const std::string source = R"({
  inputs = {
    a.url = "X";
    b.url = "Y";
  };
  outputs = { self, a, b }: { };
}
)";

        const UpsertOutcome outcome = runUpsert(source, "c", "Z", InsertionLocation::Bottom);

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  inputs = {
    a.url = "X";
    b.url = "Y";
    c.url = "Z";
  };
  outputs = { self, a, b, c }: { };
}
)");
    }

    TEST(InputUpserterTest, AppendsInlineInOneLineInputSet)
    {
        const UpsertOutcome outcome = runUpsert(
            "{ inputs = { a.url = \"X\"; b.url = \"Y\"; }; outputs = { self, ... }: { }; }", "c", "Z", InsertionLocation::Bottom);

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs = { a.url = \"X\"; b.url = \"Y\"; c.url = \"Z\"; }; outputs = { self, c, ... }: { }; }");
    }

    TEST(InputUpserterTest, InsertsIntoLoneEllipsis)
    {
        const std::string source = R"({
  inputs.a.url = "A";
  outputs = { ... }: { };
}
)";

        const UpsertOutcome outcome = runUpsert(source, "nixpkgs", "github:NixOS/nixpkgs");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  inputs.nixpkgs.url = "github:NixOS/nixpkgs";
  inputs.a.url = "A";
  outputs = { nixpkgs, ... }: { };
}
)");
    }

    TEST(InputUpserterTest, OutputsBeforeInputsKeepsBothEditsInPlace)
    {
        const std::string source = R"({
  outputs = { self }: { };
  inputs.a.url = "A";
}
)";

        const UpsertOutcome outcome = runUpsert(source, "b", "B");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  outputs = { self, b }: { };
  inputs.b.url = "B";
  inputs.a.url = "A";
}
)");
    }

    TEST(InputUpserterTest, UpgradesBareUriToString)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.nixpkgs.url = github:NixOS/nixpkgs; outputs = inputs: { }; }", "nixpkgs", "github:NixOS/nixpkgs/nixos-23.05");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs.nixpkgs.url = \"github:NixOS/nixpkgs/nixos-23.05\"; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, UpdatesIndentedString)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.nixpkgs.url = ''github:old''; outputs = inputs: { }; }", "nixpkgs", "github:new");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs.nixpkgs.url = ''github:new''; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, UpdatesEmptyString)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.nixpkgs.url = \"\"; outputs = inputs: { }; }", "nixpkgs", "github:new");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs.nixpkgs.url = \"github:new\"; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, EscapesNewUrls)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.a.url = \"A\"; outputs = inputs: { }; }", "b", "git+https://x/y?ref=${tag}\"");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs.b.url = \"git+https://x/y?ref=\\${tag}\\\"\"; inputs.a.url = \"A\"; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, RejectsInterpolatedValue)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.nixpkgs.url = \"github:${owner}/nixpkgs\"; outputs = inputs: { }; }", "nixpkgs", "NEW");

        EXPECT_FALSE(outcome.text.has_value());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::MultiPartValueUnsupported);
        EXPECT_EQ(outcome.diagnostics.front().code, "FLAKEEDIT-E4003");
    }

    TEST(InputUpserterTest, RejectsNonStringValue)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.nixpkgs.url = [ \"x\" ]; outputs = inputs: { }; }", "nixpkgs", "NEW");

        EXPECT_FALSE(outcome.text.has_value());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::AmbiguousOrUnknownValueShape);
        EXPECT_NE(outcome.diagnostics.front().message.find("List"), std::string::npos);
    }

    TEST(InputUpserterTest, NonIdentifierNameCannotJoinDestructuredOutputs)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.a.url = \"X\"; outputs = { self, a }: { }; }", "my.repo", "github:foo/my.repo");

        EXPECT_FALSE(outcome.text.has_value());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::ParameterNameNotIdentifier);
    }

    TEST(InputUpserterTest, NonIdentifierNameIsQuotedForSimpleOutputs)
    {
        const UpsertOutcome outcome = runUpsert("{ inputs.a.url = \"X\"; outputs = inputs: { }; }", "my.repo", "github:foo/my.repo");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{ inputs.\"my.repo\".url = \"github:foo/my.repo\"; inputs.a.url = \"X\"; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, RefusesToCreateOutputs)
    {
        const UpsertOutcome outcome = runUpsert("{\n  inputs.a.url = \"A\";\n}\n", "b", "B");

        EXPECT_FALSE(outcome.text.has_value());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::MissingOutputs);
        EXPECT_EQ(outcome.diagnostics.front().code, "FLAKEEDIT-E4004");
    }

    TEST(InputUpserterTest, RefusesManifestWithoutInputsOrOutputs)
    {
        const UpsertOutcome outcome = runUpsert("{ description = \"d\"; }", "b", "B");

        EXPECT_FALSE(outcome.text.has_value());
        ASSERT_EQ(outcome.diagnostics.size(), 1u);
        EXPECT_EQ(outcome.diagnostics.front().kind, EditErrorKind::MissingInputsAndOutputs);
    }

    TEST(InputUpserterTest, FillsEmptyInputSet)
    {
        const UpsertOutcome outcome = runUpsert("{\n  inputs = { };\n  outputs = { self }: { };\n}\n", "nixpkgs", "U");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{\n  inputs = { nixpkgs.url = \"U\"; };\n  outputs = { self, nixpkgs }: { };\n}\n");
    }

    TEST(InputUpserterTest, CopiesTabIndentation)
    {
        const UpsertOutcome outcome = runUpsert("{\n\tinputs.a.url = \"A\";\n\toutputs = inputs: { };\n}\n", "b", "B");

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, "{\n\tinputs.b.url = \"B\";\n\tinputs.a.url = \"A\";\n\toutputs = inputs: { };\n}\n");
    }

    TEST(InputUpserterTest, BottomInsertionSkipsTrailingComment)
    {
        const std::string source = R"({
  inputs = {
    a.url = "X"; # pinned
  };
  outputs = inputs: { };
}
)";

        const UpsertOutcome outcome = runUpsert(source, "b", "Y", InsertionLocation::Bottom);

        ASSERT_TRUE(outcome.text.has_value());
        EXPECT_EQ(*outcome.text, R"({
  inputs = {
    a.url = "X"; # pinned
    b.url = "Y";
  };
  outputs = inputs: { };
}
)");
    }

    TEST(InputUpserterTest, ExplicitAttributePathOverridesDefault)
    {
        const std::string source = "{ inputs.nixpkgs = { url = \"A\"; }; inputs.mirror.url = \"M\"; outputs = inputs: { }; }";

        const frontend::ParsedManifest parsed = frontend::parseManifest(source, "test");
        ASSERT_TRUE(parsed.diagnostics.empty());

        UpsertRequest request;
        request.inputName = "nixpkgs";
        request.inputUrl = "B";
        request.attributePath = AttrPath{"inputs", "mirror", "url"};

        InputUpserter upserter;
        const std::optional<std::string> text = upserter.upsert(parsed.root, source, request);
        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "{ inputs.nixpkgs = { url = \"A\"; }; inputs.mirror.url = \"B\"; outputs = inputs: { }; }");
    }

    TEST(InputUpserterTest, UpdateValueRewritesLocatedBinding)
    {
        const std::string source = "{ inputs.a.url = \"A\"; outputs = inputs: { }; }";
        const frontend::ParsedManifest parsed = frontend::parseManifest(source, "test");
        ASSERT_TRUE(parsed.diagnostics.empty());

        InputUpserter upserter;
        const std::optional<std::string> text = upserter.updateValue(parsed.root.bindings.front(), "A2", source);

        ASSERT_TRUE(text.has_value());
        EXPECT_EQ(*text, "{ inputs.a.url = \"A2\"; outputs = inputs: { }; }");
        EXPECT_FALSE(upserter.hasErrors());
    }

    TEST(InputUpserterTest, UpdatesFlattenedSampleFlake)
    {
        const std::string source = R"({
  description = "cole-h's NixOS configuration";

  inputs.nixpkgs.url = "github:nixos/nixpkgs/nixos-unstable";
  inputs.agenix-cli = { url = "github:cole-h/agenix-cli"; inputs.nixpkgs.follows = "nixpkgs"; };
  inputs.agenix.url = "github:ryantm/agenix";
  inputs.agenix.inputs.nixpkgs.follows = "nixpkgs";

  outputs = inputs: { };
}
)";

        const UpsertOutcome updated = runUpsert(source, "agenix", "github:ryantm/agenix/0.14.0");
        ASSERT_TRUE(updated.text.has_value());
        EXPECT_NE(updated.text->find("inputs.agenix.url = \"github:ryantm/agenix/0.14.0\";"), std::string::npos);
        EXPECT_NE(updated.text->find("url = \"github:cole-h/agenix-cli\";"), std::string::npos);

        const UpsertOutcome nested = runUpsert(source, "agenix-cli", "github:cole-h/agenix-cli/v2");
        ASSERT_TRUE(nested.text.has_value());
        EXPECT_NE(nested.text->find("inputs.agenix-cli = { url = \"github:cole-h/agenix-cli/v2\";"), std::string::npos);

        const UpsertOutcome added = runUpsert(source, "fh", "https://flakehub.com/f/DeterminateSystems/fh/*", InsertionLocation::Bottom);
        ASSERT_TRUE(added.text.has_value());
        EXPECT_NE(added.text->find("  inputs.agenix.url = \"github:ryantm/agenix\";\n"
                                   "  inputs.fh.url = \"https://flakehub.com/f/DeterminateSystems/fh/*\";\n"
                                   "  inputs.agenix.inputs.nixpkgs.follows"),
            std::string::npos);
    }

    TEST(InputUpserterTest, AddsToSplitInputSetsSample)
    {
        const std::string source = R"({
  inputs = {
    nixpkgs.url = "github:nixos/nixpkgs/nixos-unstable";

    home = {
      url = "github:nix-community/home-manager";
      inputs.nixpkgs.follows = "nixpkgs";
    };
  };

  inputs = {
    # Not flakes
    wezterm = {
      url = "git+https://github.com/wez/wezterm.git?submodules=1";
      flake = false;
    };
  };

  outputs = inputs: { };
}
)";

        const UpsertOutcome top = runUpsert(source, "nix", "github:nixos/nix");
        ASSERT_TRUE(top.text.has_value());
        EXPECT_NE(top.text->find("  inputs = {\n    nix.url = \"github:nixos/nix\";\n    nixpkgs.url"), std::string::npos);

        const UpsertOutcome bottom = runUpsert(source, "nix", "github:nixos/nix", InsertionLocation::Bottom);
        ASSERT_TRUE(bottom.text.has_value());
        EXPECT_NE(bottom.text->find("      flake = false;\n    };\n    nix.url = \"github:nixos/nix\";\n  };"), std::string::npos);

        const UpsertOutcome update = runUpsert(source, "wezterm", "github:wez/wezterm");
        ASSERT_TRUE(update.text.has_value());
        EXPECT_NE(update.text->find("url = \"github:wez/wezterm\";"), std::string::npos);
    }
} // namespace
} // namespace flakeedit::edit
