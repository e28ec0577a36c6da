#include <gtest/gtest.h>

#include "outputs_function_patcher.hpp"
#include "parser.hpp"

namespace flakeedit::edit
{
namespace
{
    struct PatchResult
    {
        bool patched{false};
        std::string text;
        std::vector<Diagnostic> diagnostics;
    };

    PatchResult patchOutputs(const std::string& source, const std::string& inputName)
    {
        const frontend::ParsedManifest parsed = frontend::parseManifest(source, "test");
        EXPECT_TRUE(parsed.diagnostics.empty());

        const frontend::Binding& outputs = parsed.root.bindings.back();
        EXPECT_EQ(outputs.to->kind, frontend::ExpressionKind::Function);

        TextBuffer buffer{source};
        OutputsFunctionPatcher patcher;

        PatchResult result;
        result.patched = patcher.patch(outputs.to->head, inputName, buffer);
        result.text = buffer.text();
        result.diagnostics = patcher.diagnostics();
        return result;
    }

    TEST(OutputsFunctionPatcherTest, AppendsAfterLastArgument)
    {
        const PatchResult result = patchOutputs("{ outputs = { self, nixpkgs }: { }; }", "flake-utils");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, "{ outputs = { self, nixpkgs, flake-utils }: { }; }");
        EXPECT_TRUE(result.diagnostics.empty());
    }

    TEST(OutputsFunctionPatcherTest, InsertsBeforeLoneEllipsis)
    {
        const PatchResult result = patchOutputs("{ outputs = { ... }: { }; }", "nixpkgs");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, "{ outputs = { nixpkgs, ... }: { }; }");
    }

    TEST(OutputsFunctionPatcherTest, KeepsEllipsisLast)
    {
        const PatchResult result = patchOutputs("{ outputs = { self, ... } @ inputs: { }; }", "nixpkgs");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, "{ outputs = { self, nixpkgs, ... } @ inputs: { }; }");
    }

    TEST(OutputsFunctionPatcherTest, ExistingArgumentIsLeftAlone)
    {
        const std::string source = "{ outputs = { self, nixpkgs, ... }: { }; }";
        const PatchResult result = patchOutputs(source, "nixpkgs");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, source);
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_TRUE(result.diagnostics.front().isWarning);
        EXPECT_EQ(result.diagnostics.front().code, "FLAKEEDIT-W4101");
    }

    TEST(OutputsFunctionPatcherTest, PatchingTwiceDoesNotDuplicate)
    {
        const PatchResult first = patchOutputs("{ outputs = { self }: { }; }", "nixpkgs");
        ASSERT_TRUE(first.patched);
        EXPECT_EQ(first.text, "{ outputs = { self, nixpkgs }: { }; }");

        const PatchResult second = patchOutputs(first.text, "nixpkgs");
        ASSERT_TRUE(second.patched);
        EXPECT_EQ(second.text, first.text);
    }

    TEST(OutputsFunctionPatcherTest, EmptyParameterSetIsRefused)
    {
        const PatchResult result = patchOutputs("{ outputs = { }: { }; }", "nixpkgs");

        EXPECT_FALSE(result.patched);
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().kind, EditErrorKind::EmptyParameterListUnsupported);
        EXPECT_EQ(result.diagnostics.front().code, "FLAKEEDIT-E4008");
        EXPECT_NE(result.diagnostics.front().message.find("outputs = { ... }:"), std::string::npos);
    }

    TEST(OutputsFunctionPatcherTest, RefusesNameThatIsNotAnIdentifier)
    {
        const std::string source = "{ outputs = { self, ... }: { }; }";
        const PatchResult result = patchOutputs(source, "my.repo");

        EXPECT_FALSE(result.patched);
        EXPECT_EQ(result.text, source);
        ASSERT_EQ(result.diagnostics.size(), 1u);
        EXPECT_EQ(result.diagnostics.front().kind, EditErrorKind::ParameterNameNotIdentifier);
        EXPECT_EQ(result.diagnostics.front().code, "FLAKEEDIT-E4011");
        EXPECT_NE(result.diagnostics.front().message.find("--input-name"), std::string::npos);
    }

    TEST(OutputsFunctionPatcherTest, AppendsAfterDefaultValue)
    {
        const PatchResult result = patchOutputs("{ outputs = { self, system ? \"x86_64-linux\" }: { }; }", "nixpkgs");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, "{ outputs = { self, system ? \"x86_64-linux\", nixpkgs }: { }; }");
    }

    TEST(OutputsFunctionPatcherTest, NamesThatAreSubstringsOfEachOther)
    {
        const PatchResult result = patchOutputs("{ outputs = { nixpkgs-lib, nixpkgs }: { }; }", "nix");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, "{ outputs = { nixpkgs-lib, nixpkgs, nix }: { }; }");
    }

    TEST(OutputsFunctionPatcherTest, PreservesLeadingCommaLayoutAndComments)
    {
        const std::string source = R"({
  outputs =
    { self
    , nixpkgs # pinned
    , ...
    }@inputs: { };
})";

        const PatchResult result = patchOutputs(source, "utils");

        ASSERT_TRUE(result.patched);
        EXPECT_EQ(result.text, R"({
  outputs =
    { self
    , nixpkgs, utils # pinned
    , ...
    }@inputs: { };
})");
    }

    TEST(OutputsFunctionPatcherTest, ScansEntriesAroundNestedDefaults)
    {
        const std::vector<FormalEntry> entries = scanParameterSet(R"({ a ? { x = 1; }, b ? "}", ... })");

        ASSERT_EQ(entries.size(), 3u);
        EXPECT_EQ(entries[0].identifier, "a");
        EXPECT_EQ(entries[0].begin, 2u);
        EXPECT_EQ(entries[0].end, 16u);
        EXPECT_EQ(entries[1].identifier, "b");
        EXPECT_EQ(entries[1].begin, 18u);
        EXPECT_EQ(entries[1].end, 25u);
        EXPECT_TRUE(entries[2].isEllipsis);
        EXPECT_EQ(entries[2].begin, 27u);
        EXPECT_EQ(entries[2].end, 30u);
    }
} // namespace
} // namespace flakeedit::edit
