#include <gtest/gtest.h>
#include "actiondag/common/action.hpp"
#include "actiondag/common/artifact_key.hpp"
#include "actiondag/common/engine_errors.hpp"

#include <algorithm>
#include <sstream>

using namespace actiondag;

// =============================================================================
// ActionKind
// =============================================================================

TEST(ActionKindTests, KeyNames_AreLowerCase)
{
    EXPECT_EQ(kind_key_name(ActionKind::Build), "build");
    EXPECT_EQ(kind_key_name(ActionKind::Deploy), "deploy");
    EXPECT_EQ(kind_key_name(ActionKind::Run), "run");
    EXPECT_EQ(kind_key_name(ActionKind::Test), "test");
}

TEST(ActionKindTests, DisplayNames_AreCapitalized)
{
    EXPECT_EQ(kind_display_name(ActionKind::Deploy), "Deploy");
}

TEST(ActionKindTests, Parse_IsCaseInsensitive)
{
    EXPECT_EQ(parse_action_kind("Deploy"), ActionKind::Deploy);
    EXPECT_EQ(parse_action_kind("TEST"), ActionKind::Test);
    EXPECT_EQ(parse_action_kind("run"), ActionKind::Run);
}

TEST(ActionKindTests, Parse_UnknownKind_ReturnsNullopt)
{
    EXPECT_FALSE(parse_action_kind("module").has_value());
    EXPECT_FALSE(parse_action_kind("").has_value());
}

// =============================================================================
// ActionKey
// =============================================================================

TEST(ActionKeyTests, ToString_RendersKindDotName)
{
    EXPECT_EQ(ActionKey(ActionKind::Deploy, "backend").to_string(), "deploy.backend");
}

TEST(ActionKeyTests, StreamOutput_MatchesToString)
{
    std::ostringstream oss;
    oss << ActionKey(ActionKind::Build, "api");
    EXPECT_EQ(oss.str(), "build.api");
}

TEST(ActionKeyTests, Equality_IgnoresNothingButKindAndName)
{
    EXPECT_EQ(ActionKey(ActionKind::Run, "x"), ActionKey(ActionKind::Run, "x"));
    EXPECT_NE(ActionKey(ActionKind::Run, "x"), ActionKey(ActionKind::Test, "x"));
    EXPECT_NE(ActionKey(ActionKind::Run, "x"), ActionKey(ActionKind::Run, "y"));
}

TEST(ActionKeyTests, Ordering_MatchesRenderedStrings)
{
    std::vector<ActionKey> keys = {
        {ActionKind::Test, "a"},
        {ActionKind::Build, "z"},
        {ActionKind::Deploy, "m"},
        {ActionKind::Build, "b"},
        {ActionKind::Run, "a"},
    };
    std::sort(keys.begin(), keys.end());
    for (size_t i = 1; i < keys.size(); ++i)
    {
        EXPECT_LT(keys[i - 1].to_string(), keys[i].to_string());
    }
}

TEST(ActionKeyTests, Hash_EqualKeysHashEqually)
{
    ActionKeyHash hash;
    EXPECT_EQ(hash(ActionKey(ActionKind::Build, "a")), hash(ActionKey(ActionKind::Build, "a")));
}

// =============================================================================
// Reference parsing
// =============================================================================

TEST(ActionReferenceTests, Parse_KindAndName)
{
    ActionKey key = parse_action_reference("deploy.backend");
    EXPECT_EQ(key.kind, ActionKind::Deploy);
    EXPECT_EQ(key.name, "backend");
}

TEST(ActionReferenceTests, Parse_NameMayContainDots)
{
    ActionKey key = parse_action_reference("Build.api.v2");
    EXPECT_EQ(key.kind, ActionKind::Build);
    EXPECT_EQ(key.name, "api.v2");
}

TEST(ActionReferenceTests, Parse_MissingDot_Throws)
{
    EXPECT_THROW(parse_action_reference("backend"), InvalidActionReferenceError);
}

TEST(ActionReferenceTests, Parse_UnknownKind_Throws)
{
    try
    {
        parse_action_reference("module.backend");
        FAIL() << "Expected InvalidActionReferenceError";
    }
    catch (const InvalidActionReferenceError& e)
    {
        EXPECT_EQ(e.code(), EngineErrorCode::InvalidActionReference);
        EXPECT_EQ(e.reference(), "module.backend");
        EXPECT_NE(std::string(e.what()).find("module"), std::string::npos);
    }
}

TEST(ActionReferenceTests, Parse_EmptyName_Throws)
{
    EXPECT_THROW(parse_action_reference("deploy."), InvalidActionReferenceError);
}

// =============================================================================
// Action
// =============================================================================

TEST(ActionTests, AllDependencies_ExpandsBuildShorthand)
{
    Action action;
    action.kind = ActionKind::Deploy;
    action.name = "backend";
    action.dependencies.push_back(ActionDependency::parse("deploy.db"));
    action.build = "backend";

    auto deps = action.all_dependencies();
    ASSERT_EQ(deps.size(), 2u);
    EXPECT_EQ(deps[0].key, ActionKey(ActionKind::Deploy, "db"));
    EXPECT_FALSE(deps[0].needs_executed_outputs);
    EXPECT_EQ(deps[1].key, ActionKey(ActionKind::Build, "backend"));
    EXPECT_TRUE(deps[1].needs_executed_outputs);
}

TEST(ActionTests, AllDependencies_WithoutShorthand_IsExplicitList)
{
    Action action;
    action.dependencies.push_back(ActionDependency::parse("build.a", true));
    auto deps = action.all_dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_TRUE(deps[0].needs_executed_outputs);
}

// =============================================================================
// Artifact keys
// =============================================================================

TEST(ArtifactKeyTests, Key_IsKindNameVersion)
{
    EXPECT_EQ(artifact_key(ActionKind::Test, "module-a-unit", "v-1234512345"),
              "test.module-a-unit.v-1234512345");
}

TEST(ArtifactKeyTests, MetadataFilename_WrapsKey)
{
    EXPECT_EQ(artifact_metadata_filename("build.api.v-0123456789"), ".metadata.build.api.v-0123456789.json");
}

// =============================================================================
// Error codes
// =============================================================================

TEST(EngineErrorTests, HandlerExecutionError_NamesActionAndKeepsCause)
{
    auto cause = std::make_exception_ptr(std::runtime_error("disk full"));
    HandlerExecutionError error(ActionKey(ActionKind::Build, "api"), "disk full", cause);
    EXPECT_EQ(error.code(), EngineErrorCode::HandlerExecution);
    EXPECT_EQ(std::string(error.what()), "Failed processing build.api: disk full");
    EXPECT_EQ(error.cause(), cause);
}

TEST(EngineErrorTests, ToString_NamesCode)
{
    EXPECT_STREQ(to_string(EngineErrorCode::CyclicDependency), "CyclicDependency");
}
