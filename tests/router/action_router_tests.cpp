#include <gtest/gtest.h>
#include "actiondag/graph/graph_builder.hpp"
#include "actiondag/router/action_router.hpp"
#include "test_support.hpp"

using namespace actiondag;
using actiondag_test::make_action;
using actiondag_test::RecordingHandler;

// =============================================================================
// HandlerRegistry
// =============================================================================

TEST(HandlerRegistryTests, Register_ThenFind)
{
    HandlerRegistry registry;
    auto handler = std::make_shared<RecordingHandler>();
    registry.register_handler(ActionKind::Build, "container", handler);

    EXPECT_EQ(registry.find(ActionKind::Build, "container"), handler);
    EXPECT_EQ(registry.find(ActionKind::Deploy, "container"), nullptr);
    EXPECT_TRUE(registry.contains(ActionKind::Build, "container"));
    EXPECT_EQ(registry.size(), 1u);
}

TEST(HandlerRegistryTests, Register_Twice_ThrowsDuplicateHandler)
{
    HandlerRegistry registry;
    registry.register_handler(ActionKind::Build, "container", std::make_shared<RecordingHandler>());
    EXPECT_THROW(registry.register_handler(ActionKind::Build, "container", std::make_shared<RecordingHandler>()),
                 DuplicateHandlerError);
}

TEST(HandlerRegistryTests, Register_Null_Throws)
{
    HandlerRegistry registry;
    EXPECT_THROW(registry.register_handler(ActionKind::Run, "exec", nullptr), std::invalid_argument);
}

TEST(HandlerRegistryTests, Types_ListedPerKindSorted)
{
    HandlerRegistry registry;
    registry.register_handler(ActionKind::Test, "exec", std::make_shared<RecordingHandler>());
    registry.register_handler(ActionKind::Test, "container", std::make_shared<RecordingHandler>());
    registry.register_handler(ActionKind::Run, "exec", std::make_shared<RecordingHandler>());

    EXPECT_EQ(registry.types(ActionKind::Test), (std::vector<std::string>{"container", "exec"}));
    EXPECT_TRUE(registry.types(ActionKind::Build).empty());
}

TEST(ActionStatusStateTests, ToString)
{
    EXPECT_STREQ(to_string(ActionStatusState::Ready), "ready");
    EXPECT_STREQ(to_string(ActionStatusState::NotReady), "not-ready");
}

// =============================================================================
// ActionRouter
// =============================================================================

class ActionRouterTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registry = std::make_shared<HandlerRegistry>();
        recording = std::make_shared<RecordingHandler>();
        registry->register_handler(ActionKind::Build, "fake", recording);
        router = std::make_shared<ActionRouter>(registry);
    }

    ExecuteResult dispatch(const Action& action)
    {
        return router->dispatch(HandlerContext{action, version, inputs, CancellationToken{}});
    }

    std::shared_ptr<HandlerRegistry> registry;
    std::shared_ptr<RecordingHandler> recording;
    std::shared_ptr<ActionRouter> router;
    std::string version{"v-0123456789"};
    DependencyOutputs inputs;
};

TEST_F(ActionRouterTests, NullRegistry_Throws)
{
    EXPECT_THROW(ActionRouter(nullptr), std::invalid_argument);
}

TEST_F(ActionRouterTests, Dispatch_RoutesByKindAndType)
{
    Action action = make_action(ActionKind::Build, "api");
    ExecuteResult result = dispatch(action);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.outputs.at("name"), "build.api");
    EXPECT_EQ(result.outputs.at("version"), version);
    EXPECT_EQ(recording->execute_calls.load(), 1);
}

TEST_F(ActionRouterTests, GetStatus_ReturnsHandlerState)
{
    Action action = make_action(ActionKind::Build, "api");
    recording->up_to_date.insert(action.key());

    StatusResult status = router->get_status(HandlerContext{action, version, inputs, CancellationToken{}});
    EXPECT_TRUE(status.up_to_date());
    EXPECT_EQ(recording->status_calls.load(), 1);
    EXPECT_EQ(recording->execute_calls.load(), 0);
}

TEST_F(ActionRouterTests, Dispatch_UnknownType_ThrowsUnsupported)
{
    Action action = make_action(ActionKind::Build, "api", {}, "helm");
    try
    {
        dispatch(action);
        FAIL() << "Expected UnsupportedActionTypeError";
    }
    catch (const UnsupportedActionTypeError& e)
    {
        EXPECT_EQ(e.key(), action.key());
        EXPECT_EQ(e.type(), "helm");
    }
}

TEST_F(ActionRouterTests, Dispatch_SameTypeOtherKind_ThrowsUnsupported)
{
    Action action = make_action(ActionKind::Deploy, "api");
    EXPECT_THROW(dispatch(action), UnsupportedActionTypeError);
}

TEST_F(ActionRouterTests, Dispatch_HandlerThrows_WrapsWithCause)
{
    Action action = make_action(ActionKind::Build, "api");
    recording->throw_on_execute.insert(action.key());

    try
    {
        dispatch(action);
        FAIL() << "Expected HandlerExecutionError";
    }
    catch (const HandlerExecutionError& e)
    {
        EXPECT_EQ(e.key(), action.key());
        std::string message = e.what();
        EXPECT_NE(message.find("build.api"), std::string::npos);
        EXPECT_NE(message.find("boom in build.api"), std::string::npos);
        ASSERT_NE(e.cause(), nullptr);
        EXPECT_THROW(std::rethrow_exception(e.cause()), std::runtime_error);
    }
}

TEST_F(ActionRouterTests, Dispatch_ReportedFailure_BecomesHandlerExecutionError)
{
    Action action = make_action(ActionKind::Build, "api");
    recording->report_failure.insert(action.key());

    try
    {
        dispatch(action);
        FAIL() << "Expected HandlerExecutionError";
    }
    catch (const HandlerExecutionError& e)
    {
        EXPECT_NE(std::string(e.what()).find("scripted failure"), std::string::npos);
        EXPECT_EQ(e.cause(), nullptr);
    }
}

TEST_F(ActionRouterTests, Dispatch_CancellationPassesThrough)
{
    auto handler = std::make_shared<FunctionActionHandler>(nullptr, [](const HandlerContext& ctx) -> ExecuteResult {
        ctx.cancel.throw_if_cancelled();
        return ExecuteResult{true, {}, {}};
    });
    registry->register_handler(ActionKind::Run, "cancellable", handler);

    Action action = make_action(ActionKind::Run, "job", {}, "cancellable");
    CancellationSource source;
    source.cancel();
    EXPECT_THROW(router->dispatch(HandlerContext{action, version, inputs, source.token()}),
                 OperationCancelledError);
}

TEST_F(ActionRouterTests, FunctionHandler_WithoutStatus_ReportsNotReady)
{
    auto handler = std::make_shared<FunctionActionHandler>(nullptr, [](const HandlerContext&) {
        return ExecuteResult{true, {}, {}};
    });
    registry->register_handler(ActionKind::Test, "fn", handler);

    Action action = make_action(ActionKind::Test, "t", {}, "fn");
    StatusResult status = router->get_status(HandlerContext{action, version, inputs, CancellationToken{}});
    EXPECT_EQ(status.state, ActionStatusState::NotReady);
}

TEST_F(ActionRouterTests, Validate_ReportsEnabledUnsupportedActions)
{
    Action disabled = make_action(ActionKind::Deploy, "off", {}, "helm");
    disabled.disabled = true;
    auto graph = build_graph({
        make_action(ActionKind::Build, "api"),
        make_action(ActionKind::Run, "job", {}, "helm"),
        disabled,
    });

    EXPECT_EQ(router->find_unsupported(*graph), (std::vector<ActionKey>{ActionKey{ActionKind::Run, "job"}}));
    EXPECT_THROW(router->validate(*graph), UnsupportedActionTypeError);
}

TEST_F(ActionRouterTests, Validate_AllSupported_DoesNotThrow)
{
    auto graph = build_graph({make_action(ActionKind::Build, "api")});
    EXPECT_NO_THROW(router->validate(*graph));
}
