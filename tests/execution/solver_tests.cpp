#include <gtest/gtest.h>
#include "actiondag/execution/solver.hpp"
#include "actiondag/graph/graph_errors.hpp"
#include "test_support.hpp"

using namespace actiondag;
using actiondag_test::fingerprints_for;
using actiondag_test::make_action;
using actiondag_test::RecordingHandler;
using actiondag_test::router_for;

// =============================================================================
// Fixture
// =============================================================================

class SolverTests : public ::testing::Test
{
protected:
    std::vector<Action> actions() const
    {
        Action deploy = make_action(ActionKind::Deploy, "backend");
        deploy.build = "backend";
        return {
            make_action(ActionKind::Build, "backend"),
            deploy,
            make_action(ActionKind::Test, "backend-integ", {"deploy.backend"}),
        };
    }

    SolveOptions options()
    {
        SolveOptions result;
        result.fingerprints = fingerprints;
        result.router = router_for(handler);
        result.cache = cache;
        return result;
    }

    std::shared_ptr<RecordingHandler> handler = std::make_shared<RecordingHandler>();
    std::shared_ptr<StaticFingerprintProvider> fingerprints = fingerprints_for(actions());
    ResultCachePtr cache = std::make_shared<ResultCache>();
};

// =============================================================================
// Tests
// =============================================================================

TEST_F(SolverTests, Solve_RunsWholePipeline)
{
    Solver solver(options());
    RunResult result = solver.solve(actions());

    EXPECT_TRUE(result.success());
    EXPECT_EQ(result.size(), 3u);
    DependencyOutputs inputs = handler->inputs_of(ActionKey{ActionKind::Deploy, "backend"});
    EXPECT_EQ(inputs.at(ActionKey{ActionKind::Build, "backend"}).at("name"), "build.backend");
}

TEST_F(SolverTests, Solve_Twice_SecondIsCached)
{
    Solver solver(options());
    solver.solve(actions());
    RunResult second = solver.solve(actions());

    EXPECT_EQ(second.count(TaskState::Cached), 3u);
    EXPECT_EQ(handler->execute_calls.load(), 3);
    EXPECT_EQ(solver.cache().size(), 3u);
}

TEST_F(SolverTests, Solve_StructuralError_Throws)
{
    auto invalid = actions();
    invalid.push_back(make_action(ActionKind::Run, "job", {"run.missing"}));
    EXPECT_THROW(solve(invalid, options()), UnresolvedDependencyError);
    EXPECT_EQ(handler->status_calls.load(), 0);
}

TEST_F(SolverTests, Solve_Cycle_ThrowsBeforeRunning)
{
    std::vector<Action> cyclic = {
        make_action(ActionKind::Build, "x", {"build.y"}),
        make_action(ActionKind::Build, "y", {"build.x"}),
    };
    EXPECT_THROW(solve(cyclic, options()), CyclicDependencyError);
}

TEST_F(SolverTests, Solve_UnsupportedType_ThrowsWhenValidating)
{
    auto with_helm = actions();
    with_helm.push_back(make_action(ActionKind::Deploy, "chart", {}, "helm"));
    fingerprints->set(ActionKey{ActionKind::Deploy, "chart"}, "chart@1");

    EXPECT_THROW(solve(with_helm, options()), UnsupportedActionTypeError);
    EXPECT_EQ(handler->execute_calls.load(), 0);
}

TEST_F(SolverTests, Solve_UnsupportedType_FailsNodeWithoutValidation)
{
    auto with_helm = actions();
    with_helm.push_back(make_action(ActionKind::Deploy, "chart", {}, "helm"));
    fingerprints->set(ActionKey{ActionKind::Deploy, "chart"}, "chart@1");

    SolveOptions opts = options();
    opts.validate_handlers = false;
    RunResult result = solve(with_helm, opts);

    EXPECT_EQ(result.at(ActionKey{ActionKind::Deploy, "chart"}).error_kind, ErrorKind::UnsupportedActionType);
    EXPECT_EQ(result.count(TaskState::Succeeded), 3u);
}

TEST_F(SolverTests, Solve_MissingFingerprint_ReportedPerNode)
{
    fingerprints->remove(ActionKey{ActionKind::Build, "backend"});
    RunResult result = solve(actions(), options());

    EXPECT_EQ(result.at(ActionKey{ActionKind::Build, "backend"}).error_kind, ErrorKind::FingerprintUnavailable);
    EXPECT_EQ(result.count(TaskState::Skipped), 2u);
}

TEST_F(SolverTests, MissingCollaborators_Throw)
{
    SolveOptions no_router = options();
    no_router.router = nullptr;
    EXPECT_THROW(Solver{no_router}, std::invalid_argument);

    SolveOptions no_fingerprints = options();
    no_fingerprints.fingerprints = nullptr;
    EXPECT_THROW(Solver{no_fingerprints}, std::invalid_argument);
}

TEST_F(SolverTests, NullCache_UsesPrivateCache)
{
    SolveOptions opts = options();
    opts.cache = nullptr;
    Solver solver(opts);
    solver.solve(actions());
    EXPECT_EQ(solver.cache().size(), 3u);
    EXPECT_EQ(cache->size(), 0u);
}
