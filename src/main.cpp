#include "actiondag/common/artifact_key.hpp"
#include "actiondag/common/logging.hpp"
#include "actiondag/execution/solver.hpp"

#include <iostream>
#include <stdexcept>

using namespace actiondag;

namespace
{

struct ContainerSpec
{
    std::string image;
};

std::vector<Action> sample_actions()
{
    Action build;
    build.kind = ActionKind::Build;
    build.type = "container";
    build.name = "backend";
    build.spec = Payload::make(ContainerSpec{"backend:latest"});

    Action deploy;
    deploy.kind = ActionKind::Deploy;
    deploy.type = "container";
    deploy.name = "backend";
    deploy.build = "backend";

    Action test;
    test.kind = ActionKind::Test;
    test.type = "exec";
    test.name = "backend-integ";
    test.dependencies.push_back(ActionDependency::parse("deploy.backend", true));

    return {build, deploy, test};
}

std::shared_ptr<const ActionRouter> sample_router()
{
    auto registry = std::make_shared<HandlerRegistry>();

    registry->register_handler(
        ActionKind::Build, "container",
        std::make_shared<FunctionActionHandler>(nullptr, [](const HandlerContext& ctx) {
            const auto& spec = ctx.action.spec.as<ContainerSpec>();
            return ExecuteResult{true, {{"image", spec.image + "@" + ctx.version}}, {}};
        }));

    registry->register_handler(
        ActionKind::Deploy, "container",
        std::make_shared<FunctionActionHandler>(nullptr, [](const HandlerContext& ctx) {
            const auto& image = ctx.dependency_outputs.at(ActionKey{ActionKind::Build, "backend"}).at("image");
            return ExecuteResult{true, {{"endpoint", "http://backend:8080"}, {"image", image}}, {}};
        }));

    registry->register_handler(
        ActionKind::Test, "exec",
        std::make_shared<FunctionActionHandler>(nullptr, [](const HandlerContext& ctx) {
            const auto& endpoint = ctx.dependency_outputs.at(ActionKey{ActionKind::Deploy, "backend"}).at("endpoint");
            return ExecuteResult{true, {{"log", "GET " + endpoint + "/health -> 200"}}, {}};
        }));

    return std::make_shared<ActionRouter>(registry);
}

} // namespace

int main(int argc, char** argv)
{
    (void)argc;
    (void)argv;
    try
    {
        auto logger = get_logger();
        logger->info("====== actiondag ======");

        auto fingerprints = std::make_shared<StaticFingerprintProvider>();
        fingerprints->set(ActionKey{ActionKind::Build, "backend"}, "src-tree-1");
        fingerprints->set(ActionKey{ActionKind::Deploy, "backend"}, "manifest-1");
        fingerprints->set(ActionKey{ActionKind::Test, "backend-integ"}, "test-spec-1");

        SolveOptions options;
        options.fingerprints = fingerprints;
        options.router = sample_router();
        options.scheduler.concurrency_limit = 4;

        Solver solver(options);
        for (int pass = 1; pass <= 2; ++pass)
        {
            RunResult result = solver.solve(sample_actions());
            for (const auto& entry : result.results())
            {
                const GraphResult& node = entry.second;
                logger->info("pass {}: {} -> {} [{}]", pass,
                             artifact_key(node.key.kind, node.key.name, node.version),
                             to_string(node.state), node.from_cache ? "cache" : "handler");
            }
            if (!result.success())
            {
                logger->error("{}", result.summary());
                return EXIT_FAILURE;
            }
        }

        logger->info("====== normal exit ======");
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
