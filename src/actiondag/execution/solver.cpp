#include "actiondag/execution/solver.hpp"
#include "actiondag/common/logging.hpp"
#include "actiondag/graph/graph_builder.hpp"

namespace actiondag
{

namespace
{

const SolveOptions& checked(const SolveOptions& options)
{
    if (!options.fingerprints)
    {
        throw std::invalid_argument("SolveOptions requires a fingerprint provider");
    }
    if (!options.router)
    {
        throw std::invalid_argument("SolveOptions requires an action router");
    }
    return options;
}

ResultCachePtr cache_or_new(const ResultCachePtr& cache)
{
    return cache ? cache : std::make_shared<ResultCache>();
}

} // namespace

Solver::Solver(SolveOptions options)
    : m_options{checked(options)}
    , m_cache{cache_or_new(m_options.cache)}
    , m_resolver{m_options.fingerprints}
    , m_scheduler{m_options.router, m_cache, m_options.scheduler}
{}

RunResult Solver::solve(std::vector<Action> actions)
{
    GraphBuilder builder;
    builder.add_actions(std::move(actions));
    std::shared_ptr<const ActionGraph> graph = builder.build();

    if (m_options.validate_handlers)
    {
        m_options.router->validate(*graph);
    }

    VersionMap versions = m_resolver.resolve(*graph);
    get_logger()->debug("Resolved {} of {} version(s)", versions.versions().size(), graph->node_count());
    return m_scheduler.run(*graph, versions);
}

void Solver::request_stop()
{
    m_scheduler.request_stop();
}

RunResult solve(std::vector<Action> actions, SolveOptions options)
{
    Solver solver(std::move(options));
    return solver.solve(std::move(actions));
}

} // namespace actiondag
