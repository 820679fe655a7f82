/**
 * @file scheduler.hpp
 * @brief Bounded-concurrency execution of an ActionGraph.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/cancellation.hpp"
#include "actiondag/execution/graph_result.hpp"
#include "actiondag/execution/result_cache.hpp"
#include "actiondag/graph/action_graph.hpp"
#include "actiondag/router/action_router.hpp"
#include "actiondag/versioning/version_resolver.hpp"

namespace actiondag
{

/**
 * @brief Configuration for scheduler behavior.
 */
struct SchedulerConfig
{
    /**
     * @brief Maximum number of nodes processed at the same time.
     * @details 0 means use std::thread::hardware_concurrency().
     */
    size_t concurrency_limit{10};

    /**
     * @brief Store outputs of up-to-date status checks in the result cache.
     * @details If false, only executed outputs are cached.
     */
    bool cache_up_to_date_status{false};

    /**
     * @brief Timeout for actions that do not declare one.
     */
    std::optional<std::chrono::milliseconds> default_timeout;

    /**
     * @brief Whether to record per-node durations.
     */
    bool collect_timing{true};

    /**
     * @brief External cancellation; equivalent to request_stop() once cancelled.
     */
    CancellationToken cancel;
};

/**
 * @brief Walks an ActionGraph, processing every node exactly once.
 *
 * @details
 * A run keeps a ready set of nodes whose dependencies have all Succeeded or
 * been Cached. Worker threads take the ready node with the most transitive
 * dependents (declaration order breaks ties) and process it:
 * - disabled nodes succeed with empty outputs;
 * - nodes without a version fail;
 * - otherwise the result cache is consulted, then the handler's status
 *   check, then the handler's execution.
 *
 * A node that does not succeed causes every node depending on it to be
 * Skipped. Independent nodes keep running, so one failure never aborts
 * unrelated work. The run ends when every node is terminal.
 *
 * The calling thread coordinates the run: it enforces timeouts (a node whose
 * deadline passes is marked Failed immediately and its handler token is
 * cancelled) and reacts to stop requests (nodes that have not started are
 * Skipped, running handlers see their token cancelled).
 *
 * @par Thread Safety
 * - run() may be called from several threads at once; runs share the cache.
 * - request_stop() may be called from any thread during execution.
 */
class Scheduler
{
public:
    Scheduler(std::shared_ptr<const ActionRouter> router, ResultCachePtr cache, SchedulerConfig config = {});

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Process every node of a graph.
     * @param graph The graph to run; must outlive the call.
     * @param versions Versions of the graph's nodes. Nodes missing from it fail.
     * @return A terminal result for every node.
     */
    RunResult run(const ActionGraph& graph, const VersionMap& versions);

    /**
     * @brief Request graceful stop of all runs of this scheduler.
     *
     * @details
     * Nodes that have not started are Skipped; running handlers observe the
     * cancellation through their token. Results of finished nodes are kept.
     * The request stays in effect for later runs.
     */
    void request_stop();

    /**
     * @brief True if request_stop() was called or the configured token is cancelled.
     */
    bool stop_requested() const noexcept;

    const SchedulerConfig& config() const noexcept
    {
        return m_config;
    }

    const ResultCache& cache() const noexcept
    {
        return *m_cache;
    }

    /**
     * @brief Number of worker threads a run of `node_count` nodes uses.
     */
    size_t worker_count(size_t node_count) const noexcept;

private:
    class Run;

    std::shared_ptr<const ActionRouter> m_router;
    ResultCachePtr m_cache;
    SchedulerConfig m_config;
    std::atomic<bool> m_stop_requested{false};
};

} // namespace actiondag
