#include "actiondag/execution/scheduler.hpp"
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/common/logging.hpp"
#include "actiondag/execution/node_task.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

namespace actiondag
{

namespace
{

/// Upper bound on how long the coordinator sleeps between checks.
constexpr std::chrono::milliseconds kCoordinatorPollInterval{20};

/// Orders ready nodes: most transitive dependents first, then declaration order.
struct ReadyOrder
{
    const std::vector<size_t>* dependent_counts;

    bool operator()(NodeIdx a, NodeIdx b) const
    {
        const size_t count_a = (*dependent_counts)[a];
        const size_t count_b = (*dependent_counts)[b];
        if (count_a != count_b)
        {
            return count_a > count_b;
        }
        return a < b;
    }
};

std::string timeout_message(const ActionKey& key, std::chrono::milliseconds timeout)
{
    return key.to_string() + " timed out after " + std::to_string(timeout.count()) + " ms";
}

/// Turn an exception raised while processing a node into a Failed outcome.
NodeOutcome failure_outcome(const ActionKey& key, std::exception_ptr error,
                            std::optional<std::chrono::milliseconds> timeout)
{
    NodeOutcome outcome;
    outcome.state = TaskState::Failed;
    try
    {
        std::rethrow_exception(error);
    }
    catch (const TimeoutError& e)
    {
        outcome.error_kind = ErrorKind::Timeout;
        outcome.error = timeout ? timeout_message(key, *timeout) : key.to_string() + " timed out: " + e.what();
    }
    catch (const OperationCancelledError& e)
    {
        outcome.error_kind = ErrorKind::Cancelled;
        outcome.error = key.to_string() + " cancelled: " + e.what();
    }
    catch (const UnsupportedActionTypeError& e)
    {
        outcome.error_kind = ErrorKind::UnsupportedActionType;
        outcome.error = e.what();
    }
    catch (const HandlerExecutionError& e)
    {
        outcome.error_kind = ErrorKind::HandlerExecution;
        outcome.error = e.what();
    }
    catch (const std::exception& e)
    {
        outcome.error_kind = ErrorKind::HandlerExecution;
        outcome.error = "Failed processing " + key.to_string() + ": " + e.what();
    }
    catch (...)
    {
        outcome.error_kind = ErrorKind::HandlerExecution;
        outcome.error = "Failed processing " + key.to_string() + ": unknown error";
    }
    return outcome;
}

} // namespace

// ============================================================================
// Scheduler::Run
// ============================================================================

/**
 * @brief State of one call to Scheduler::run().
 *
 * @details
 * All members below `m_mutex` are guarded by it. Workers hold the mutex only
 * to take a node and to report its outcome; handler code runs unlocked.
 */
class Scheduler::Run
{
public:
    Run(Scheduler& owner, const ActionGraph& graph, const VersionMap& versions);

    RunResult execute();

private:
    void worker_loop();

    /// Process a started node. Runs without the mutex held.
    NodeOutcome process(const ActionNode& node, const std::string& version,
                        const DependencyOutputs& dependency_outputs, const CancellationToken& token,
                        std::optional<std::chrono::milliseconds> timeout) const;

    /// Status check then execution; the body of the cache computation.
    CacheComputation compute(const ActionNode& node, const std::string& version,
                             const DependencyOutputs& dependency_outputs, const CancellationToken& token) const;

    DependencyOutputs dependency_outputs(const NodeTask& task) const;

    std::optional<std::chrono::milliseconds> timeout_for(const ActionNode& node) const;

    bool stop_signalled() const noexcept
    {
        return m_owner.stop_requested();
    }

    /// A node whose dependencies are all terminal becomes Ready or Skipped.
    void release(NodeIdx idx, std::vector<NodeIdx>& newly_terminal);

    /// Propagate terminal nodes to their dependents, cascading skips.
    void settle(std::vector<NodeIdx> terminal);

    void complete(NodeIdx idx, NodeOutcome outcome);

    void begin_stop();

    void check_timeouts(std::chrono::steady_clock::time_point now);

    std::chrono::steady_clock::time_point next_wakeup(std::chrono::steady_clock::time_point now) const;

    Scheduler& m_owner;
    const ActionGraph& m_graph;
    const VersionMap& m_versions;
    CancellationSource m_run_cancel;

    std::mutex m_mutex;
    std::condition_variable m_work_cv;
    std::condition_variable m_coordinator_cv;
    std::vector<NodeTaskPtr> m_tasks;
    std::set<NodeIdx, ReadyOrder> m_ready;
    std::set<NodeIdx> m_running;
    size_t m_terminal_count{0};
    bool m_finished{false};
    bool m_stopping{false};
};

Scheduler::Run::Run(Scheduler& owner, const ActionGraph& graph, const VersionMap& versions)
    : m_owner{owner}
    , m_graph{graph}
    , m_versions{versions}
    , m_run_cancel{owner.m_config.cancel}
    , m_ready(ReadyOrder{&graph.transitive_dependent_counts()})
{
    m_tasks.reserve(graph.node_count());
    for (NodeIdx idx = 0; idx < graph.node_count(); ++idx)
    {
        const ResolvedVersion* version = versions.find(graph.node(idx).key);
        m_tasks.push_back(std::make_unique<NodeTask>(graph, idx, version ? version->version_string : std::string{}));
    }
}

RunResult Scheduler::Run::execute()
{
    const auto start_time = std::chrono::steady_clock::now();
    auto logger = get_logger();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (stop_signalled())
        {
            begin_stop();
        }
        std::vector<NodeIdx> terminal;
        for (NodeIdx idx = 0; idx < m_tasks.size(); ++idx)
        {
            if (m_tasks[idx]->is_ready())
            {
                release(idx, terminal);
            }
        }
        settle(std::move(terminal));
    }

    std::vector<std::thread> workers;
    if (!m_tasks.empty())
    {
        const size_t worker_count = m_owner.worker_count(m_tasks.size());
        logger->info("Running {} action(s) with {} worker(s)", m_tasks.size(), worker_count);
        try
        {
            for (size_t i = 0; i < worker_count; ++i)
            {
                workers.emplace_back([this]() { worker_loop(); });
            }
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_finished = true;
                m_run_cancel.cancel();
            }
            m_work_cv.notify_all();
            for (auto& worker : workers)
            {
                worker.join();
            }
            throw;
        }
    }

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        while (!m_finished)
        {
            if (stop_signalled())
            {
                begin_stop();
            }
            check_timeouts(std::chrono::steady_clock::now());
            if (m_finished)
            {
                break;
            }
            m_coordinator_cv.wait_until(lock, next_wakeup(std::chrono::steady_clock::now()));
        }
    }

    for (auto& worker : workers)
    {
        worker.join();
    }

    RunResult result;
    for (const auto& task : m_tasks)
    {
        result.add(task->result());
    }
    result.set_stopped(m_stopping);
    result.set_total_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time));

    if (result.success())
    {
        logger->info("{}", result.summary());
    }
    else
    {
        logger->warn("{}", result.summary());
    }
    return result;
}

void Scheduler::Run::worker_loop()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true)
    {
        m_work_cv.wait(lock, [this]() { return m_finished || !m_ready.empty(); });
        if (m_ready.empty())
        {
            return;
        }
        if (stop_signalled())
        {
            begin_stop();
            continue;
        }

        const NodeIdx idx = *m_ready.begin();
        m_ready.erase(m_ready.begin());

        NodeTask& task = *m_tasks[idx];
        task.start(m_run_cancel.token(), timeout_for(task.node()));
        m_running.insert(idx);
        if (task.deadline())
        {
            m_coordinator_cv.notify_all();
        }

        const ActionNode& node = task.node();
        const std::string version = task.version();
        const DependencyOutputs inputs = dependency_outputs(task);
        const CancellationToken token = task.token();
        const auto timeout = task.timeout();
        get_logger()->debug("{} running", node.key.to_string());

        lock.unlock();
        NodeOutcome outcome = process(node, version, inputs, token, timeout);
        lock.lock();

        complete(idx, std::move(outcome));
    }
}

NodeOutcome Scheduler::Run::process(const ActionNode& node, const std::string& version,
                                    const DependencyOutputs& dependency_outputs, const CancellationToken& token,
                                    std::optional<std::chrono::milliseconds> timeout) const
{
    NodeOutcome outcome;
    if (node.action.disabled)
    {
        outcome.state = TaskState::Succeeded;
        return outcome;
    }

    if (version.empty())
    {
        outcome.state = TaskState::Failed;
        outcome.error_kind = ErrorKind::FingerprintUnavailable;
        const VersionFailure* failure = m_versions.find_failure(node.key);
        outcome.error = failure ? failure->message : "No version available for " + node.key.to_string();
        return outcome;
    }

    const ResultCacheKey cache_key{node.action.kind, node.action.name, version};
    try
    {
        CacheLookup lookup = m_owner.m_cache->get_or_compute(
            cache_key, [&]() { return compute(node, version, dependency_outputs, token); });
        outcome.state = lookup.source == CacheSource::Computed ? TaskState::Succeeded : TaskState::Cached;
        outcome.from_cache = lookup.source != CacheSource::Computed;
        outcome.status_up_to_date = lookup.source == CacheSource::Computed && lookup.value.status_up_to_date;
        outcome.outputs = std::move(lookup.value.outputs);
    }
    catch (...)
    {
        outcome = failure_outcome(node.key, std::current_exception(), timeout);
    }
    return outcome;
}

CacheComputation Scheduler::Run::compute(const ActionNode& node, const std::string& version,
                                         const DependencyOutputs& dependency_outputs,
                                         const CancellationToken& token) const
{
    const HandlerContext ctx{node.action, version, dependency_outputs, token};
    const ActionRouter& router = *m_owner.m_router;

    token.throw_if_cancelled();
    StatusResult status = router.get_status(ctx);
    if (status.up_to_date())
    {
        CacheComputation value;
        value.outputs = std::move(status.outputs);
        value.cacheable = m_owner.m_config.cache_up_to_date_status;
        value.status_up_to_date = true;
        return value;
    }

    token.throw_if_cancelled();
    ExecuteResult result = router.dispatch(ctx);
    if (token.deadline_expired())
    {
        throw TimeoutError(node.key.to_string() + " exceeded its deadline");
    }

    CacheComputation value;
    value.outputs = std::move(result.outputs);
    return value;
}

DependencyOutputs Scheduler::Run::dependency_outputs(const NodeTask& task) const
{
    DependencyOutputs outputs;
    for (const auto& edge : task.node().dependencies)
    {
        if (edge.needs_executed_outputs)
        {
            const NodeTask& dependency = *m_tasks[edge.dependency];
            outputs[dependency.key()] = dependency.result().outputs;
        }
    }
    return outputs;
}

std::optional<std::chrono::milliseconds> Scheduler::Run::timeout_for(const ActionNode& node) const
{
    if (node.action.timeout)
    {
        return node.action.timeout;
    }
    return m_owner.m_config.default_timeout;
}

void Scheduler::Run::release(NodeIdx idx, std::vector<NodeIdx>& newly_terminal)
{
    NodeTask& task = *m_tasks[idx];
    for (const auto& edge : task.node().dependencies)
    {
        const NodeTask& dependency = *m_tasks[edge.dependency];
        if (!is_success(dependency.state()))
        {
            const char* reason = dependency.state() == TaskState::Failed ? "failed" : "was skipped";
            task.skip(ErrorKind::DependencyFailed, task.key().to_string() + " skipped: dependency " +
                                                       dependency.key().to_string() + " " + reason);
            get_logger()->debug("{}", task.result().error);
            newly_terminal.push_back(idx);
            return;
        }
    }

    if (m_stopping)
    {
        task.skip(ErrorKind::Cancelled, task.key().to_string() + " skipped: run was stopped");
        newly_terminal.push_back(idx);
        return;
    }

    task.mark_ready();
    m_ready.insert(idx);
    m_work_cv.notify_one();
}

void Scheduler::Run::settle(std::vector<NodeIdx> terminal)
{
    while (!terminal.empty())
    {
        const NodeIdx idx = terminal.back();
        terminal.pop_back();
        ++m_terminal_count;
        for (NodeIdx dependent : m_graph.node(idx).dependents)
        {
            if (m_tasks[dependent]->decrement_predecessor_count())
            {
                release(dependent, terminal);
            }
        }
    }

    if (m_terminal_count == m_tasks.size() && !m_finished)
    {
        m_finished = true;
        m_work_cv.notify_all();
        m_coordinator_cv.notify_all();
    }
}

void Scheduler::Run::complete(NodeIdx idx, NodeOutcome outcome)
{
    NodeTask& task = *m_tasks[idx];
    auto logger = get_logger();
    if (!task.finish(std::move(outcome), m_owner.m_config.collect_timing))
    {
        logger->debug("Discarding late result of {}", task.key().to_string());
        return;
    }
    m_running.erase(idx);

    const GraphResult& result = task.result();
    switch (result.state)
    {
    case TaskState::Succeeded:
        logger->debug("{} succeeded{}", result.key.to_string(),
                      result.disabled ? " (disabled)" : result.status_up_to_date ? " (up to date)" : "");
        break;
    case TaskState::Cached:
        logger->debug("{} cached at {}", result.key.to_string(), result.version);
        break;
    default:
        logger->warn("{}", result.error);
        break;
    }

    settle({idx});
}

void Scheduler::Run::begin_stop()
{
    if (m_stopping)
    {
        return;
    }
    m_stopping = true;
    m_run_cancel.cancel();
    get_logger()->info("Stop requested; {} ready action(s) will not start", m_ready.size());

    std::vector<NodeIdx> skipped(m_ready.begin(), m_ready.end());
    m_ready.clear();
    for (NodeIdx idx : skipped)
    {
        NodeTask& task = *m_tasks[idx];
        task.skip(ErrorKind::Cancelled, task.key().to_string() + " skipped: run was stopped");
    }
    settle(std::move(skipped));
    m_coordinator_cv.notify_all();
}

void Scheduler::Run::check_timeouts(std::chrono::steady_clock::time_point now)
{
    std::vector<NodeIdx> expired;
    for (NodeIdx idx : m_running)
    {
        const auto deadline = m_tasks[idx]->deadline();
        if (deadline && *deadline <= now)
        {
            expired.push_back(idx);
        }
    }

    for (NodeIdx idx : expired)
    {
        NodeTask& task = *m_tasks[idx];
        task.cancel();
        NodeOutcome outcome;
        outcome.state = TaskState::Failed;
        outcome.error_kind = ErrorKind::Timeout;
        outcome.error = timeout_message(task.key(), *task.timeout());
        complete(idx, std::move(outcome));
    }
}

std::chrono::steady_clock::time_point Scheduler::Run::next_wakeup(std::chrono::steady_clock::time_point now) const
{
    auto wakeup = now + kCoordinatorPollInterval;
    for (NodeIdx idx : m_running)
    {
        const auto deadline = m_tasks[idx]->deadline();
        if (deadline && *deadline < wakeup)
        {
            wakeup = *deadline;
        }
    }
    return wakeup;
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler(std::shared_ptr<const ActionRouter> router, ResultCachePtr cache, SchedulerConfig config)
    : m_router{std::move(router)}
    , m_cache{std::move(cache)}
    , m_config{std::move(config)}
{
    if (!m_router)
    {
        throw std::invalid_argument("Scheduler requires an action router");
    }
    if (!m_cache)
    {
        m_cache = std::make_shared<ResultCache>();
    }
}

RunResult Scheduler::run(const ActionGraph& graph, const VersionMap& versions)
{
    Run run(*this, graph, versions);
    return run.execute();
}

void Scheduler::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Scheduler::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire) || m_config.cancel.is_cancelled();
}

size_t Scheduler::worker_count(size_t node_count) const noexcept
{
    size_t limit = m_config.concurrency_limit;
    if (limit == 0)
    {
        limit = std::thread::hardware_concurrency();
    }
    limit = std::max<size_t>(limit, 1);
    return std::min(limit, std::max<size_t>(node_count, 1));
}

} // namespace actiondag
