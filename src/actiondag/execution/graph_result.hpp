/**
 * @file graph_result.hpp
 * @brief Per-node results and the result map of one scheduler run.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"
#include "actiondag/execution/task_state.hpp"

namespace actiondag
{

/**
 * @brief Outcome of one node of a run.
 *
 * @details
 * Results do not own the results of their dependencies. `dependencies` lists
 * the direct dependency keys; the corresponding results are looked up in the
 * owning RunResult.
 */
struct GraphResult
{
    ActionKey key;
    std::string type;
    TaskState state{TaskState::Pending};

    /// Version the node was processed at; empty if none could be computed.
    std::string version;

    ActionOutputs outputs;

    ErrorKind error_kind{ErrorKind::None};

    /// Error message; names the action and the root cause. Empty on success.
    std::string error;

    /// Outputs were taken from the result cache.
    bool from_cache{false};

    /// The status check reported the action up to date; execute was not called.
    bool status_up_to_date{false};

    bool disabled{false};

    /// Time spent Running; zero if the node never started or timing is off.
    std::chrono::nanoseconds duration{0};

    /// Direct dependency keys, in declaration order.
    std::vector<ActionKey> dependencies;

    bool is_terminal() const noexcept
    {
        return actiondag::is_terminal(state);
    }

    bool is_success() const noexcept
    {
        return actiondag::is_success(state);
    }
};

/**
 * @brief Results of every node of one run, keyed by action identity.
 *
 * @details
 * After Scheduler::run() returns, every node of the graph has a terminal
 * result.
 */
class RunResult
{
public:
    /**
     * @brief Result of one node, or nullptr if the key is not part of the run.
     */
    const GraphResult* find(const ActionKey& key) const;

    /**
     * @brief Result of one node.
     * @throws std::out_of_range if the key is not part of the run.
     */
    const GraphResult& at(const ActionKey& key) const;

    /**
     * @brief Results of the direct dependencies of a node, in declaration order.
     * @throws std::out_of_range if the key is not part of the run.
     */
    std::vector<const GraphResult*> dependency_results(const ActionKey& key) const;

    /**
     * @brief Results of all transitive dependencies of a node, ordered by key.
     * @throws std::out_of_range if the key is not part of the run.
     */
    std::vector<const GraphResult*> all_dependencies(const ActionKey& key) const;

    const std::map<ActionKey, GraphResult>& results() const noexcept
    {
        return m_results;
    }

    size_t size() const noexcept
    {
        return m_results.size();
    }

    /**
     * @brief Number of nodes in the given state.
     */
    size_t count(TaskState state) const;

    /**
     * @brief Keys of the nodes in the given state, ordered by key.
     */
    std::vector<ActionKey> keys_in_state(TaskState state) const;

    /**
     * @brief True if every node Succeeded or was Cached.
     */
    bool success() const;

    /**
     * @brief True if the run was stopped by request or by its cancellation token.
     */
    bool stopped() const noexcept
    {
        return m_stopped;
    }

    /**
     * @brief Wall-clock duration of the run.
     */
    std::chrono::nanoseconds total_duration() const noexcept
    {
        return m_total_duration;
    }

    /**
     * @brief One-line summary for logging.
     */
    std::string summary() const;

    void add(GraphResult result);

    void set_stopped(bool stopped) noexcept
    {
        m_stopped = stopped;
    }

    void set_total_duration(std::chrono::nanoseconds duration) noexcept
    {
        m_total_duration = duration;
    }

private:
    std::map<ActionKey, GraphResult> m_results;
    bool m_stopped{false};
    std::chrono::nanoseconds m_total_duration{0};
};

} // namespace actiondag
