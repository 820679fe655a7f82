/**
 * @file node_task.hpp
 * @brief NodeTask tracks one graph node through a scheduler run.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/cancellation.hpp"
#include "actiondag/execution/graph_result.hpp"
#include "actiondag/graph/action_graph.hpp"

namespace actiondag
{

/**
 * @brief Outcome reported by a worker for a Running node.
 */
struct NodeOutcome
{
    TaskState state{TaskState::Failed};
    ErrorKind error_kind{ErrorKind::None};
    std::string error;
    ActionOutputs outputs;
    bool from_cache{false};
    bool status_up_to_date{false};
};

/**
 * @brief Per-run bookkeeping of one node.
 *
 * @details
 * NodeTask holds the state machine of a node, the number of dependencies that
 * have not yet finished, the cancellation source handed to the handler and
 * the result being built.
 *
 * @par Ownership Model
 * - The scheduler run owns all NodeTask instances.
 * - The node itself is borrowed from the ActionGraph, which outlives the run.
 *
 * @par Thread Safety
 * - Not synchronized. All access happens under the run's mutex; the only
 *   exception is token(), whose returned token may be used from any thread.
 */
class NodeTask
{
public:
    /**
     * @brief Construct the task of node `idx` of `graph`.
     * @param version Version of the node, empty if unavailable.
     */
    NodeTask(const ActionGraph& graph, NodeIdx idx, std::string version);

    NodeTask(const NodeTask&) = delete;
    NodeTask(NodeTask&&) = delete;
    NodeTask& operator=(const NodeTask&) = delete;
    NodeTask& operator=(NodeTask&&) = delete;

    TaskState state() const noexcept
    {
        return m_result.state;
    }

    NodeIdx idx() const noexcept
    {
        return m_idx;
    }

    const ActionNode& node() const noexcept
    {
        return m_node;
    }

    const ActionKey& key() const noexcept
    {
        return m_node.key;
    }

    /// Empty if no version could be computed.
    const std::string& version() const noexcept
    {
        return m_result.version;
    }

    const GraphResult& result() const noexcept
    {
        return m_result;
    }

    bool is_ready() const noexcept
    {
        return m_predecessors_remaining == 0;
    }

    /**
     * @brief Record that one dependency reached a terminal state.
     * @return True if this was the last outstanding dependency.
     */
    bool decrement_predecessor_count();

    /**
     * @brief Pending -> Ready.
     */
    void mark_ready();

    /**
     * @brief Ready -> Running.
     * @param parent Token of the run; cancelling it cancels the node.
     * @param timeout Maximum duration, if any.
     */
    void start(const CancellationToken& parent, std::optional<std::chrono::milliseconds> timeout);

    /**
     * @brief Deadline of the running node, if it has a timeout.
     */
    std::optional<std::chrono::steady_clock::time_point> deadline() const noexcept
    {
        return m_deadline;
    }

    std::optional<std::chrono::milliseconds> timeout() const noexcept
    {
        return m_timeout;
    }

    /**
     * @brief Token passed to the handler.
     * @pre The node has been started.
     */
    CancellationToken token() const;

    /**
     * @brief Cancel the handler invocation of a running node.
     */
    void cancel() noexcept;

    /**
     * @brief Running -> terminal.
     * @param record_duration Store the time spent Running in the result.
     * @return False if the node was no longer Running; the outcome is discarded.
     */
    bool finish(NodeOutcome outcome, bool record_duration);

    /**
     * @brief Pending or Ready -> Skipped.
     */
    void skip(ErrorKind kind, std::string message);

private:
    const ActionNode& m_node;
    NodeIdx m_idx;
    size_t m_predecessors_remaining;

    std::unique_ptr<CancellationSource> m_cancel;
    std::optional<std::chrono::milliseconds> m_timeout;
    std::optional<std::chrono::steady_clock::time_point> m_deadline;
    std::chrono::steady_clock::time_point m_start_time{};

    GraphResult m_result;
};

using NodeTaskPtr = std::unique_ptr<NodeTask>;

} // namespace actiondag
