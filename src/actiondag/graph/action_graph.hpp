/**
 * @file action_graph.hpp
 * @brief Immutable validated dependency graph of actions.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"

namespace actiondag
{

/**
 * @brief A resolved edge from a consumer to one of its dependencies.
 */
struct DependencyEdge
{
    NodeIdx dependency;
    bool needs_executed_outputs{false};
};

/**
 * @brief One action in the graph together with its resolved edges.
 */
struct ActionNode
{
    Action action;
    ActionKey key;

    /// Resolved dependencies, in declaration order, without duplicates.
    std::vector<DependencyEdge> dependencies;

    /// Nodes that depend directly on this node, in ascending index order.
    std::vector<NodeIdx> dependents;
};

/**
 * @brief Validated dependency DAG produced by GraphBuilder::build().
 *
 * @details
 * Node indices follow the declaration order of the actions. Besides the
 * adjacency in both directions, the graph precomputes a deterministic
 * topological order and, for every node, how many nodes depend on it
 * transitively.
 *
 * @par Invariants
 * - Acyclic.
 * - Every dependency edge points to an existing node.
 * - No two nodes share the same ActionKey.
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe.
 */
class ActionGraph
{
public:
    size_t node_count() const noexcept
    {
        return m_nodes.size();
    }

    const ActionNode& node(NodeIdx idx) const
    {
        return m_nodes.at(idx);
    }

    const std::vector<ActionNode>& nodes() const noexcept
    {
        return m_nodes;
    }

    /**
     * @brief Look up a node by identity.
     * @return The node index, or std::nullopt if no such action exists.
     */
    std::optional<NodeIdx> find(const ActionKey& key) const;

    /**
     * @brief Look up a node by identity.
     * @throws std::out_of_range if no such action exists.
     */
    const ActionNode& node(const ActionKey& key) const;

    /**
     * @brief All node indices, dependencies before dependents.
     *
     * @details
     * Among nodes that are simultaneously available the one declared first
     * comes first, so the order is stable for a given input.
     */
    const std::vector<NodeIdx>& topological_order() const noexcept
    {
        return m_topological_order;
    }

    /**
     * @brief Number of distinct nodes that depend on each node, transitively.
     */
    const std::vector<size_t>& transitive_dependent_counts() const noexcept
    {
        return m_transitive_dependent_counts;
    }

    /**
     * @brief All transitive dependencies of a node, in topological order.
     * @details The node itself is not included.
     */
    std::vector<NodeIdx> dependency_closure(NodeIdx idx) const;

    /**
     * @brief All transitive dependents of a node, in topological order.
     * @details The node itself is not included.
     */
    std::vector<NodeIdx> dependent_closure(NodeIdx idx) const;

    // Allow GraphBuilder to populate the graph
    friend class GraphBuilder;

private:
    /// Fill in the derived orderings. Called once by GraphBuilder.
    void finalize();

    std::vector<ActionNode> m_nodes;
    std::unordered_map<ActionKey, NodeIdx, ActionKeyHash> m_index;
    std::vector<NodeIdx> m_topological_order;
    std::vector<size_t> m_topological_position;
    std::vector<size_t> m_transitive_dependent_counts;
};

} // namespace actiondag
