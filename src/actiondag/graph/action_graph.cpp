/**
 * @file action_graph.cpp
 */
#include "actiondag/graph/action_graph.hpp"

#include <algorithm>
#include <functional>
#include <queue>

namespace actiondag
{

// ============================================================================
// Lookup
// ============================================================================

std::optional<NodeIdx> ActionGraph::find(const ActionKey& key) const
{
    auto it = m_index.find(key);
    if (it == m_index.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const ActionNode& ActionGraph::node(const ActionKey& key) const
{
    auto idx = find(key);
    if (!idx)
    {
        throw std::out_of_range("No action " + key.to_string() + " in graph");
    }
    return m_nodes[*idx];
}

// ============================================================================
// Closures
// ============================================================================

std::vector<NodeIdx> ActionGraph::dependency_closure(NodeIdx idx) const
{
    std::vector<bool> seen(m_nodes.size(), false);
    std::vector<NodeIdx> stack;
    for (const auto& edge : m_nodes.at(idx).dependencies)
    {
        stack.push_back(edge.dependency);
    }

    std::vector<NodeIdx> result;
    while (!stack.empty())
    {
        NodeIdx current = stack.back();
        stack.pop_back();
        if (seen[current])
        {
            continue;
        }
        seen[current] = true;
        result.push_back(current);
        for (const auto& edge : m_nodes[current].dependencies)
        {
            stack.push_back(edge.dependency);
        }
    }

    std::sort(result.begin(), result.end(), [this](NodeIdx a, NodeIdx b) {
        return m_topological_position[a] < m_topological_position[b];
    });
    return result;
}

std::vector<NodeIdx> ActionGraph::dependent_closure(NodeIdx idx) const
{
    std::vector<bool> seen(m_nodes.size(), false);
    std::vector<NodeIdx> stack(m_nodes.at(idx).dependents);

    std::vector<NodeIdx> result;
    while (!stack.empty())
    {
        NodeIdx current = stack.back();
        stack.pop_back();
        if (seen[current])
        {
            continue;
        }
        seen[current] = true;
        result.push_back(current);
        for (NodeIdx dependent : m_nodes[current].dependents)
        {
            stack.push_back(dependent);
        }
    }

    std::sort(result.begin(), result.end(), [this](NodeIdx a, NodeIdx b) {
        return m_topological_position[a] < m_topological_position[b];
    });
    return result;
}

// ============================================================================
// Derived orderings
// ============================================================================

void ActionGraph::finalize()
{
    const size_t count = m_nodes.size();

    // Kahn's algorithm; the min-heap keeps declaration order among ready nodes
    std::vector<size_t> remaining(count, 0);
    for (NodeIdx i = 0; i < count; ++i)
    {
        remaining[i] = m_nodes[i].dependencies.size();
    }

    std::priority_queue<NodeIdx, std::vector<NodeIdx>, std::greater<NodeIdx>> ready;
    for (NodeIdx i = 0; i < count; ++i)
    {
        if (remaining[i] == 0)
        {
            ready.push(i);
        }
    }

    m_topological_order.clear();
    m_topological_order.reserve(count);
    while (!ready.empty())
    {
        NodeIdx current = ready.top();
        ready.pop();
        m_topological_order.push_back(current);
        for (NodeIdx dependent : m_nodes[current].dependents)
        {
            if (--remaining[dependent] == 0)
            {
                ready.push(dependent);
            }
        }
    }

    m_topological_position.assign(count, 0);
    for (size_t pos = 0; pos < m_topological_order.size(); ++pos)
    {
        m_topological_position[m_topological_order[pos]] = pos;
    }

    m_transitive_dependent_counts.assign(count, 0);
    for (NodeIdx i = 0; i < count; ++i)
    {
        m_transitive_dependent_counts[i] = dependent_closure(i).size();
    }
}

} // namespace actiondag
