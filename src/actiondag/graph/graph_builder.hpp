/**
 * @file graph_builder.hpp
 * @brief GraphBuilder turns declared actions into a validated ActionGraph.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"
#include "actiondag/graph/action_graph.hpp"
#include "actiondag/graph/graph_diagnostics.hpp"
#include "actiondag/graph/graph_errors.hpp"

namespace actiondag
{

/**
 * @brief Builder that validates declared actions and produces an ActionGraph.
 *
 * @details
 * The builder accepts a flat, ordered list of actions whose dependencies are
 * given as `(kind, name)` references. `build()` checks that identities are
 * unique, that every reference resolves and that the references are acyclic,
 * then produces an immutable graph.
 *
 * @par Usage
 * 1. Create a GraphBuilder.
 * 2. Add actions via add_action() or add_actions(), in declaration order.
 * 3. Optionally inspect get_diagnostics().
 * 4. Call build() to validate and produce an ActionGraph.
 *
 * @par Error reporting
 * All structural problems are collected into a GraphDiagnostics. build()
 * throws the exception matching the first error, checked in the order
 * duplicates, unresolved references, cycles:
 * - DuplicateActionError
 * - UnresolvedDependencyError
 * - CyclicDependencyError
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent access requires external synchronization.
 */
class GraphBuilder
{
public:
    GraphBuilder() = default;

    /**
     * @brief Add an action to the graph.
     */
    void add_action(Action action);

    /**
     * @brief Add several actions, preserving their order.
     */
    void add_actions(std::vector<Action> actions);

    /**
     * @brief Validate the declared actions and produce an ActionGraph.
     *
     * @return Shared pointer to the immutable graph.
     * @throws GraphValidationError (one of its subclasses) if the actions do
     *         not form a valid graph.
     */
    std::shared_ptr<const ActionGraph> build() const;

    /**
     * @brief Get diagnostics without building.
     */
    std::shared_ptr<const GraphDiagnostics> get_diagnostics() const;

    /**
     * @brief Get the current action count.
     */
    size_t action_count() const noexcept
    {
        return m_actions.size();
    }

private:
    struct Analysis;

    /// Validate the actions, resolve references and detect cycles.
    Analysis analyze() const;

    std::vector<Action> m_actions;
};

/**
 * @brief Convenience wrapper: build a graph from a list of actions.
 * @throws GraphValidationError on structural errors.
 */
std::shared_ptr<const ActionGraph> build_graph(std::vector<Action> actions);

} // namespace actiondag
