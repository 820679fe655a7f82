#include "actiondag/graph/graph_builder.hpp"
#include "actiondag/common/logging.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace actiondag
{

// ============================================================================
// Analysis
// ============================================================================

struct GraphBuilder::Analysis
{
    std::shared_ptr<GraphDiagnostics> diagnostics;

    /// For each declaration, the node it maps to (the first declaration of its key).
    std::vector<NodeIdx> canonical;

    /// Resolved and de-duplicated edges for each declaration.
    std::vector<std::vector<DependencyEdge>> edges;
};

namespace
{

std::string render_cycle(const std::vector<ActionKey>& cycle)
{
    std::ostringstream oss;
    for (const auto& key : cycle)
    {
        oss << key << " -> ";
    }
    oss << cycle.front();
    return oss.str();
}

/// Rotate a cycle so that its smallest node index comes first.
std::vector<NodeIdx> normalize_cycle(std::vector<NodeIdx> cycle)
{
    auto smallest = std::min_element(cycle.begin(), cycle.end());
    std::rotate(cycle.begin(), smallest, cycle.end());
    return cycle;
}

} // namespace

GraphBuilder::Analysis GraphBuilder::analyze() const
{
    Analysis analysis;
    analysis.diagnostics = std::make_shared<GraphDiagnostics>();
    auto& diagnostics = *analysis.diagnostics;

    const size_t count = m_actions.size();
    analysis.canonical.resize(count);
    analysis.edges.resize(count);

    // -------------------------------------------------------------------------
    // Phase 1: identity uniqueness
    // -------------------------------------------------------------------------

    std::unordered_map<ActionKey, NodeIdx, ActionKeyHash> index;
    std::map<ActionKey, std::vector<size_t>> duplicates;
    for (size_t i = 0; i < count; ++i)
    {
        ActionKey key = m_actions[i].key();
        auto [it, inserted] = index.emplace(key, i);
        analysis.canonical[i] = it->second;
        if (!inserted)
        {
            auto& positions = duplicates[key];
            if (positions.empty())
            {
                positions.push_back(it->second);
            }
            positions.push_back(i);
        }
    }

    for (const auto& [key, positions] : duplicates)
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::DuplicateAction;
        std::ostringstream oss;
        oss << "Action " << key << " is declared " << positions.size() << " times (declarations";
        for (size_t pos : positions)
        {
            oss << " #" << pos;
        }
        oss << ")";
        item.message = oss.str();
        item.involved_actions.push_back(key);
        item.declaration_indices = positions;
        diagnostics.m_errors.push_back(std::move(item));
    }

    // -------------------------------------------------------------------------
    // Phase 2: reference resolution
    // -------------------------------------------------------------------------

    for (size_t i = 0; i < count; ++i)
    {
        const Action& action = m_actions[i];
        ActionKey referrer = action.key();
        std::unordered_map<NodeIdx, size_t> edge_positions;

        for (const auto& dep : action.all_dependencies())
        {
            auto it = index.find(dep.key);
            if (it == index.end())
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::UnresolvedDependency;
                item.message = referrer.to_string() + " depends on " + dep.key.to_string() +
                               ", which is not declared";
                item.involved_actions = {referrer, dep.key};
                item.declaration_indices = {i};
                diagnostics.m_errors.push_back(std::move(item));
                continue;
            }

            NodeIdx target = it->second;
            auto [pos_it, inserted] = edge_positions.emplace(target, analysis.edges[i].size());
            if (inserted)
            {
                analysis.edges[i].push_back(DependencyEdge{target, dep.needs_executed_outputs});
            }
            else
            {
                analysis.edges[i][pos_it->second].needs_executed_outputs |= dep.needs_executed_outputs;
            }

            if (!action.disabled && m_actions[target].disabled)
            {
                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Warning;
                item.category = DiagnosticCategory::DisabledDependency;
                item.message = referrer.to_string() + " depends on disabled action " +
                               dep.key.to_string() + "; it will receive empty outputs";
                item.involved_actions = {referrer, dep.key};
                item.declaration_indices = {i, target};
                diagnostics.m_warnings.push_back(std::move(item));
            }
        }
    }

    // -------------------------------------------------------------------------
    // Phase 3: cycle detection (depth-first, with an explicit recursion stack)
    // -------------------------------------------------------------------------

    enum class Mark
    {
        Unvisited,
        Active,
        Done
    };

    std::vector<Mark> marks(count, Mark::Unvisited);
    std::set<std::vector<NodeIdx>> reported;

    for (NodeIdx root = 0; root < count; ++root)
    {
        if (analysis.canonical[root] != root || marks[root] != Mark::Unvisited)
        {
            continue;
        }

        // Each frame is (node, index of the next edge to follow)
        std::vector<std::pair<NodeIdx, size_t>> stack;
        stack.emplace_back(root, 0);
        marks[root] = Mark::Active;

        while (!stack.empty())
        {
            NodeIdx current = stack.back().first;
            size_t next_edge = stack.back().second;

            if (next_edge >= analysis.edges[current].size())
            {
                marks[current] = Mark::Done;
                stack.pop_back();
                continue;
            }

            ++stack.back().second;
            NodeIdx dep = analysis.edges[current][next_edge].dependency;

            if (marks[dep] == Mark::Unvisited)
            {
                marks[dep] = Mark::Active;
                stack.emplace_back(dep, 0);
            }
            else if (marks[dep] == Mark::Active)
            {
                // Back edge: the cycle is the stack suffix starting at dep
                auto start = std::find_if(stack.begin(), stack.end(),
                                          [dep](const auto& frame) { return frame.first == dep; });
                std::vector<NodeIdx> members;
                for (auto it = start; it != stack.end(); ++it)
                {
                    members.push_back(it->first);
                }

                if (!reported.insert(normalize_cycle(members)).second)
                {
                    continue;
                }

                DiagnosticItem item;
                item.severity = DiagnosticSeverity::Error;
                item.category = DiagnosticCategory::Cycle;
                for (NodeIdx member : members)
                {
                    item.involved_actions.push_back(m_actions[member].key());
                    item.declaration_indices.push_back(member);
                }
                item.message = "Circular dependency detected: " + render_cycle(item.involved_actions);
                diagnostics.m_errors.push_back(std::move(item));
            }
        }
    }

    return analysis;
}

// ============================================================================
// Public API
// ============================================================================

void GraphBuilder::add_action(Action action)
{
    m_actions.push_back(std::move(action));
}

void GraphBuilder::add_actions(std::vector<Action> actions)
{
    m_actions.reserve(m_actions.size() + actions.size());
    for (auto& action : actions)
    {
        m_actions.push_back(std::move(action));
    }
}

std::shared_ptr<const GraphDiagnostics> GraphBuilder::get_diagnostics() const
{
    return analyze().diagnostics;
}

std::shared_ptr<const ActionGraph> GraphBuilder::build() const
{
    Analysis analysis = analyze();
    std::shared_ptr<const GraphDiagnostics> diagnostics = analysis.diagnostics;

    for (const auto& warning : diagnostics->warnings())
    {
        get_logger()->warn("{}", warning.message);
    }

    if (diagnostics->has_errors())
    {
        std::ostringstream oss;
        oss << "Graph validation failed with " << diagnostics->errors().size() << " error(s):";
        for (const auto& err : diagnostics->errors())
        {
            oss << "\n  - " << err.message;
        }
        std::string message = oss.str();
        get_logger()->error("{}", message);

        const DiagnosticItem& first = diagnostics->errors().front();
        switch (first.category)
        {
        case DiagnosticCategory::DuplicateAction:
            throw DuplicateActionError(message, diagnostics, first.involved_actions.at(0),
                                       first.declaration_indices);
        case DiagnosticCategory::UnresolvedDependency:
            throw UnresolvedDependencyError(message, diagnostics, first.involved_actions.at(0),
                                            first.involved_actions.at(1));
        case DiagnosticCategory::Cycle:
            throw CyclicDependencyError(message, diagnostics, first.involved_actions);
        case DiagnosticCategory::DisabledDependency:
            break;
        }
        throw GraphValidationError(EngineErrorCode::InternalError, message, diagnostics);
    }

    auto graph = std::make_shared<ActionGraph>();
    const size_t count = m_actions.size();
    graph->m_nodes.reserve(count);

    for (NodeIdx i = 0; i < count; ++i)
    {
        ActionNode node;
        node.action = m_actions[i];
        node.key = m_actions[i].key();
        node.dependencies = analysis.edges[i];
        graph->m_index.emplace(node.key, i);
        graph->m_nodes.push_back(std::move(node));
    }

    for (NodeIdx i = 0; i < count; ++i)
    {
        for (const auto& edge : graph->m_nodes[i].dependencies)
        {
            graph->m_nodes[edge.dependency].dependents.push_back(i);
        }
    }

    graph->finalize();

    get_logger()->debug("Built action graph with {} node(s)", graph->node_count());
    return graph;
}

std::shared_ptr<const ActionGraph> build_graph(std::vector<Action> actions)
{
    GraphBuilder builder;
    builder.add_actions(std::move(actions));
    return builder.build();
}

} // namespace actiondag
