/**
 * @file graph_errors.hpp
 * @brief Exceptions thrown when declared actions do not form a valid graph.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/graph/graph_diagnostics.hpp"

namespace actiondag
{

/**
 * @brief Base class of all structural graph errors.
 *
 * @details
 * Structural errors are detected before anything executes and are fatal to the
 * whole run. The attached diagnostics list every problem found, not only the
 * one that determined the exception type.
 */
class GraphValidationError : public EngineError
{
public:
    GraphValidationError(EngineErrorCode code,
                         const std::string& msg,
                         std::shared_ptr<const GraphDiagnostics> diagnostics)
        : EngineError(code, msg)
        , m_diagnostics(std::move(diagnostics))
    {}

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<const GraphDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<const GraphDiagnostics> m_diagnostics;
};

/**
 * @brief Two declared actions share the same (kind, name).
 */
class DuplicateActionError : public GraphValidationError
{
public:
    DuplicateActionError(const std::string& msg,
                         std::shared_ptr<const GraphDiagnostics> diagnostics,
                         ActionKey key,
                         std::vector<size_t> declaration_indices)
        : GraphValidationError(EngineErrorCode::DuplicateAction, msg, std::move(diagnostics))
        , m_key(std::move(key))
        , m_declaration_indices(std::move(declaration_indices))
    {}

    const ActionKey& key() const noexcept
    {
        return m_key;
    }

    /**
     * @brief Positions of the colliding declarations in the input list.
     */
    const std::vector<size_t>& declaration_indices() const noexcept
    {
        return m_declaration_indices;
    }

private:
    ActionKey m_key;
    std::vector<size_t> m_declaration_indices;
};

/**
 * @brief A dependency reference names an action that was not declared.
 */
class UnresolvedDependencyError : public GraphValidationError
{
public:
    UnresolvedDependencyError(const std::string& msg,
                              std::shared_ptr<const GraphDiagnostics> diagnostics,
                              ActionKey referrer,
                              ActionKey missing)
        : GraphValidationError(EngineErrorCode::UnresolvedDependency, msg, std::move(diagnostics))
        , m_referrer(std::move(referrer))
        , m_missing(std::move(missing))
    {}

    const ActionKey& referrer() const noexcept
    {
        return m_referrer;
    }

    const ActionKey& missing() const noexcept
    {
        return m_missing;
    }

private:
    ActionKey m_referrer;
    ActionKey m_missing;
};

/**
 * @brief The dependency references form a cycle.
 */
class CyclicDependencyError : public GraphValidationError
{
public:
    CyclicDependencyError(const std::string& msg,
                          std::shared_ptr<const GraphDiagnostics> diagnostics,
                          std::vector<ActionKey> cycle)
        : GraphValidationError(EngineErrorCode::CyclicDependency, msg, std::move(diagnostics))
        , m_cycle(std::move(cycle))
    {}

    /**
     * @brief The cycle members in dependency order.
     * @details Each member depends on the next; the last depends on the first.
     */
    const std::vector<ActionKey>& cycle() const noexcept
    {
        return m_cycle;
    }

private:
    std::vector<ActionKey> m_cycle;
};

} // namespace actiondag
