/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action_types.hpp"

namespace actiondag
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents the graph from being built.
};

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    DuplicateAction,        ///< Two actions share the same (kind, name).
    UnresolvedDependency,   ///< A dependency reference names no declared action.
    Cycle,                  ///< The dependency references form a cycle.
    DisabledDependency      ///< An enabled action depends on a disabled one.
};

/**
 * @brief A single diagnostic item (error or warning).
 *
 * @details
 * `involved_actions` lists the identities relevant to the issue. For a cycle
 * they are the cycle members in dependency order, each member depending on the
 * next and the last depending on the first. `declaration_indices` holds the
 * positions in the input list, where that is meaningful.
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    std::vector<ActionKey> involved_actions;

    std::vector<size_t> declaration_indices;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected while validating declared actions.
 *
 * @details
 * `GraphDiagnostics` contains all errors and warnings detected by the
 * `GraphBuilder`. Errors are reported in a fixed order: duplicate identities,
 * then unresolved references, then cycles.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph is valid to build.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Count the errors of one category.
     */
    size_t error_count(DiagnosticCategory category) const noexcept
    {
        size_t count = 0;
        for (const auto& item : m_errors)
        {
            if (item.category == category)
            {
                ++count;
            }
        }
        return count;
    }

    // Allow GraphBuilder to populate diagnostics
    friend class GraphBuilder;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
};

} // namespace actiondag
