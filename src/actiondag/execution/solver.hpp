/**
 * @file solver.hpp
 * @brief Facade chaining graph construction, versioning and scheduling.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/execution/scheduler.hpp"
#include "actiondag/versioning/fingerprint_provider.hpp"

namespace actiondag
{

/**
 * @brief Collaborators and settings of a Solver.
 */
struct SolveOptions
{
    SchedulerConfig scheduler;

    /// Required.
    FingerprintProviderPtr fingerprints;

    /// Required.
    std::shared_ptr<const ActionRouter> router;

    /// Shared across solves; a private cache is created when null.
    ResultCachePtr cache;

    /**
     * @brief Fail before running if an enabled action has no handler.
     * @details If false, such actions fail individually during the run.
     */
    bool validate_handlers{true};
};

/**
 * @brief Resolves and runs a list of declared actions.
 *
 * @details
 * solve() performs, in order:
 * 1. graph construction and validation,
 * 2. handler validation (if enabled),
 * 3. version resolution,
 * 4. scheduling.
 *
 * Structural problems are thrown; problems confined to single nodes (missing
 * fingerprints, handler failures, timeouts) are reported in the RunResult.
 * The result cache is kept across solves, so a second solve of unchanged
 * actions is served from it.
 */
class Solver
{
public:
    /**
     * @throws std::invalid_argument if the fingerprint provider or router is missing.
     */
    explicit Solver(SolveOptions options);

    /**
     * @brief Build, validate, version and run a set of actions.
     * @throws GraphValidationError for duplicate, unresolved or cyclic actions.
     * @throws UnsupportedActionTypeError if handler validation is enabled and fails.
     */
    RunResult solve(std::vector<Action> actions);

    /**
     * @brief Forwarded to the scheduler; see Scheduler::request_stop().
     */
    void request_stop();

    const ResultCache& cache() const noexcept
    {
        return *m_cache;
    }

private:
    SolveOptions m_options;
    ResultCachePtr m_cache;
    VersionResolver m_resolver;
    Scheduler m_scheduler;
};

/**
 * @brief One-shot solve with a fresh Solver.
 */
RunResult solve(std::vector<Action> actions, SolveOptions options);

} // namespace actiondag
