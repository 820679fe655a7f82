/**
 * @file task_state.hpp
 * @brief Node execution states and error tags used by the scheduler.
 */
#pragma once
#include "actiondag/common/common.hpp"

namespace actiondag
{

/**
 * @brief Execution state of one node during a run.
 *
 * @details
 * State transitions:
 * - Pending -> Ready (all dependencies Succeeded or Cached)
 * - Pending -> Skipped (a dependency Failed or was Skipped, or a stop was requested)
 * - Ready -> Running (taken by a worker)
 * - Ready -> Skipped (stop requested before the node started)
 * - Running -> Succeeded | Failed | Cached
 *
 * Succeeded, Failed, Skipped and Cached are terminal.
 */
enum class TaskState
{
    Pending,    ///< Waiting for dependencies.
    Ready,      ///< All dependencies satisfied; waiting for a worker.
    Running,    ///< Being processed by a worker.
    Succeeded,  ///< Executed, or found up to date, or disabled.
    Failed,     ///< Could not be processed; see the error kind.
    Skipped,    ///< Never started.
    Cached      ///< Outputs taken from the result cache.
};

/**
 * @brief Category of a non-success result.
 */
enum class ErrorKind
{
    None,
    GraphValidation,
    FingerprintUnavailable,
    UnsupportedActionType,
    HandlerExecution,
    Timeout,
    Cancelled,
    DependencyFailed
};

const char* to_string(TaskState state) noexcept;

const char* to_string(ErrorKind kind) noexcept;

inline bool is_terminal(TaskState state) noexcept
{
    return state == TaskState::Succeeded || state == TaskState::Failed ||
           state == TaskState::Skipped || state == TaskState::Cached;
}

/// Succeeded or Cached: dependents may start.
inline bool is_success(TaskState state) noexcept
{
    return state == TaskState::Succeeded || state == TaskState::Cached;
}

} // namespace actiondag
