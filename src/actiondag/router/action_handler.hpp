/**
 * @file action_handler.hpp
 * @brief The contract provider plugins implement for one action type.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"
#include "actiondag/common/cancellation.hpp"

namespace actiondag
{

/**
 * @brief Real-world state of an action as reported by its handler.
 */
enum class ActionStatusState
{
    Ready,      ///< The desired state is in place; nothing to do.
    NotReady,   ///< The action has not been executed for this version.
    Outdated,   ///< A previous version is in place.
    Unknown     ///< The handler could not determine the state.
};

const char* to_string(ActionStatusState state) noexcept;

/**
 * @brief Result of a status check.
 */
struct StatusResult
{
    ActionStatusState state{ActionStatusState::Unknown};
    ActionOutputs outputs;

    /// Free-form, handler-specific detail for diagnostics.
    std::string detail;

    bool up_to_date() const noexcept
    {
        return state == ActionStatusState::Ready;
    }
};

/**
 * @brief Result of an execution.
 */
struct ExecuteResult
{
    bool success{false};
    ActionOutputs outputs;

    /// Failure description when success is false.
    std::string error;
};

/**
 * @brief Everything a handler receives for one invocation.
 *
 * @details
 * `dependency_outputs` contains only the dependencies declared with
 * `needs_executed_outputs`; it may be empty.
 */
struct HandlerContext
{
    const Action& action;
    const std::string& version;
    const DependencyOutputs& dependency_outputs;
    CancellationToken cancel;
};

/**
 * @brief Interface for the handler set of one (kind, type).
 *
 * @par Thread Safety
 * - Both methods may be invoked concurrently for different actions, from any
 *   worker thread. Implementations must synchronize their own state.
 *
 * @par Cancellation
 * - Long-running implementations should poll `ctx.cancel` and stop early,
 *   either returning a failed result or calling `throw_if_cancelled()`.
 */
class IActionHandler
{
public:
    virtual ~IActionHandler() = 0;

    /**
     * @brief Check the current real-world state of the action.
     *
     * @details
     * Must be idempotent and free of side effects.
     */
    virtual StatusResult get_status(const HandlerContext& ctx) = 0;

    /**
     * @brief Perform the build, deploy, run or test.
     *
     * @throws Any exception to indicate failure; the router wraps it into a
     *         HandlerExecutionError.
     */
    virtual ExecuteResult execute(const HandlerContext& ctx) = 0;

protected:
    IActionHandler() = default;

private:
    IActionHandler(const IActionHandler&) = delete;
    IActionHandler(IActionHandler&&) = delete;
    IActionHandler& operator=(const IActionHandler&) = delete;
    IActionHandler& operator=(IActionHandler&&) = delete;
};

inline IActionHandler::~IActionHandler() = default;

using ActionHandlerPtr = std::shared_ptr<IActionHandler>;

/**
 * @brief Handler built from two callables.
 *
 * @details
 * Convenient for small in-process handlers. A missing status function makes
 * every status check report NotReady.
 */
class FunctionActionHandler : public IActionHandler
{
public:
    using StatusFn = std::function<StatusResult(const HandlerContext&)>;
    using ExecuteFn = std::function<ExecuteResult(const HandlerContext&)>;

    FunctionActionHandler(StatusFn status_fn, ExecuteFn execute_fn)
        : m_status_fn{std::move(status_fn)}
        , m_execute_fn{std::move(execute_fn)}
    {}

    StatusResult get_status(const HandlerContext& ctx) override
    {
        if (!m_status_fn)
        {
            return StatusResult{ActionStatusState::NotReady, {}, {}};
        }
        return m_status_fn(ctx);
    }

    ExecuteResult execute(const HandlerContext& ctx) override
    {
        return m_execute_fn(ctx);
    }

private:
    StatusFn m_status_fn;
    ExecuteFn m_execute_fn;
};

} // namespace actiondag
