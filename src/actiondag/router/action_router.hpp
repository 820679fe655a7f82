/**
 * @file action_router.hpp
 * @brief Uniform dispatch of actions to their registered handlers.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/graph/action_graph.hpp"
#include "actiondag/router/action_handler.hpp"
#include "actiondag/router/handler_registry.hpp"

namespace actiondag
{

/**
 * @brief Routes status checks and executions to the handler of an action.
 *
 * @details
 * The router looks up the handler set registered for the action's
 * (kind, type) and invokes it. It is the error boundary between the engine
 * and provider code: anything a handler throws, and any execution reported as
 * unsuccessful, surfaces as a HandlerExecutionError naming the action and
 * keeping the original exception as its cause. Cancellation and timeout
 * errors raised through the context's token pass through unchanged.
 *
 * The router owns no state across invocations and never caches.
 *
 * @par Thread Safety
 * - All methods are const and may be called concurrently.
 */
class ActionRouter
{
public:
    explicit ActionRouter(HandlerRegistryPtr registry);

    /**
     * @brief Query the current real-world state of an action.
     * @throws UnsupportedActionTypeError if no handler is registered.
     * @throws HandlerExecutionError if the handler fails.
     */
    StatusResult get_status(const HandlerContext& ctx) const;

    /**
     * @brief Execute an action.
     * @return The successful result.
     * @throws UnsupportedActionTypeError if no handler is registered.
     * @throws HandlerExecutionError if the handler throws or reports failure.
     */
    ExecuteResult dispatch(const HandlerContext& ctx) const;

    /**
     * @brief Enabled actions of a graph whose (kind, type) has no handler.
     */
    std::vector<ActionKey> find_unsupported(const ActionGraph& graph) const;

    /**
     * @brief Check that every enabled action of a graph can be routed.
     * @throws UnsupportedActionTypeError for the first unsupported action.
     */
    void validate(const ActionGraph& graph) const;

    const HandlerRegistry& registry() const noexcept
    {
        return *m_registry;
    }

private:
    ActionHandlerPtr resolve(const Action& action) const;

    HandlerRegistryPtr m_registry;
};

} // namespace actiondag
