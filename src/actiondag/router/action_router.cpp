#include "actiondag/router/action_router.hpp"
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/common/logging.hpp"

namespace actiondag
{

namespace
{

/// Invoke handler code, wrapping foreign exceptions into HandlerExecutionError.
template <typename Fn>
auto invoke_guarded(const Action& action, const char* operation, Fn&& fn) -> decltype(fn())
{
    try
    {
        return fn();
    }
    catch (const OperationCancelledError&)
    {
        throw;
    }
    catch (const TimeoutError&)
    {
        throw;
    }
    catch (const HandlerExecutionError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw HandlerExecutionError(action.key(), std::string(operation) + " failed: " + e.what(),
                                    std::current_exception());
    }
    catch (...)
    {
        throw HandlerExecutionError(action.key(), std::string(operation) + " failed: unknown error",
                                    std::current_exception());
    }
}

} // namespace

ActionRouter::ActionRouter(HandlerRegistryPtr registry)
    : m_registry{std::move(registry)}
{
    if (!m_registry)
    {
        throw std::invalid_argument("ActionRouter requires a handler registry");
    }
}

ActionHandlerPtr ActionRouter::resolve(const Action& action) const
{
    ActionHandlerPtr handler = m_registry->find(action.kind, action.type);
    if (!handler)
    {
        throw UnsupportedActionTypeError(action.key(), action.type);
    }
    return handler;
}

StatusResult ActionRouter::get_status(const HandlerContext& ctx) const
{
    ActionHandlerPtr handler = resolve(ctx.action);
    StatusResult status = invoke_guarded(ctx.action, "getStatus", [&]() { return handler->get_status(ctx); });
    get_logger()->debug("{} status: {}", ctx.action.key().to_string(), to_string(status.state));
    return status;
}

ExecuteResult ActionRouter::dispatch(const HandlerContext& ctx) const
{
    ActionHandlerPtr handler = resolve(ctx.action);
    ExecuteResult result = invoke_guarded(ctx.action, "execute", [&]() { return handler->execute(ctx); });
    if (!result.success)
    {
        throw HandlerExecutionError(ctx.action.key(),
                                    result.error.empty() ? "handler reported failure" : result.error);
    }
    return result;
}

std::vector<ActionKey> ActionRouter::find_unsupported(const ActionGraph& graph) const
{
    std::vector<ActionKey> result;
    for (const auto& node : graph.nodes())
    {
        if (!node.action.disabled && !m_registry->contains(node.action.kind, node.action.type))
        {
            result.push_back(node.key);
        }
    }
    return result;
}

void ActionRouter::validate(const ActionGraph& graph) const
{
    for (const auto& node : graph.nodes())
    {
        if (!node.action.disabled)
        {
            resolve(node.action);
        }
    }
}

} // namespace actiondag
