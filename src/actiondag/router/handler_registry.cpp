#include "actiondag/router/handler_registry.hpp"
#include "actiondag/common/engine_errors.hpp"

namespace actiondag
{

const char* to_string(ActionStatusState state) noexcept
{
    switch (state)
    {
    case ActionStatusState::Ready:
        return "ready";
    case ActionStatusState::NotReady:
        return "not-ready";
    case ActionStatusState::Outdated:
        return "outdated";
    case ActionStatusState::Unknown:
        return "unknown";
    }
    return "unknown";
}

void HandlerRegistry::register_handler(ActionKind kind, const std::string& type, ActionHandlerPtr handler)
{
    if (!handler)
    {
        throw std::invalid_argument("Cannot register a null handler for " +
                                    kind_display_name(kind) + " type '" + type + "'");
    }
    auto inserted = m_handlers.emplace(std::make_pair(kind, type), std::move(handler)).second;
    if (!inserted)
    {
        throw DuplicateHandlerError(kind, type);
    }
}

ActionHandlerPtr HandlerRegistry::find(ActionKind kind, const std::string& type) const
{
    auto it = m_handlers.find(std::make_pair(kind, type));
    if (it == m_handlers.end())
    {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> HandlerRegistry::types(ActionKind kind) const
{
    std::vector<std::string> result;
    for (const auto& entry : m_handlers)
    {
        if (entry.first.first == kind)
        {
            result.push_back(entry.first.second);
        }
    }
    return result;
}

} // namespace actiondag
