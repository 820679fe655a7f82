/**
 * @file handler_registry.hpp
 * @brief Registry mapping (kind, type) to a handler set.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/router/action_handler.hpp"

namespace actiondag
{

/**
 * @brief Registry of handler sets keyed by action kind and type.
 *
 * @details
 * Providers register one handler per (kind, type) they support. The registry
 * is filled before any run starts and only read afterwards.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Concurrent lookups are safe once registration is finished.
 */
class HandlerRegistry
{
public:
    /**
     * @brief Register the handler set for a (kind, type).
     * @throws DuplicateHandlerError if one is already registered.
     * @throws std::invalid_argument if handler is null.
     */
    void register_handler(ActionKind kind, const std::string& type, ActionHandlerPtr handler);

    /**
     * @brief Look up a handler.
     * @return The handler, or nullptr if none is registered.
     */
    ActionHandlerPtr find(ActionKind kind, const std::string& type) const;

    bool contains(ActionKind kind, const std::string& type) const
    {
        return find(kind, type) != nullptr;
    }

    size_t size() const noexcept
    {
        return m_handlers.size();
    }

    /**
     * @brief Registered types of one kind, sorted.
     */
    std::vector<std::string> types(ActionKind kind) const;

private:
    std::map<std::pair<ActionKind, std::string>, ActionHandlerPtr> m_handlers;
};

using HandlerRegistryPtr = std::shared_ptr<const HandlerRegistry>;

} // namespace actiondag
