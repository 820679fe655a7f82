/**
 * @file action.hpp
 * @brief Declared actions and their dependency references.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action_types.hpp"
#include "actiondag/common/payload.hpp"

namespace actiondag
{

/**
 * @brief Output values of an action, keyed by output name.
 */
using ActionOutputs = std::map<std::string, std::string>;

/**
 * @brief Outputs of the dependencies passed to a handler, keyed by dependency.
 */
using DependencyOutputs = std::map<ActionKey, ActionOutputs>;

/**
 * @brief A reference from one action to another action it depends on.
 */
struct ActionDependency
{
    ActionKey key;

    /**
     * @brief The consumer needs the executed outputs of the dependency.
     *
     * @details
     * Only dependencies with this flag contribute to the `DependencyOutputs`
     * handed to the consumer's handler. Without it the dependency only
     * constrains ordering.
     */
    bool needs_executed_outputs{false};

    /**
     * @brief Parse a `kind.name` reference.
     * @throws InvalidActionReferenceError if malformed.
     */
    static ActionDependency parse(std::string_view reference, bool needs_executed_outputs = false)
    {
        return ActionDependency{parse_action_reference(reference), needs_executed_outputs};
    }
};

/**
 * @brief A declared unit of work.
 *
 * @details
 * Actions are produced by the configuration layer and handed to the
 * `GraphBuilder`. The engine treats `spec` as opaque. An action is immutable
 * once its graph has been built.
 */
struct Action
{
    ActionKind kind{ActionKind::Build};

    /// Provider-specific action type, e.g. "container" or "exec".
    std::string type;

    std::string name;

    std::string description;

    /// Explicit dependencies, in declaration order.
    std::vector<ActionDependency> dependencies;

    /**
     * @brief Name of a Build action whose outputs this action consumes.
     *
     * @details
     * Shorthand for a dependency on `build.<name>` with
     * `needs_executed_outputs` set.
     */
    std::optional<std::string> build;

    /// Disabled actions are kept in the graph but never dispatched.
    bool disabled{false};

    /// Maximum duration of a single execution, if any.
    std::optional<std::chrono::milliseconds> timeout;

    Payload spec;

    ActionKey key() const
    {
        return ActionKey{kind, name};
    }

    /**
     * @brief All dependency references, with the `build` shorthand expanded.
     *
     * @details
     * The shorthand reference is appended after the explicit ones.
     */
    std::vector<ActionDependency> all_dependencies() const
    {
        std::vector<ActionDependency> result = dependencies;
        if (build)
        {
            result.push_back(ActionDependency{ActionKey{ActionKind::Build, *build}, true});
        }
        return result;
    }
};

} // namespace actiondag
