/**
 * @file action_types.hpp
 * @brief Action kinds and the (kind, name) identity used throughout the engine.
 */
#pragma once
#include "actiondag/common/common.hpp"

namespace actiondag
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` identifies an action node inside one `ActionGraph`. Indices follow
 * declaration order. This alias exists for clarity in API signatures and
 * documentation, not for compile-time type safety.
 */
using NodeIdx = size_t;

// ============================================================================
// ActionKind
// ============================================================================

/**
 * @brief The four kinds of actions.
 *
 * @details
 * The declaration order of the enumerators matches the lexicographic order of
 * their lower-case names, so ordering by kind is consistent with ordering by
 * rendered keys.
 */
enum class ActionKind
{
    Build,
    Deploy,
    Run,
    Test
};

/**
 * @brief Capitalized kind name, e.g. "Build".
 */
const std::string& kind_display_name(ActionKind kind);

/**
 * @brief Lower-case kind name used in references and keys, e.g. "build".
 */
const std::string& kind_key_name(ActionKind kind);

/**
 * @brief Parse a kind name, case-insensitively.
 * @return The kind, or std::nullopt if the name is not a known kind.
 */
std::optional<ActionKind> parse_action_kind(std::string_view text);

// ============================================================================
// ActionKey
// ============================================================================

/**
 * @brief Identity of an action node: its kind and name.
 *
 * @details
 * Two actions with the same kind and name are the same node; the action type
 * is not part of the identity. Keys render as `kind.name` (for example
 * `deploy.backend`) and are totally ordered consistently with that rendering.
 */
struct ActionKey
{
    ActionKind kind{ActionKind::Build};
    std::string name;

    ActionKey() = default;

    ActionKey(ActionKind kind_, std::string name_)
        : kind{kind_}
        , name{std::move(name_)}
    {}

    /**
     * @brief Render as `kind.name`.
     */
    std::string to_string() const;

    bool operator==(const ActionKey& other) const noexcept
    {
        return kind == other.kind && name == other.name;
    }

    bool operator!=(const ActionKey& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const ActionKey& other) const noexcept
    {
        if (kind != other.kind)
        {
            return static_cast<int>(kind) < static_cast<int>(other.kind);
        }
        return name < other.name;
    }
};

std::ostream& operator<<(std::ostream& os, const ActionKey& key);

/**
 * @brief Hash functor for unordered containers keyed by ActionKey.
 */
struct ActionKeyHash
{
    size_t operator()(const ActionKey& key) const noexcept
    {
        size_t h = std::hash<std::string>{}(key.name);
        return h ^ (static_cast<size_t>(key.kind) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/**
 * @brief Parse a dependency reference of the form `kind.name`.
 *
 * @details
 * The kind part is matched case-insensitively. The name is everything after
 * the first dot and may itself contain dots.
 *
 * @throws InvalidActionReferenceError if the reference is malformed or the
 *         kind is unknown.
 */
ActionKey parse_action_reference(std::string_view reference);

} // namespace actiondag
