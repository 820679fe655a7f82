/**
 * @file version_resolver.hpp
 * @brief Computes the content version of every node of an ActionGraph.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/graph/action_graph.hpp"
#include "actiondag/versioning/fingerprint_provider.hpp"

namespace actiondag
{

/**
 * @brief Prefix of every version string.
 */
inline constexpr const char* kVersionPrefix = "v-";

/**
 * @brief Number of hex digits of the digest kept in a version string.
 */
inline constexpr size_t kVersionHashLength = 10;

/**
 * @brief The version of one action and the inputs it was computed from.
 */
struct ResolvedVersion
{
    /// `v-` followed by kVersionHashLength lower-case hex digits.
    std::string version_string;

    /// The own-input fingerprint supplied by the provider.
    std::string fingerprint;

    /// Versions of the direct dependencies, ordered by dependency key.
    std::map<ActionKey, std::string> dependency_versions;
};

/**
 * @brief Why an action has no version.
 *
 * @details
 * A node whose own fingerprint is unavailable is a root cause. A node that
 * depends (transitively) on a root cause is blocked by it.
 */
struct VersionFailure
{
    ActionKey key;
    std::string message;

    /// The root-cause node, for blocked nodes; empty for root causes.
    std::optional<ActionKey> blocked_by;

    bool is_root_cause() const noexcept
    {
        return !blocked_by.has_value();
    }
};

/**
 * @brief Result of version resolution over one graph.
 *
 * @details
 * Every node appears in exactly one of `versions()` or `failures()`.
 *
 * @par Thread Safety
 * - Immutable once returned by the resolver; concurrent reads are safe.
 */
class VersionMap
{
public:
    /**
     * @brief The version of a node, or nullptr if it could not be computed.
     */
    const ResolvedVersion* find(const ActionKey& key) const;

    /**
     * @brief The failure of a node, or nullptr if it has a version.
     */
    const VersionFailure* find_failure(const ActionKey& key) const;

    const std::map<ActionKey, ResolvedVersion>& versions() const noexcept
    {
        return m_versions;
    }

    const std::map<ActionKey, VersionFailure>& failures() const noexcept
    {
        return m_failures;
    }

    /**
     * @brief Root-cause failures only.
     */
    std::vector<ActionKey> root_causes() const;

    /**
     * @brief True if every node has a version.
     */
    bool complete() const noexcept
    {
        return m_failures.empty();
    }

    /**
     * @brief Record a version computed elsewhere.
     * @details Replaces any failure recorded for the same key.
     */
    void set(const ActionKey& key, ResolvedVersion version);

    // Allow VersionResolver to populate failures
    friend class VersionResolver;

private:
    std::map<ActionKey, ResolvedVersion> m_versions;
    std::map<ActionKey, VersionFailure> m_failures;
};

/**
 * @brief Computes a deterministic version for every node of a graph.
 *
 * @details
 * Nodes are processed in topological order, so the versions of all
 * dependencies are known when a consumer is processed. The version of a node
 * is a digest of its own fingerprint followed by `(key, version)` of each
 * direct dependency in lexicographic key order. Declaration order and map
 * iteration order therefore never influence the result, and a change
 * anywhere below a node changes the node's version.
 *
 * Disabled actions never execute; when their fingerprint is unavailable they
 * are versioned from a fixed marker instead of failing.
 *
 * @par Thread Safety
 * - resolve() may be called concurrently if the provider allows it.
 */
class VersionResolver
{
public:
    explicit VersionResolver(FingerprintProviderPtr provider);

    /**
     * @brief Resolve versions, recording per-node failures.
     *
     * @details
     * A node whose fingerprint is unavailable is recorded as a root-cause
     * failure and every node depending on it as blocked. Independent nodes
     * still receive versions.
     */
    VersionMap resolve(const ActionGraph& graph) const;

    /**
     * @brief Resolve versions, failing if any node cannot be versioned.
     * @throws VersionComputationError naming the root-cause nodes.
     */
    VersionMap resolve_strict(const ActionGraph& graph) const;

    /**
     * @brief Combine a fingerprint and dependency versions into a version string.
     */
    static std::string compute_version(const std::string& fingerprint,
                                       const std::map<ActionKey, std::string>& dependency_versions);

private:
    FingerprintProviderPtr m_provider;
};

} // namespace actiondag
