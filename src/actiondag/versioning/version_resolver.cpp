#include "actiondag/versioning/version_resolver.hpp"
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/common/logging.hpp"
#include "actiondag/versioning/content_hasher.hpp"

#include <sstream>

namespace actiondag
{

namespace
{

const char* const kDisabledFingerprint = "<disabled>";

} // namespace

// ============================================================================
// VersionMap
// ============================================================================

const ResolvedVersion* VersionMap::find(const ActionKey& key) const
{
    auto it = m_versions.find(key);
    return it == m_versions.end() ? nullptr : &it->second;
}

const VersionFailure* VersionMap::find_failure(const ActionKey& key) const
{
    auto it = m_failures.find(key);
    return it == m_failures.end() ? nullptr : &it->second;
}

std::vector<ActionKey> VersionMap::root_causes() const
{
    std::vector<ActionKey> result;
    for (const auto& entry : m_failures)
    {
        if (entry.second.is_root_cause())
        {
            result.push_back(entry.first);
        }
    }
    return result;
}

void VersionMap::set(const ActionKey& key, ResolvedVersion version)
{
    m_failures.erase(key);
    m_versions[key] = std::move(version);
}

// ============================================================================
// VersionResolver
// ============================================================================

VersionResolver::VersionResolver(FingerprintProviderPtr provider)
    : m_provider{std::move(provider)}
{
    if (!m_provider)
    {
        throw std::invalid_argument("VersionResolver requires a fingerprint provider");
    }
}

std::string VersionResolver::compute_version(const std::string& fingerprint,
                                             const std::map<ActionKey, std::string>& dependency_versions)
{
    ContentHasher hasher;
    hasher.add_field("fingerprint", fingerprint);
    for (const auto& [dep_key, dep_version] : dependency_versions)
    {
        hasher.add_field("dependency", dep_key.to_string());
        hasher.add_field("version", dep_version);
    }
    return kVersionPrefix + hasher.hex_digest().substr(0, kVersionHashLength);
}

VersionMap VersionResolver::resolve(const ActionGraph& graph) const
{
    VersionMap result;

    for (NodeIdx idx : graph.topological_order())
    {
        const ActionNode& node = graph.node(idx);

        // A failed dependency blocks this node; report the root cause
        std::optional<ActionKey> blocker;
        for (const auto& edge : node.dependencies)
        {
            const ActionKey& dep_key = graph.node(edge.dependency).key;
            if (const VersionFailure* failure = result.find_failure(dep_key))
            {
                blocker = failure->blocked_by ? *failure->blocked_by : dep_key;
                break;
            }
        }
        if (blocker)
        {
            result.m_failures[node.key] = VersionFailure{
                node.key,
                "Could not compute version of " + node.key.to_string() +
                    ": dependency " + blocker->to_string() + " has no version",
                blocker};
            continue;
        }

        std::optional<std::string> fingerprint;
        std::string reason = "no fingerprint available";
        try
        {
            fingerprint = m_provider->fingerprint(node.action);
        }
        catch (const std::exception& e)
        {
            reason = e.what();
        }

        if (!fingerprint)
        {
            if (node.action.disabled)
            {
                fingerprint = kDisabledFingerprint;
            }
            else
            {
                FingerprintUnavailableError error(node.key, reason);
                get_logger()->warn("{}", error.what());
                result.m_failures[node.key] = VersionFailure{node.key, error.what(), std::nullopt};
                continue;
            }
        }

        ResolvedVersion version;
        version.fingerprint = *fingerprint;
        for (const auto& edge : node.dependencies)
        {
            const ActionKey& dep_key = graph.node(edge.dependency).key;
            version.dependency_versions[dep_key] = result.m_versions.at(dep_key).version_string;
        }
        version.version_string = compute_version(version.fingerprint, version.dependency_versions);

        get_logger()->debug("{} resolved to {}", node.key.to_string(), version.version_string);
        result.m_versions[node.key] = std::move(version);
    }

    return result;
}

VersionMap VersionResolver::resolve_strict(const ActionGraph& graph) const
{
    VersionMap result = resolve(graph);
    if (!result.complete())
    {
        std::vector<ActionKey> roots = result.root_causes();
        std::ostringstream oss;
        oss << "Version resolution failed for " << roots.size() << " action(s):";
        for (const auto& key : roots)
        {
            oss << "\n  - " << result.find_failure(key)->message;
        }
        throw VersionComputationError(oss.str(), std::move(roots));
    }
    return result;
}

} // namespace actiondag
