#include "actiondag/versioning/fingerprint_provider.hpp"

namespace actiondag
{

void StaticFingerprintProvider::set(const ActionKey& key, std::string fingerprint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fingerprints[key] = std::move(fingerprint);
}

void StaticFingerprintProvider::remove(const ActionKey& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fingerprints.erase(key);
}

std::optional<std::string> StaticFingerprintProvider::fingerprint(const Action& action)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_fingerprints.find(action.key());
    if (it == m_fingerprints.end())
    {
        return std::nullopt;
    }
    return it->second;
}

} // namespace actiondag
