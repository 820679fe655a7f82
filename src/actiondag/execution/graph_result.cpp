#include "actiondag/execution/graph_result.hpp"

#include <set>

namespace actiondag
{

const GraphResult* RunResult::find(const ActionKey& key) const
{
    auto it = m_results.find(key);
    if (it == m_results.end())
    {
        return nullptr;
    }
    return &it->second;
}

const GraphResult& RunResult::at(const ActionKey& key) const
{
    const GraphResult* result = find(key);
    if (!result)
    {
        throw std::out_of_range("No result for action " + key.to_string());
    }
    return *result;
}

std::vector<const GraphResult*> RunResult::dependency_results(const ActionKey& key) const
{
    std::vector<const GraphResult*> results;
    for (const auto& dep : at(key).dependencies)
    {
        results.push_back(&at(dep));
    }
    return results;
}

std::vector<const GraphResult*> RunResult::all_dependencies(const ActionKey& key) const
{
    std::set<ActionKey> visited;
    std::vector<ActionKey> stack = at(key).dependencies;
    while (!stack.empty())
    {
        ActionKey current = stack.back();
        stack.pop_back();
        if (!visited.insert(current).second)
        {
            continue;
        }
        for (const auto& dep : at(current).dependencies)
        {
            if (visited.count(dep) == 0)
            {
                stack.push_back(dep);
            }
        }
    }

    std::vector<const GraphResult*> results;
    results.reserve(visited.size());
    for (const auto& dep : visited)
    {
        results.push_back(&at(dep));
    }
    return results;
}

size_t RunResult::count(TaskState state) const
{
    size_t n = 0;
    for (const auto& entry : m_results)
    {
        if (entry.second.state == state)
        {
            ++n;
        }
    }
    return n;
}

std::vector<ActionKey> RunResult::keys_in_state(TaskState state) const
{
    std::vector<ActionKey> keys;
    for (const auto& entry : m_results)
    {
        if (entry.second.state == state)
        {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

bool RunResult::success() const
{
    for (const auto& entry : m_results)
    {
        if (!entry.second.is_success())
        {
            return false;
        }
    }
    return true;
}

std::string RunResult::summary() const
{
    std::string result;
    if (success())
    {
        result = "Run succeeded";
    }
    else if (m_stopped)
    {
        result = "Run stopped by request";
    }
    else
    {
        result = "Run failed";
    }
    result += " (succeeded=" + std::to_string(count(TaskState::Succeeded));
    result += ", cached=" + std::to_string(count(TaskState::Cached));
    result += ", failed=" + std::to_string(count(TaskState::Failed));
    result += ", skipped=" + std::to_string(count(TaskState::Skipped)) + ")";
    return result;
}

void RunResult::add(GraphResult result)
{
    ActionKey key = result.key;
    m_results[key] = std::move(result);
}

} // namespace actiondag
