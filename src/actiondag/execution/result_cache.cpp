#include "actiondag/execution/result_cache.hpp"
#include "actiondag/common/artifact_key.hpp"
#include "actiondag/common/engine_errors.hpp"
#include "actiondag/common/logging.hpp"

#include <mutex>

namespace actiondag
{

std::string ResultCacheKey::to_string() const
{
    return artifact_key(kind, name, version);
}

ResultCache::Shard& ResultCache::shard_for(const std::string& key) const
{
    return m_shards[std::hash<std::string>{}(key) % kShardCount];
}

std::optional<ActionOutputs> ResultCache::get(const ResultCacheKey& key) const
{
    const std::string k = key.to_string();
    Shard& shard = shard_for(k);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(k);
    if (it == shard.entries.end())
    {
        m_misses.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    m_hits.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

bool ResultCache::put(const ResultCacheKey& key, ActionOutputs outputs)
{
    const std::string k = key.to_string();
    Shard& shard = shard_for(k);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.emplace(k, std::move(outputs)).second;
}

bool ResultCache::contains(const ResultCacheKey& key) const
{
    const std::string k = key.to_string();
    Shard& shard = shard_for(k);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.count(k) != 0;
}

void ResultCache::invalidate_all()
{
    for (auto& shard : m_shards)
    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        shard.entries.clear();
    }
    get_logger()->debug("Result cache invalidated");
}

size_t ResultCache::size() const
{
    size_t total = 0;
    for (const auto& shard : m_shards)
    {
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

CacheLookup ResultCache::get_or_compute(const ResultCacheKey& key,
                                        const std::function<CacheComputation()>& compute)
{
    const std::string k = key.to_string();
    Shard& shard = shard_for(k);

    std::promise<CacheComputation> promise;
    for (;;)
    {
        std::shared_future<CacheComputation> pending;
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            auto stored = shard.entries.find(k);
            if (stored != shard.entries.end())
            {
                m_hits.fetch_add(1, std::memory_order_relaxed);
                CacheLookup lookup;
                lookup.value.outputs = stored->second;
                lookup.source = CacheSource::Hit;
                return lookup;
            }

            auto flight = shard.in_flight.find(k);
            if (flight == shard.in_flight.end())
            {
                m_misses.fetch_add(1, std::memory_order_relaxed);
                shard.in_flight.emplace(k, promise.get_future().share());
                break;
            }
            pending = flight->second;
        }

        m_dedups.fetch_add(1, std::memory_order_relaxed);
        get_logger()->debug("Waiting for in-flight computation of {}", k);
        try
        {
            CacheLookup lookup;
            lookup.value = pending.get();
            lookup.source = CacheSource::Joined;
            return lookup;
        }
        catch (const TimeoutError& e)
        {
            // The computing caller gave up on its own deadline; the version itself did not fail.
            get_logger()->debug("In-flight computation of {} timed out ({}), retrying", k, e.what());
        }
        catch (const OperationCancelledError& e)
        {
            get_logger()->debug("In-flight computation of {} was cancelled ({}), retrying", k, e.what());
        }
    }

    CacheComputation value;
    try
    {
        value = compute();
    }
    catch (...)
    {
        {
            std::unique_lock<std::shared_mutex> lock(shard.mutex);
            shard.in_flight.erase(k);
        }
        promise.set_exception(std::current_exception());
        throw;
    }

    {
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        if (value.cacheable)
        {
            shard.entries.emplace(k, value.outputs);
        }
        shard.in_flight.erase(k);
    }
    promise.set_value(value);

    CacheLookup lookup;
    lookup.value = std::move(value);
    lookup.source = CacheSource::Computed;
    return lookup;
}

} // namespace actiondag
