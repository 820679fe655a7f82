/**
 * @file result_cache.hpp
 * @brief Version-keyed store of successful action outputs.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"

#include <array>
#include <future>
#include <shared_mutex>

namespace actiondag
{

/**
 * @brief Cache key: one version of one action.
 */
struct ResultCacheKey
{
    ActionKind kind{ActionKind::Build};
    std::string name;
    std::string version;

    /**
     * @brief Render in artifact key form, `kind.name.version`.
     */
    std::string to_string() const;
};

/**
 * @brief Value produced by a get_or_compute() computation.
 */
struct CacheComputation
{
    ActionOutputs outputs;

    /// Store the outputs once the computation returns.
    bool cacheable{true};

    /// The outputs come from a status check rather than an execution.
    bool status_up_to_date{false};
};

/**
 * @brief Where the value of a get_or_compute() call came from.
 */
enum class CacheSource
{
    Hit,        ///< Stored entry.
    Computed,   ///< This caller ran the computation.
    Joined      ///< Another caller was computing the same key; its result was shared.
};

struct CacheLookup
{
    CacheComputation value;
    CacheSource source{CacheSource::Computed};
};

/**
 * @brief Write-once cache of action outputs keyed by (kind, name, version).
 *
 * @details
 * Only successful executions are stored; a failure is never cached, so the
 * next request for the same key computes again.
 *
 * The key space is split into a fixed number of shards, each guarded by its
 * own `std::shared_mutex`. Besides the stored entries each shard tracks the
 * computations in flight, which lets concurrent get_or_compute() calls for
 * the same key collapse into a single computation.
 *
 * @par Thread Safety
 * - All methods are internally synchronized.
 * - Computations run without any shard lock held.
 */
class ResultCache
{
public:
    static constexpr size_t kShardCount = 16;

    ResultCache() = default;

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    /**
     * @brief Stored outputs for a key, or std::nullopt.
     */
    std::optional<ActionOutputs> get(const ResultCacheKey& key) const;

    /**
     * @brief Store outputs for a key.
     * @return False if the key was already stored; the stored value is kept.
     */
    bool put(const ResultCacheKey& key, ActionOutputs outputs);

    bool contains(const ResultCacheKey& key) const;

    /**
     * @brief Drop all stored entries. Computations in flight are unaffected.
     */
    void invalidate_all();

    /**
     * @brief Number of stored entries.
     */
    size_t size() const;

    /**
     * @brief Return the stored value, or compute it exactly once.
     *
     * @details
     * - If the key is stored, returns it (CacheSource::Hit).
     * - If another caller is computing the key, waits for it and returns its
     *   value (CacheSource::Joined), or rethrows its exception. When that
     *   caller was aborted (TimeoutError or OperationCancelledError), the
     *   lookup starts over: it joins a newer computation or computes itself.
     * - Otherwise runs `compute`, stores the result if it is cacheable and
     *   returns it (CacheSource::Computed).
     *
     * An exception thrown by `compute` is delivered to this caller; waiting
     * callers receive it unless it is an abort. Nothing is stored.
     */
    CacheLookup get_or_compute(const ResultCacheKey& key, const std::function<CacheComputation()>& compute);

    uint64_t hit_count() const noexcept
    {
        return m_hits.load(std::memory_order_relaxed);
    }

    uint64_t miss_count() const noexcept
    {
        return m_misses.load(std::memory_order_relaxed);
    }

    /// Calls that joined a computation already in flight.
    uint64_t dedup_count() const noexcept
    {
        return m_dedups.load(std::memory_order_relaxed);
    }

private:
    struct Shard
    {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, ActionOutputs> entries;
        std::unordered_map<std::string, std::shared_future<CacheComputation>> in_flight;
    };

    Shard& shard_for(const std::string& key) const;

    mutable std::array<Shard, kShardCount> m_shards;
    mutable std::atomic<uint64_t> m_hits{0};
    mutable std::atomic<uint64_t> m_misses{0};
    std::atomic<uint64_t> m_dedups{0};
};

using ResultCachePtr = std::shared_ptr<ResultCache>;

} // namespace actiondag
