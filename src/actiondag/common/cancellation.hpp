/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation tokens with optional deadlines.
 */
#pragma once
#include "actiondag/common/common.hpp"

namespace actiondag
{

class CancellationSource;

/**
 * @brief Read side of a cancellation request.
 *
 * @details
 * A token observes its source and, transitively, the parent of that source.
 * It reports cancellation when cancel() was called on any of them, or when
 * the deadline of any of them has passed. A default-constructed token is
 * never cancelled.
 *
 * Handlers are expected to poll the token at convenient points (between
 * network calls, while waiting on a remote operation) and to return or throw
 * promptly once it is cancelled.
 *
 * @par Thread Safety
 * - All methods may be called from any thread.
 */
class CancellationToken
{
public:
    CancellationToken() = default;

    /**
     * @brief True if cancellation was requested or a deadline has passed.
     */
    bool is_cancelled() const noexcept;

    /**
     * @brief True if a deadline (own or inherited) has passed.
     */
    bool deadline_expired() const noexcept;

    /**
     * @brief The earliest deadline of the token's chain, if any.
     */
    std::optional<std::chrono::steady_clock::time_point> deadline() const noexcept;

    /**
     * @brief Throw if cancelled.
     * @throws TimeoutError if a deadline has passed.
     * @throws OperationCancelledError if cancellation was requested.
     */
    void throw_if_cancelled() const;

    friend class CancellationSource;

private:
    struct State;

    explicit CancellationToken(std::shared_ptr<const State> state)
        : m_state{std::move(state)}
    {}

    std::shared_ptr<const State> m_state;
};

/**
 * @brief Write side of a cancellation request.
 *
 * @details
 * Sources can be chained: a source created with a parent token is cancelled
 * whenever the parent is. The scheduler creates one source per run and one
 * child source per running node, the latter carrying the node's deadline.
 *
 * @par Thread Safety
 * - cancel() may be called from any thread, any number of times.
 */
class CancellationSource
{
public:
    CancellationSource();

    /**
     * @brief Create a source linked to a parent token.
     * @param parent Cancellation of the parent cancels this source.
     * @param deadline Optional point in time after which tokens report cancelled.
     */
    explicit CancellationSource(CancellationToken parent,
                                std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

    void cancel() noexcept;

    bool is_cancelled() const noexcept;

    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> m_state;
};

} // namespace actiondag
