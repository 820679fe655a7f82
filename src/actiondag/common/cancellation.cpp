#include "actiondag/common/cancellation.hpp"
#include "actiondag/common/engine_errors.hpp"

namespace actiondag
{

struct CancellationToken::State
{
    std::atomic<bool> cancelled{false};
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::shared_ptr<const State> parent;
};

// ============================================================================
// CancellationToken
// ============================================================================

bool CancellationToken::is_cancelled() const noexcept
{
    const auto now = std::chrono::steady_clock::now();
    for (const State* state = m_state.get(); state; state = state->parent.get())
    {
        if (state->cancelled.load(std::memory_order_acquire))
        {
            return true;
        }
        if (state->deadline && *state->deadline <= now)
        {
            return true;
        }
    }
    return false;
}

bool CancellationToken::deadline_expired() const noexcept
{
    auto earliest = deadline();
    return earliest && *earliest <= std::chrono::steady_clock::now();
}

std::optional<std::chrono::steady_clock::time_point> CancellationToken::deadline() const noexcept
{
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (const State* state = m_state.get(); state; state = state->parent.get())
    {
        if (state->deadline && (!earliest || *state->deadline < *earliest))
        {
            earliest = state->deadline;
        }
    }
    return earliest;
}

void CancellationToken::throw_if_cancelled() const
{
    if (deadline_expired())
    {
        throw TimeoutError("Deadline exceeded");
    }
    if (is_cancelled())
    {
        throw OperationCancelledError();
    }
}

// ============================================================================
// CancellationSource
// ============================================================================

CancellationSource::CancellationSource()
    : m_state{std::make_shared<CancellationToken::State>()}
{}

CancellationSource::CancellationSource(CancellationToken parent,
                                       std::optional<std::chrono::steady_clock::time_point> deadline)
    : m_state{std::make_shared<CancellationToken::State>()}
{
    m_state->parent = std::move(parent.m_state);
    m_state->deadline = deadline;
}

void CancellationSource::cancel() noexcept
{
    m_state->cancelled.store(true, std::memory_order_release);
}

bool CancellationSource::is_cancelled() const noexcept
{
    return token().is_cancelled();
}

CancellationToken CancellationSource::token() const
{
    return CancellationToken{m_state};
}

} // namespace actiondag
