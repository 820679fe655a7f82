#include "actiondag/execution/node_task.hpp"
#include "actiondag/common/engine_errors.hpp"

namespace actiondag
{

NodeTask::NodeTask(const ActionGraph& graph, NodeIdx idx, std::string version)
    : m_node{graph.node(idx)}
    , m_idx{idx}
    , m_predecessors_remaining{m_node.dependencies.size()}
{
    m_result.key = m_node.key;
    m_result.type = m_node.action.type;
    m_result.version = std::move(version);
    m_result.disabled = m_node.action.disabled;
    m_result.state = TaskState::Pending;
    m_result.dependencies.reserve(m_node.dependencies.size());
    for (const auto& edge : m_node.dependencies)
    {
        m_result.dependencies.push_back(graph.node(edge.dependency).key);
    }
}

bool NodeTask::decrement_predecessor_count()
{
    if (m_predecessors_remaining == 0)
    {
        throw EngineError(EngineErrorCode::InternalError,
                          "Predecessor count underflow for " + m_node.key.to_string());
    }
    --m_predecessors_remaining;
    return m_predecessors_remaining == 0;
}

void NodeTask::mark_ready()
{
    if (m_result.state != TaskState::Pending)
    {
        throw EngineError(EngineErrorCode::InternalError,
                          m_node.key.to_string() + " cannot become Ready from " + to_string(m_result.state));
    }
    m_result.state = TaskState::Ready;
}

void NodeTask::start(const CancellationToken& parent, std::optional<std::chrono::milliseconds> timeout)
{
    if (m_result.state != TaskState::Ready)
    {
        throw EngineError(EngineErrorCode::InternalError,
                          m_node.key.to_string() + " cannot start from " + to_string(m_result.state));
    }
    m_start_time = std::chrono::steady_clock::now();
    m_timeout = timeout;
    if (timeout)
    {
        m_deadline = m_start_time + *timeout;
    }
    m_cancel = std::make_unique<CancellationSource>(parent, m_deadline);
    m_result.state = TaskState::Running;
}

CancellationToken NodeTask::token() const
{
    if (!m_cancel)
    {
        return CancellationToken{};
    }
    return m_cancel->token();
}

void NodeTask::cancel() noexcept
{
    if (m_cancel)
    {
        m_cancel->cancel();
    }
}

bool NodeTask::finish(NodeOutcome outcome, bool record_duration)
{
    if (m_result.state != TaskState::Running)
    {
        return false;
    }
    if (record_duration)
    {
        m_result.duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - m_start_time);
    }
    m_result.state = outcome.state;
    m_result.error_kind = outcome.error_kind;
    m_result.error = std::move(outcome.error);
    m_result.outputs = std::move(outcome.outputs);
    m_result.from_cache = outcome.from_cache;
    m_result.status_up_to_date = outcome.status_up_to_date;
    return true;
}

void NodeTask::skip(ErrorKind kind, std::string message)
{
    if (m_result.state != TaskState::Pending && m_result.state != TaskState::Ready)
    {
        throw EngineError(EngineErrorCode::InternalError,
                          m_node.key.to_string() + " cannot be skipped from " + to_string(m_result.state));
    }
    m_result.state = TaskState::Skipped;
    m_result.error_kind = kind;
    m_result.error = std::move(message);
}

} // namespace actiondag
