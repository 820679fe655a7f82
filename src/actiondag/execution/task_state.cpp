#include "actiondag/execution/task_state.hpp"

namespace actiondag
{

const char* to_string(TaskState state) noexcept
{
    switch (state)
    {
    case TaskState::Pending:
        return "Pending";
    case TaskState::Ready:
        return "Ready";
    case TaskState::Running:
        return "Running";
    case TaskState::Succeeded:
        return "Succeeded";
    case TaskState::Failed:
        return "Failed";
    case TaskState::Skipped:
        return "Skipped";
    case TaskState::Cached:
        return "Cached";
    }
    return "Unknown";
}

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::None:
        return "None";
    case ErrorKind::GraphValidation:
        return "GraphValidation";
    case ErrorKind::FingerprintUnavailable:
        return "FingerprintUnavailable";
    case ErrorKind::UnsupportedActionType:
        return "UnsupportedActionType";
    case ErrorKind::HandlerExecution:
        return "HandlerExecution";
    case ErrorKind::Timeout:
        return "Timeout";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::DependencyFailed:
        return "DependencyFailed";
    }
    return "Unknown";
}

} // namespace actiondag
