#include "actiondag/common/engine_errors.hpp"

namespace actiondag
{

const char* to_string(EngineErrorCode code) noexcept
{
    switch (code)
    {
    case EngineErrorCode::InvalidActionReference:
        return "InvalidActionReference";
    case EngineErrorCode::DuplicateAction:
        return "DuplicateAction";
    case EngineErrorCode::UnresolvedDependency:
        return "UnresolvedDependency";
    case EngineErrorCode::CyclicDependency:
        return "CyclicDependency";
    case EngineErrorCode::FingerprintUnavailable:
        return "FingerprintUnavailable";
    case EngineErrorCode::VersionComputation:
        return "VersionComputation";
    case EngineErrorCode::UnsupportedActionType:
        return "UnsupportedActionType";
    case EngineErrorCode::DuplicateHandler:
        return "DuplicateHandler";
    case EngineErrorCode::HandlerExecution:
        return "HandlerExecution";
    case EngineErrorCode::Timeout:
        return "Timeout";
    case EngineErrorCode::Cancelled:
        return "Cancelled";
    case EngineErrorCode::PayloadEmpty:
        return "PayloadEmpty";
    case EngineErrorCode::PayloadType:
        return "PayloadType";
    case EngineErrorCode::InternalError:
        return "InternalError";
    }
    return "Unknown";
}

} // namespace actiondag
