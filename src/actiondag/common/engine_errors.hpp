/**
 * @file engine_errors.hpp
 * @brief Exception types raised by the engine.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action_types.hpp"

namespace actiondag
{

/**
 * @brief Error codes for engine operations.
 *
 * @details
 * Codes are grouped by the stage that raises them: graph construction,
 * version resolution, routing and execution.
 */
enum class EngineErrorCode
{
    InvalidActionReference,
    DuplicateAction,
    UnresolvedDependency,
    CyclicDependency,
    FingerprintUnavailable,
    VersionComputation,
    UnsupportedActionType,
    DuplicateHandler,
    HandlerExecution,
    Timeout,
    Cancelled,
    PayloadEmpty,
    PayloadType,
    InternalError
};

/**
 * @brief Short name of an error code, for log output.
 */
const char* to_string(EngineErrorCode code) noexcept;

/**
 * @brief Base exception class for all engine errors.
 *
 * @details
 * `EngineError` carries an error code and a descriptive message. Derived
 * classes add the structured context of their category (action identities,
 * cycle members, original causes).
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class EngineError : public std::exception
{
public:
    /**
     * @brief Construct an EngineError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    EngineError(EngineErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    EngineErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    EngineErrorCode m_code;
    std::string m_message;
};

/**
 * @brief A dependency reference string could not be parsed.
 */
class InvalidActionReferenceError : public EngineError
{
public:
    explicit InvalidActionReferenceError(const std::string& reference, const std::string& reason)
        : EngineError(EngineErrorCode::InvalidActionReference,
                      "Invalid action reference '" + reference + "': " + reason)
        , m_reference(reference)
    {}

    const std::string& reference() const noexcept
    {
        return m_reference;
    }

private:
    std::string m_reference;
};

/**
 * @brief The fingerprint of an action could not be obtained.
 */
class FingerprintUnavailableError : public EngineError
{
public:
    FingerprintUnavailableError(ActionKey key, const std::string& reason)
        : EngineError(EngineErrorCode::FingerprintUnavailable,
                      "Could not compute version of " + key.to_string() + ": " + reason)
        , m_key(std::move(key))
    {}

    const ActionKey& key() const noexcept
    {
        return m_key;
    }

private:
    ActionKey m_key;
};

/**
 * @brief Version resolution failed for one or more nodes.
 *
 * @details
 * Raised by the strict resolution entry point. `failed_keys()` lists the nodes
 * whose fingerprint was unavailable, not their blocked dependents.
 */
class VersionComputationError : public EngineError
{
public:
    VersionComputationError(const std::string& message, std::vector<ActionKey> failed_keys)
        : EngineError(EngineErrorCode::VersionComputation, message)
        , m_failed_keys(std::move(failed_keys))
    {}

    const std::vector<ActionKey>& failed_keys() const noexcept
    {
        return m_failed_keys;
    }

private:
    std::vector<ActionKey> m_failed_keys;
};

/**
 * @brief No handler set is registered for an action's (kind, type).
 */
class UnsupportedActionTypeError : public EngineError
{
public:
    UnsupportedActionTypeError(ActionKey key, const std::string& type)
        : EngineError(EngineErrorCode::UnsupportedActionType,
                      "No handler registered for " + kind_display_name(key.kind) +
                          " type '" + type + "' (required by " + key.to_string() + ")")
        , m_key(std::move(key))
        , m_type(type)
    {}

    const ActionKey& key() const noexcept
    {
        return m_key;
    }

    const std::string& type() const noexcept
    {
        return m_type;
    }

private:
    ActionKey m_key;
    std::string m_type;
};

/**
 * @brief A handler set is already registered for a (kind, type).
 */
class DuplicateHandlerError : public EngineError
{
public:
    DuplicateHandlerError(ActionKind kind, const std::string& type)
        : EngineError(EngineErrorCode::DuplicateHandler,
                      "A handler is already registered for " + kind_display_name(kind) +
                          " type '" + type + "'")
    {}
};

/**
 * @brief A handler failed while checking status or executing an action.
 *
 * @details
 * Wraps whatever the handler raised (or reported) together with the identity
 * of the action. The original exception, if any, is preserved in `cause()`.
 */
class HandlerExecutionError : public EngineError
{
public:
    HandlerExecutionError(ActionKey key, const std::string& detail, std::exception_ptr cause = nullptr)
        : EngineError(EngineErrorCode::HandlerExecution,
                      "Failed processing " + key.to_string() + ": " + detail)
        , m_key(std::move(key))
        , m_cause(std::move(cause))
    {}

    const ActionKey& key() const noexcept
    {
        return m_key;
    }

    /**
     * @brief The original exception raised by the handler, or nullptr.
     */
    std::exception_ptr cause() const noexcept
    {
        return m_cause;
    }

private:
    ActionKey m_key;
    std::exception_ptr m_cause;
};

/**
 * @brief An action exceeded its maximum duration.
 */
class TimeoutError : public EngineError
{
public:
    explicit TimeoutError(const std::string& message)
        : EngineError(EngineErrorCode::Timeout, message)
    {}
};

/**
 * @brief An operation observed a cancellation request.
 */
class OperationCancelledError : public EngineError
{
public:
    explicit OperationCancelledError(const std::string& message = "Operation cancelled")
        : EngineError(EngineErrorCode::Cancelled, message)
    {}
};

} // namespace actiondag
