/**
 * @file fingerprint_provider.hpp
 * @brief Interface to the collaborator that fingerprints action inputs.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/action.hpp"

#include <mutex>

namespace actiondag
{

/**
 * @brief Source of the own-input fingerprint of an action.
 *
 * @details
 * A fingerprint summarizes everything an action consumes directly: the state
 * of its source tree and the serialization of its specification. The engine
 * never computes it; it only combines fingerprints into versions.
 *
 * Implementations must be deterministic: identical file contents must give
 * identical fingerprints regardless of filesystem metadata such as timestamps
 * or permissions, unless explicitly configured otherwise.
 *
 * @par Failure
 * Returning std::nullopt, or throwing, marks the fingerprint as unavailable.
 * The action and everything depending on it will not be executed.
 */
class IFingerprintProvider
{
public:
    virtual ~IFingerprintProvider() = default;

    virtual std::optional<std::string> fingerprint(const Action& action) = 0;
};

using FingerprintProviderPtr = std::shared_ptr<IFingerprintProvider>;

/**
 * @brief Fingerprint provider backed by a fixed table.
 *
 * @details
 * Returns the fingerprint registered for an action's key, or std::nullopt if
 * none is registered. Useful when fingerprints were computed elsewhere, and in
 * tests.
 *
 * @par Thread Safety
 * - All methods are internally synchronized.
 */
class StaticFingerprintProvider : public IFingerprintProvider
{
public:
    StaticFingerprintProvider() = default;

    explicit StaticFingerprintProvider(std::map<ActionKey, std::string> fingerprints)
        : m_fingerprints{std::move(fingerprints)}
    {}

    void set(const ActionKey& key, std::string fingerprint);

    void remove(const ActionKey& key);

    std::optional<std::string> fingerprint(const Action& action) override;

private:
    std::mutex m_mutex;
    std::map<ActionKey, std::string> m_fingerprints;
};

} // namespace actiondag
