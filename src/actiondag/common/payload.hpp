/**
 * @file payload.hpp
 * @brief Immutable type-erased payload carried by actions.
 */
#pragma once
#include "actiondag/common/common.hpp"
#include "actiondag/common/engine_errors.hpp"

namespace actiondag
{

/**
 * @brief An immutable, type-erased value shared between copies.
 *
 * @details
 * Payload holds the provider-specific specification of an action. The engine
 * never inspects it; handlers and fingerprint providers recover the concrete
 * type with `as<T>()` or `try_as<T>()`.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_pvoid == nullptr`
 *
 * @par Thread Safety
 * - The stored value is never mutated after construction, so concurrent reads
 *   from any number of threads are safe.
 *
 * @par Ownership
 * - Copies share the same underlying value.
 */
class Payload
{
public:
    /**
     * @brief Default constructor creates an empty Payload.
     */
    Payload() = default;

    /**
     * @brief Create a payload holding a copy (or move) of value.
     * @tparam T The type of value (will be decayed).
     */
    template <typename T>
    static Payload make(T&& value)
    {
        using StorageT = std::decay_t<T>;
        static_assert(!std::is_void_v<StorageT>, "Payload: T cannot be void");
        static_assert(!std::is_array_v<StorageT>, "Payload: T cannot be an array type");

        Payload result;
        result.m_pvoid = std::make_shared<const StorageT>(std::forward<T>(value));
        result.m_ti = std::type_index{typeid(StorageT)};
        return result;
    }

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_pvoid != nullptr;
    }

    template <typename T>
    [[nodiscard]] bool has_type() const noexcept
    {
        return m_ti == std::type_index{typeid(std::decay_t<T>)};
    }

    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Access the stored value.
     * @throws EngineError with `PayloadEmpty` if empty, or `PayloadType` on
     *         type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T& as() const
    {
        if (!m_pvoid)
        {
            throw EngineError(EngineErrorCode::PayloadEmpty, "Payload is empty");
        }
        if (!has_type<T>())
        {
            throw EngineError(EngineErrorCode::PayloadType,
                              std::string("Payload type mismatch: stored ") + m_ti.name() +
                                  ", requested " + typeid(T).name());
        }
        return *static_cast<const T*>(m_pvoid.get());
    }

    /**
     * @brief Access the stored value if it has type T.
     * @return Pointer to the value, or nullptr if empty or type mismatch.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept
    {
        if (!m_pvoid || !has_type<T>())
        {
            return nullptr;
        }
        return static_cast<const T*>(m_pvoid.get());
    }

private:
    std::shared_ptr<const void> m_pvoid{};
    std::type_index m_ti{typeid(void)};
};

} // namespace actiondag
