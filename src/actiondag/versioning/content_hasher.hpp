/**
 * @file content_hasher.hpp
 * @brief Incremental SHA-256 hashing of version inputs.
 */
#pragma once
#include "actiondag/common/common.hpp"

namespace actiondag
{

/**
 * @brief Incremental SHA-256 hasher backed by OpenSSL's EVP interface.
 *
 * @details
 * Inputs are added as tagged, length-prefixed fields so that the boundaries
 * between fields are part of the digest: ("ab", "c") and ("a", "bc") hash
 * differently.
 *
 * @par Thread Safety
 * - Not thread-safe; use one instance per thread.
 */
class ContentHasher
{
public:
    /**
     * @throws EngineError with `InternalError` if the digest context cannot
     *         be initialized.
     */
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    /**
     * @brief Add one tagged field.
     */
    void add_field(std::string_view tag, std::string_view value);

    /**
     * @brief Finish hashing and return the digest as lower-case hex.
     * @post The hasher must not be used again.
     */
    std::string hex_digest();

private:
    void update(const void* data, size_t size);

    struct Context;
    std::unique_ptr<Context> m_context;
    bool m_finished{false};
};

} // namespace actiondag
