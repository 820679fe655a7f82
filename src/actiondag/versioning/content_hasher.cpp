#include "actiondag/versioning/content_hasher.hpp"
#include "actiondag/common/engine_errors.hpp"

#include <openssl/evp.h>

namespace actiondag
{

struct ContentHasher::Context
{
    EVP_MD_CTX* ctx{nullptr};

    ~Context()
    {
        if (ctx)
        {
            EVP_MD_CTX_free(ctx);
        }
    }
};

ContentHasher::ContentHasher()
    : m_context{std::make_unique<Context>()}
{
    m_context->ctx = EVP_MD_CTX_new();
    if (!m_context->ctx)
    {
        throw EngineError(EngineErrorCode::InternalError, "Failed to allocate SHA-256 context");
    }
    if (EVP_DigestInit_ex(m_context->ctx, EVP_sha256(), nullptr) != 1)
    {
        throw EngineError(EngineErrorCode::InternalError, "Failed to initialize SHA-256 context");
    }
}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(const void* data, size_t size)
{
    if (m_finished)
    {
        throw EngineError(EngineErrorCode::InternalError, "ContentHasher used after hex_digest()");
    }
    if (EVP_DigestUpdate(m_context->ctx, data, size) != 1)
    {
        throw EngineError(EngineErrorCode::InternalError, "SHA-256 update failed");
    }
}

void ContentHasher::add_field(std::string_view tag, std::string_view value)
{
    // tag, NUL, decimal length, NUL, value
    std::string header(tag);
    header.push_back('\0');
    header += std::to_string(value.size());
    header.push_back('\0');
    update(header.data(), header.size());
    update(value.data(), value.size());
}

std::string ContentHasher::hex_digest()
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (m_finished || EVP_DigestFinal_ex(m_context->ctx, digest, &length) != 1)
    {
        throw EngineError(EngineErrorCode::InternalError, "SHA-256 finalization failed");
    }
    m_finished = true;

    static const char* const hex = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        result.push_back(hex[digest[i] >> 4]);
        result.push_back(hex[digest[i] & 0x0f]);
    }
    return result;
}

} // namespace actiondag
