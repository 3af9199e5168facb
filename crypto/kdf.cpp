#include "crypto/kdf.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

namespace crypto
{

std::optional<digest_t> sha256(std::span<const uint8_t> data)
{
    digest_t out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), std::addressof(len), EVP_sha256(), nullptr) != 1
        || len != out.size())
    {
        return std::nullopt;
    }
    return out;
}

std::optional<digest_t> hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data)
{
    digest_t out{};
    unsigned int len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              data.data(), data.size(), out.data(), std::addressof(len))
        || len != out.size())
    {
        return std::nullopt;
    }
    return out;
}

bool hkdf_sha256(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info,
    std::span<uint8_t> out)
{
    if (ikm.empty() || out.empty())
    {
        return false;
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf)
    {
        return false;
    }
    EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!kctx)
    {
        return false;
    }

    OSSL_PARAM params[5];
    int idx = 0;
    params[idx++] = OSSL_PARAM_construct_utf8_string("digest", const_cast<char*>("SHA256"), 0);
    params[idx++] = OSSL_PARAM_construct_octet_string("key", const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty())
    {
        params[idx++] = OSSL_PARAM_construct_octet_string("salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty())
    {
        params[idx++] = OSSL_PARAM_construct_octet_string("info", const_cast<uint8_t*>(info.data()), info.size());
    }
    params[idx] = OSSL_PARAM_construct_end();

    int rc = EVP_KDF_derive(kctx, out.data(), out.size(), params);
    EVP_KDF_CTX_free(kctx);
    return rc == 1;
}

TranscriptHash::TranscriptHash()
    : ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free)
{
    healthy = ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1;
}

bool TranscriptHash::absorb(std::span<const uint8_t> message)
{
    if (!ok())
    {
        return false;
    }
    healthy = EVP_DigestUpdate(ctx.get(), message.data(), message.size()) == 1;
    return healthy;
}

std::optional<digest_t> TranscriptHash::peek() const
{
    if (!ok())
    {
        return std::nullopt;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> copy(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    digest_t out{};
    unsigned int len = 0;
    if (!copy
        || EVP_MD_CTX_copy_ex(copy.get(), ctx.get()) != 1
        || EVP_DigestFinal_ex(copy.get(), out.data(), std::addressof(len)) != 1
        || len != out.size())
    {
        return std::nullopt;
    }
    return out;
}

} // namespace crypto
