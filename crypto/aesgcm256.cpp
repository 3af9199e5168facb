#include "crypto/aesgcm256.hpp"
#include "crypto/utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>

namespace crypto
{

namespace
{

using cipher_ctx_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

cipher_ctx_ptr make_ctx()
{
    return cipher_ctx_ptr(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
}

} // namespace

bool AES256GCM::chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce)
{
    return key.size() == key_sz && nonce.size() == nonce_sz;
}

std::optional<AES256GCM::data_t> AES256GCM::seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce))
    {
        return std::nullopt;
    }

    auto ctx = make_ctx();
    if (!ctx
        || EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()
        && EVP_EncryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    data_t out(plaintext.size() + tag_sz);
    len = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), std::addressof(len), plaintext.data(), static_cast<int>(plaintext.size())) != 1)
    {
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, std::addressof(final_len)) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(tag_sz), out.data() + plaintext.size()) != 1)
    {
        return std::nullopt;
    }
    return out;
}

std::optional<AES256GCM::data_t> AES256GCM::open(
    std::span<const uint8_t> key,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> sealed,
    std::span<const uint8_t> aad)
{
    if (!chk_sz(key, nonce) || sealed.size() < tag_sz)
    {
        return std::nullopt;
    }

    auto body = sealed.first(sealed.size() - tag_sz);
    tag_t tag{};
    std::ranges::copy(sealed.last(tag_sz), tag.begin());

    auto ctx = make_ctx();
    if (!ctx
        || EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1)
    {
        return std::nullopt;
    }

    int len = 0;
    if (!aad.empty()
        && EVP_DecryptUpdate(ctx.get(), nullptr, std::addressof(len), aad.data(), static_cast<int>(aad.size())) != 1)
    {
        return std::nullopt;
    }

    data_t plaintext(body.size());
    len = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), std::addressof(len), body.data(), static_cast<int>(body.size())) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + len, std::addressof(final_len)) != 1)
    {
        secure_clear(plaintext);
        return std::nullopt;
    }
    return plaintext;
}

} // namespace crypto
