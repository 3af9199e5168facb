#include "crypto/passphrase_kdf.hpp"

#include <sodium.h>

namespace crypto
{

std::expected<SecretBytes, std::string> PassphraseKdf::derive(
    std::string_view passphrase,
    std::span<const uint8_t> salt)
{
    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }
    if (salt.size() != crypto_pwhash_SALTBYTES)
    {
        return std::unexpected("Invalid salt length");
    }
    if (passphrase.empty())
    {
        return std::unexpected("Passphrase must not be empty");
    }

    SecretBytes key(key_len);
    int result = crypto_pwhash(
        key.data(), key.size(),
        passphrase.data(), passphrase.size(),
        salt.data(),
        ops_limit,
        mem_limit,
        crypto_pwhash_ALG_ARGON2ID13
    );

    if (result != 0)
    {
        return std::unexpected("Failed to derive key from passphrase");
    }
    return key;
}

std::expected<PassphraseKdf::salt_t, std::string> PassphraseKdf::make_salt()
{
    static_assert(salt_len == crypto_pwhash_SALTBYTES);

    if (sodium_init() < 0)
    {
        return std::unexpected("Failed to initialize libsodium");
    }
    salt_t salt{};
    randombytes_buf(salt.data(), salt.size());
    return salt;
}

} // namespace crypto
