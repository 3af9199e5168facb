#include "crypto/x25519.hpp"

#include <sodium.h>

namespace crypto
{

std::optional<X25519::keypair_t> X25519::generate_keypair()
{
    static_assert(key_sz == crypto_scalarmult_BYTES && key_sz == crypto_scalarmult_SCALARBYTES);

    if (sodium_init() < 0)
    {
        return std::nullopt;
    }

    keypair_t kp;
    kp.secret_key = SecretBytes(key_sz);
    kp.public_key.resize(key_sz);
    randombytes_buf(kp.secret_key.data(), kp.secret_key.size());
    if (crypto_scalarmult_base(kp.public_key.data(), kp.secret_key.data()) != 0)
    {
        return std::nullopt;
    }
    return kp;
}

std::optional<SecretBytes> X25519::exchange(
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> peer_public_key)
{
    if (secret_key.size() != key_sz || peer_public_key.size() != key_sz || sodium_init() < 0)
    {
        return std::nullopt;
    }

    SecretBytes shared(key_sz);
    // Fails for peer keys that would yield an all-zero secret.
    if (crypto_scalarmult(shared.data(), secret_key.data(), peer_public_key.data()) != 0)
    {
        return std::nullopt;
    }
    return shared;
}

} // namespace crypto
