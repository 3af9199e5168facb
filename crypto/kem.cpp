#include "crypto/kem.hpp"

#include <stdexcept>
#include <format>

namespace crypto
{

Kem::Kem(std::string_view alg)
    : alg_name(alg)
    , kem(OQS_KEM_new(alg_name.c_str()), OQS_KEM_free)
{
    if (!kem)
    {
        throw std::runtime_error(std::format("KEM {} not available", alg_name));
    }
}

bool Kem::is_available(std::string_view alg)
{
    return OQS_KEM_alg_is_enabled(std::string(alg).c_str()) == 1;
}

std::optional<Kem::keypair_t> Kem::generate_keypair() const
{
    keypair_t kp;
    kp.public_key.resize(public_key_size());
    kp.secret_key = SecretBytes(secret_key_size());

    if (OQS_KEM_keypair(kem.get(), kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }
    return kp;
}

std::optional<Kem::encaps_result_t> Kem::encapsulate(std::span<const uint8_t> remote_pk) const
{
    if (remote_pk.size() != public_key_size())
    {
        return std::nullopt;
    }

    encaps_result_t result;
    result.ciphertext.resize(ciphertext_size());
    result.shared_secret = SecretBytes(shared_secret_size());

    if (OQS_KEM_encaps(
            kem.get(),
            result.ciphertext.data(),
            result.shared_secret.data(),
            remote_pk.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }
    return result;
}

std::optional<SecretBytes> Kem::decapsulate(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> secret_key) const
{
    if (ciphertext.size() != ciphertext_size() || secret_key.size() != secret_key_size())
    {
        return std::nullopt;
    }

    SecretBytes shared_secret(shared_secret_size());
    if (OQS_KEM_decaps(
            kem.get(),
            shared_secret.data(),
            ciphertext.data(),
            secret_key.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }
    return shared_secret;
}

} // namespace crypto
