#include "crypto/signer.hpp"

#include <stdexcept>
#include <format>

namespace crypto
{

Signer::Signer(std::string_view alg)
    : alg_name(alg)
    , sig(OQS_SIG_new(alg_name.c_str()), OQS_SIG_free)
{
    if (!sig)
    {
        throw std::runtime_error(std::format("Signature scheme {} not available", alg_name));
    }
}

bool Signer::is_available(std::string_view alg)
{
    return OQS_SIG_alg_is_enabled(std::string(alg).c_str()) == 1;
}

std::optional<Signer::keypair_t> Signer::generate_keypair() const
{
    keypair_t kp;
    kp.public_key.resize(public_key_size());
    kp.secret_key = SecretBytes(secret_key_size());

    if (OQS_SIG_keypair(sig.get(), kp.public_key.data(), kp.secret_key.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }
    return kp;
}

std::optional<Signer::signature_t> Signer::sign(
    std::span<const uint8_t> message,
    std::span<const uint8_t> secret_key) const
{
    if (secret_key.size() != secret_key_size())
    {
        return std::nullopt;
    }

    signature_t out(max_signature_size());
    size_t out_len = 0;
    if (OQS_SIG_sign(
            sig.get(),
            out.data(),
            std::addressof(out_len),
            message.data(),
            message.size(),
            secret_key.data()) != OQS_SUCCESS)
    {
        return std::nullopt;
    }
    out.resize(out_len);
    return out;
}

bool Signer::verify(
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature,
    std::span<const uint8_t> public_key) const
{
    if (public_key.size() != public_key_size() || signature.size() > max_signature_size())
    {
        return false;
    }

    return OQS_SIG_verify(
        sig.get(),
        message.data(),
        message.size(),
        signature.data(),
        signature.size(),
        public_key.data()) == OQS_SUCCESS;
}

} // namespace crypto
