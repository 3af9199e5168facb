#include "keys/key_provider.hpp"
#include "crypto/kem.hpp"
#include "crypto/signer.hpp"

#include <format>

namespace keys
{

bool SoftwareKeyProvider::supports(KeyKind kind, std::string_view alg) const
{
    return kind == KeyKind::Kem ? crypto::Kem::is_available(alg) : crypto::Signer::is_available(alg);
}

Result<GeneratedKey> SoftwareKeyProvider::generate(KeyKind kind, std::string_view alg)
{
    if (!supports(kind, alg))
    {
        return fail(ErrorCode::UnsupportedAlgorithm, std::format("{} not available in liboqs", alg));
    }

    if (kind == KeyKind::Kem)
    {
        auto kp = crypto::Kem(alg).generate_keypair();
        if (!kp)
        {
            return fail(ErrorCode::KeyGenerationFailed, std::format("{} keypair generation failed", alg));
        }
        return GeneratedKey{std::move(kp->public_key), std::move(kp->secret_key)};
    }

    auto kp = crypto::Signer(alg).generate_keypair();
    if (!kp)
    {
        return fail(ErrorCode::KeyGenerationFailed, std::format("{} keypair generation failed", alg));
    }
    return GeneratedKey{std::move(kp->public_key), std::move(kp->secret_key)};
}

bool SoftwareKeyProvider::accepts(KeyKind kind, std::string_view alg,
                                  std::span<const uint8_t> public_key,
                                  std::span<const uint8_t> secret_key) const
{
    if (!supports(kind, alg))
    {
        return false;
    }
    if (kind == KeyKind::Kem)
    {
        crypto::Kem kem(alg);
        return public_key.size() == kem.public_key_size() && secret_key.size() == kem.secret_key_size();
    }
    crypto::Signer signer(alg);
    return public_key.size() == signer.public_key_size() && secret_key.size() == signer.secret_key_size();
}

Result<crypto::SecretBytes> SoftwareKeyProvider::decapsulate(
    std::string_view alg,
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> ciphertext)
{
    if (!supports(KeyKind::Kem, alg))
    {
        return fail(ErrorCode::UnsupportedAlgorithm, std::string(alg));
    }

    crypto::Kem kem(alg);
    if (ciphertext.size() != kem.ciphertext_size())
    {
        return fail(ErrorCode::DecapsulationFailed,
                    std::format("ciphertext is {} bytes, {} expects {}", ciphertext.size(), alg, kem.ciphertext_size()));
    }

    auto ss = kem.decapsulate(ciphertext, secret_key);
    if (!ss)
    {
        return fail(ErrorCode::DecapsulationFailed, std::format("{} decapsulation failed", alg));
    }
    return std::move(*ss);
}

Result<std::vector<uint8_t>> SoftwareKeyProvider::sign(
    std::string_view alg,
    std::span<const uint8_t> secret_key,
    std::span<const uint8_t> message)
{
    if (!supports(KeyKind::Signature, alg))
    {
        return fail(ErrorCode::UnsupportedAlgorithm, std::string(alg));
    }

    auto sig = crypto::Signer(alg).sign(message, secret_key);
    if (!sig)
    {
        return fail(ErrorCode::CryptoFailure, std::format("{} signing failed", alg));
    }
    return std::move(*sig);
}

std::expected<std::unique_ptr<KeyProvider>, std::string> make_key_provider(std::string_view name)
{
    if (name == "software")
    {
        return std::make_unique<SoftwareKeyProvider>();
    }
    if (name == "hsm")
    {
        return std::unexpected("Key provider 'hsm' requested but no HSM driver is linked into this build");
    }
    return std::unexpected(std::format("Unknown key provider '{}'", name));
}

} // namespace keys
