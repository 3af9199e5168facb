#pragma once
#include <oqs/oqs.h>
#include <memory>
#include <vector>
#include <span>
#include <string>
#include <string_view>
#include <optional>

#include "crypto/utils.hpp"

namespace crypto
{

class Signer
{
public:
    using key_t = std::vector<uint8_t>;
    using signature_t = std::vector<uint8_t>;

    struct keypair_t
    {
        key_t public_key;
        SecretBytes secret_key;
    };

    explicit Signer(std::string_view alg);
    ~Signer() = default;

    Signer(const Signer&) = delete;
    Signer& operator=(const Signer&) = delete;
    Signer(Signer&&) noexcept = default;
    Signer& operator=(Signer&&) noexcept = default;

    [[nodiscard]] static bool is_available(std::string_view alg);

    [[nodiscard]] std::optional<keypair_t> generate_keypair() const;
    [[nodiscard]] std::optional<signature_t> sign(
        std::span<const uint8_t> message,
        std::span<const uint8_t> secret_key
    ) const;
    [[nodiscard]] bool verify(
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature,
        std::span<const uint8_t> public_key
    ) const;

    [[nodiscard]] const std::string& name() const { return alg_name; }
    [[nodiscard]] size_t public_key_size() const { return sig->length_public_key; }
    [[nodiscard]] size_t secret_key_size() const { return sig->length_secret_key; }
    [[nodiscard]] size_t max_signature_size() const { return sig->length_signature; }

private:
    std::string alg_name;
    std::unique_ptr<OQS_SIG, decltype(&OQS_SIG_free)> sig;
};

} // namespace crypto
