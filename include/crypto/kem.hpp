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

/**
 * Key-encapsulation mechanism backed by liboqs, selected by its liboqs name
 * ("ML-KEM-768", "Kyber768", ...). Sizes come from the liboqs descriptor.
 */
class Kem
{
public:
    using key_t = std::vector<uint8_t>;

    struct keypair_t
    {
        key_t public_key;
        SecretBytes secret_key;
    };

    struct encaps_result_t
    {
        SecretBytes shared_secret;
        key_t ciphertext;
    };

    // Throws std::runtime_error if liboqs was built without the algorithm.
    explicit Kem(std::string_view alg);
    ~Kem() = default;

    Kem(const Kem&) = delete;
    Kem& operator=(const Kem&) = delete;
    Kem(Kem&&) noexcept = default;
    Kem& operator=(Kem&&) noexcept = default;

    [[nodiscard]] static bool is_available(std::string_view alg);

    [[nodiscard]] std::optional<keypair_t> generate_keypair() const;
    [[nodiscard]] std::optional<encaps_result_t> encapsulate(std::span<const uint8_t> remote_pk) const;
    [[nodiscard]] std::optional<SecretBytes> decapsulate(
        std::span<const uint8_t> ciphertext,
        std::span<const uint8_t> secret_key
    ) const;

    [[nodiscard]] const std::string& name() const { return alg_name; }
    [[nodiscard]] size_t public_key_size() const { return kem->length_public_key; }
    [[nodiscard]] size_t secret_key_size() const { return kem->length_secret_key; }
    [[nodiscard]] size_t ciphertext_size() const { return kem->length_ciphertext; }
    [[nodiscard]] size_t shared_secret_size() const { return kem->length_shared_secret; }

private:
    std::string alg_name;
    std::unique_ptr<OQS_KEM, decltype(&OQS_KEM_free)> kem;
};

} // namespace crypto
