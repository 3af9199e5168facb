#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "crypto/utils.hpp"
#include "keys/algorithms.hpp"

namespace keys
{

struct GeneratedKey
{
    std::vector<uint8_t> public_key;
    crypto::SecretBytes secret_key;
};

/**
 * Backing implementation for private-key operations. For the software
 * provider `secret_key` is the raw liboqs secret key; a hardware provider
 * returns an opaque handle in its place and resolves it internally.
 */
class KeyProvider
{
public:
    virtual ~KeyProvider() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    [[nodiscard]] virtual bool supports(KeyKind kind, std::string_view alg) const = 0;

    [[nodiscard]] virtual Result<GeneratedKey> generate(KeyKind kind, std::string_view alg) = 0;

    // Whether restored key material has the shape this provider produces for `alg`.
    [[nodiscard]] virtual bool accepts(KeyKind kind, std::string_view alg,
                                       std::span<const uint8_t> public_key,
                                       std::span<const uint8_t> secret_key) const = 0;

    [[nodiscard]] virtual Result<crypto::SecretBytes> decapsulate(
        std::string_view alg,
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> ciphertext
    ) = 0;

    [[nodiscard]] virtual Result<std::vector<uint8_t>> sign(
        std::string_view alg,
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message
    ) = 0;
};

class SoftwareKeyProvider final : public KeyProvider
{
public:
    [[nodiscard]] std::string_view name() const override { return "software"; }
    [[nodiscard]] bool supports(KeyKind kind, std::string_view alg) const override;

    [[nodiscard]] Result<GeneratedKey> generate(KeyKind kind, std::string_view alg) override;
    [[nodiscard]] bool accepts(KeyKind kind, std::string_view alg,
                               std::span<const uint8_t> public_key,
                               std::span<const uint8_t> secret_key) const override;

    [[nodiscard]] Result<crypto::SecretBytes> decapsulate(
        std::string_view alg,
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> ciphertext
    ) override;

    [[nodiscard]] Result<std::vector<uint8_t>> sign(
        std::string_view alg,
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> message
    ) override;
};

// "software" only; "hsm" is rejected because no hardware driver is linked in.
[[nodiscard]] std::expected<std::unique_ptr<KeyProvider>, std::string> make_key_provider(std::string_view name);

} // namespace keys
