#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "crypto/utils.hpp"

namespace crypto
{

// Ephemeral X25519 (libsodium crypto_scalarmult) for the classical half of a hybrid exchange.
class X25519
{
public:
    static constexpr size_t key_sz = 32;

    using key_t = std::vector<uint8_t>;

    struct keypair_t
    {
        key_t public_key;
        SecretBytes secret_key;
    };

    [[nodiscard]] static std::optional<keypair_t> generate_keypair();

    // nullopt on a wrong-sized or low-order peer key.
    [[nodiscard]] static std::optional<SecretBytes> exchange(
        std::span<const uint8_t> secret_key,
        std::span<const uint8_t> peer_public_key
    );
};

} // namespace crypto
