#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

#include "crypto/utils.hpp"

namespace crypto
{

// Argon2id (libsodium crypto_pwhash) stretching of an operator passphrase into an AEAD key.
class PassphraseKdf
{
public:
    static constexpr size_t salt_len = 16;
    static constexpr size_t key_len = 32;

    using salt_t = std::array<uint8_t, salt_len>;

    [[nodiscard]] static std::expected<SecretBytes, std::string> derive(
        std::string_view passphrase,
        std::span<const uint8_t> salt
    );

    [[nodiscard]] static std::expected<salt_t, std::string> make_salt();

private:
    static constexpr unsigned long long ops_limit = 3;
    static constexpr size_t mem_limit = 64 * 1024 * 1024;
};

} // namespace crypto
