#pragma once
#include <openssl/evp.h>
#include <vector>
#include <array>
#include <span>
#include <optional>

namespace crypto
{

class AES256GCM
{
public:
    static constexpr size_t key_sz = 32;
    static constexpr size_t nonce_sz = 12;
    static constexpr size_t tag_sz = 16;

    using key_t = std::array<uint8_t, key_sz>;
    using nonce_t = std::array<uint8_t, nonce_sz>;
    using tag_t = std::array<uint8_t, tag_sz>;
    using data_t = std::vector<uint8_t>;

    // Output is ciphertext || tag.
    [[nodiscard]] static std::optional<data_t> seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> aad = {}
    );

    // Input is ciphertext || tag; nullopt on any authentication failure.
    [[nodiscard]] static std::optional<data_t> open(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> sealed,
        std::span<const uint8_t> aad = {}
    );

private:
    static bool chk_sz(std::span<const uint8_t> key, std::span<const uint8_t> nonce);
};

} // namespace crypto
