#pragma once
#include <openssl/evp.h>
#include <array>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "crypto/utils.hpp"

namespace crypto
{

using digest_t = std::array<uint8_t, 32>;

[[nodiscard]] std::optional<digest_t> sha256(std::span<const uint8_t> data);
[[nodiscard]] std::optional<digest_t> hmac_sha256(std::span<const uint8_t> key, std::span<const uint8_t> data);

// HKDF-SHA256 (extract + expand) into `out`; false on failure.
[[nodiscard]] bool hkdf_sha256(
    std::span<const uint8_t> ikm,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info,
    std::span<uint8_t> out
);

/**
 * Running SHA-256 over the handshake transcript. peek() returns the digest of
 * everything absorbed so far without closing the hash.
 */
class TranscriptHash
{
public:
    TranscriptHash();

    TranscriptHash(const TranscriptHash&) = delete;
    TranscriptHash& operator=(const TranscriptHash&) = delete;
    TranscriptHash(TranscriptHash&&) noexcept = default;
    TranscriptHash& operator=(TranscriptHash&&) noexcept = default;

    [[nodiscard]] bool absorb(std::span<const uint8_t> message);
    [[nodiscard]] std::optional<digest_t> peek() const;
    [[nodiscard]] bool ok() const { return ctx && healthy; }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
    bool healthy = false;
};

} // namespace crypto
