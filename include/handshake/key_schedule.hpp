#pragma once

#include <array>
#include <optional>
#include <span>

#include "crypto/kdf.hpp"
#include "handshake/messages.hpp"
#include "session/session_record.hpp"

namespace handshake
{

/**
 * Everything derived from one KEM shared secret, optionally hybridized with
 * an X25519 secret. HKDF-SHA256 over ikm = kem_secret || classical_secret,
 * salt = client_nonce || server_nonce and a distinct info label per output.
 */
struct KeyBlock
{
    session::SessionKeys keys;
    std::array<uint8_t, 32> finished_key{};

    KeyBlock() = default;
    KeyBlock(const KeyBlock&) = default;
    KeyBlock& operator=(const KeyBlock&) = default;
    ~KeyBlock() { wipe(); }

    void wipe()
    {
        keys.wipe();
        crypto::secure_clear(finished_key);
    }
};

[[nodiscard]] std::optional<KeyBlock> derive_key_block(
    std::span<const uint8_t> shared_secret,
    const nonce_t& client_nonce,
    const nonce_t& server_nonce,
    std::span<const uint8_t> classical_secret = {}
);

[[nodiscard]] std::optional<crypto::digest_t> server_verify_data(const KeyBlock& kb, const crypto::digest_t& transcript);
[[nodiscard]] std::optional<crypto::digest_t> client_verify_data(const KeyBlock& kb, const crypto::digest_t& transcript);

// Bytes covered by the server's signature.
[[nodiscard]] bytes::buffer_t signature_input(const crypto::digest_t& transcript);

} // namespace handshake
