#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/kdf.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/clock.hpp"
#include "keys/algorithms.hpp"

namespace handshake
{

inline constexpr size_t nonce_sz = 32;
using nonce_t = std::array<uint8_t, nonce_sz>;

struct ClientHello
{
    std::vector<std::string> kem_algorithms;
    std::vector<std::string> sig_algorithms;
    nonce_t client_nonce{};
    std::string client_address;
    // Ephemeral X25519 public key when the client offers a hybrid exchange.
    std::optional<std::vector<uint8_t>> x25519_share;
};

struct ServerHello
{
    std::string handshake_id;
    keys::AlgorithmSuite suite;
    std::vector<uint8_t> kem_public_key;
    uint32_t kem_key_version = 0;
    std::vector<uint8_t> sig_public_key;
    uint32_t sig_key_version = 0;
    nonce_t server_nonce{};
    time_point expires_at;
    // Present only when the client offered a share and the server accepted the hybrid exchange.
    std::optional<std::vector<uint8_t>> x25519_share;
};

struct ClientKeyExchange
{
    std::string handshake_id;
    std::vector<uint8_t> ciphertext;
    // Optional key confirmation from the client.
    std::optional<crypto::digest_t> client_verify_data;
};

struct ServerFinished
{
    std::string session_id;
    std::vector<uint8_t> signature;
    crypto::digest_t verify_data{};
    uint32_t sig_key_version = 0;
    time_point session_expires_at;
};

// Canonical transcript encodings; both peers absorb exactly these bytes.
[[nodiscard]] bytes::buffer_t encode(const ClientHello& msg);
[[nodiscard]] bytes::buffer_t encode(const ServerHello& msg);
[[nodiscard]] bytes::buffer_t encode(const ClientKeyExchange& msg);

} // namespace handshake
