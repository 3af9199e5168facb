#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "crypto/aesgcm256.hpp"
#include "session/session_record.hpp"

namespace session
{

/**
 * AES-256-GCM record protection for an established session.
 *
 * Frame: seq (u64 BE) | ciphertext | tag. The nonce is the direction's write
 * IV XOR the sequence number, and the sequence number is also authenticated
 * as associated data. Incoming frames must carry strictly increasing sequence
 * numbers.
 */
class SessionCipher
{
public:
    enum class Role { Client, Server };

    SessionCipher(const SessionKeys& keys, Role role);
    ~SessionCipher();

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    [[nodiscard]] std::optional<std::vector<uint8_t>> seal(std::span<const uint8_t> plaintext,
                                                           std::span<const uint8_t> aad = {});
    [[nodiscard]] std::optional<std::vector<uint8_t>> open(std::span<const uint8_t> frame,
                                                           std::span<const uint8_t> aad = {});

    void clear();

private:
    using key_t = std::array<uint8_t, SessionKeys::key_sz>;
    using iv_t = std::array<uint8_t, SessionKeys::iv_sz>;

    key_t send_key{};
    iv_t send_iv{};
    key_t recv_key{};
    iv_t recv_iv{};
    bool ready = false;

    std::atomic<uint64_t> send_seq{0};
    std::atomic<uint64_t> recv_next{0};

    [[nodiscard]] static crypto::AES256GCM::nonce_t make_nonce(const iv_t& iv, uint64_t seq);
};

} // namespace session
