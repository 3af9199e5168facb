#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "crypto/kdf.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/clock.hpp"

namespace session
{

enum class SessionState : uint8_t
{
    Active,
    Expired,
    Invalidated,
};

[[nodiscard]] constexpr std::string_view to_string(SessionState st)
{
    switch (st)
    {
        case SessionState::Active:      return "active";
        case SessionState::Expired:     return "expired";
        case SessionState::Invalidated: return "invalidated";
    }
    return "unknown";
}

// Symmetric material derived by the handshake. Zeroed when the holder goes away.
struct SessionKeys
{
    static constexpr size_t key_sz = 32;
    static constexpr size_t iv_sz = 12;

    std::array<uint8_t, key_sz> client_write_key{};
    std::array<uint8_t, key_sz> server_write_key{};
    std::array<uint8_t, iv_sz> client_write_iv{};
    std::array<uint8_t, iv_sz> server_write_iv{};

    SessionKeys() = default;
    SessionKeys(const SessionKeys&) = default;
    SessionKeys& operator=(const SessionKeys&) = default;
    ~SessionKeys() { wipe(); }

    void wipe()
    {
        crypto::secure_clear(client_write_key);
        crypto::secure_clear(server_write_key);
        crypto::secure_clear(client_write_iv);
        crypto::secure_clear(server_write_iv);
    }
};

struct SessionRecord
{
    std::string session_id;
    std::string handshake_id;
    SessionKeys keys;
    crypto::digest_t verify_data{};
    crypto::digest_t transcript_hash{};
    std::string cipher_suite;
    std::string kem_algorithm;
    std::string sig_algorithm;
    uint32_t kem_key_version = 0;
    uint32_t sig_key_version = 0;
    time_point created_at;
    time_point expires_at;
    std::string client_address;
    std::string server_address;
    SessionState state = SessionState::Active;

    [[nodiscard]] bool expired_at(time_point now) const { return now > expires_at; }
};

struct VerifyResult
{
    bool valid = false;
    // SessionNotFound, SessionExpired, SessionInvalidated or StorageBackendUnavailable when not valid.
    std::optional<ErrorCode> reason;
    std::optional<time_point> expires_at;
};

struct StoreStats
{
    std::string backend;
    bool degraded = false;
    size_t active = 0;
    size_t expired = 0;
    size_t invalidated = 0;
    uint64_t swept = 0;

    [[nodiscard]] size_t total() const { return active + expired + invalidated; }
};

} // namespace session
