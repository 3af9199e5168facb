#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/clock.hpp"
#include "keys/algorithms.hpp"

namespace keys
{

// Plaintext view of one key pair as it travels through a backup.
struct BackupEntry
{
    KeyKind kind;
    std::string algorithm;
    std::vector<uint8_t> public_key;
    crypto::SecretBytes secret_key;
    uint32_t version = 0;
    time_point created_at;
    std::string key_id;
    std::string parent_key_id;
    std::optional<time_point> retired_at;
};

/**
 * Passphrase-protected key backup blob.
 *
 *   "PQGB" | format u8 | salt[16] | check[32] | nonce[12] | ciphertext || tag
 *
 * The key is Argon2id(passphrase, salt). `check` is an HMAC of a fixed label
 * under that key, so a wrong passphrase is told apart from a damaged blob.
 * The header up to the nonce is bound into the AEAD as associated data.
 */
class KeyBackup
{
public:
    static constexpr std::array<uint8_t, 4> magic{'P', 'Q', 'G', 'B'};
    static constexpr uint8_t format_version = 1;

    [[nodiscard]] static Result<std::vector<uint8_t>> seal(
        std::span<const BackupEntry> entries,
        std::string_view passphrase,
        time_point created_at
    );

    // InvalidPassphrase on check mismatch; CorruptBackup on anything malformed.
    [[nodiscard]] static Result<std::vector<BackupEntry>> open(
        std::span<const uint8_t> blob,
        std::string_view passphrase
    );
};

} // namespace keys
