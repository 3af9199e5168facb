#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/utils.hpp"
#include "fundamentals/clock.hpp"
#include "keys/algorithms.hpp"

namespace keys
{

class KeyManager;

/**
 * Long-lived asymmetric key pair. The secret half is reachable only from
 * KeyManager; everything else in the process sees public metadata.
 */
class KeyPair
{
public:
    KeyPair(KeyKind kind,
            std::string algorithm,
            std::vector<uint8_t> public_key,
            crypto::SecretBytes secret_key,
            uint32_t version,
            time_point created_at,
            std::string key_id,
            std::string parent_key_id = {});

    KeyPair(const KeyPair&) = delete;
    KeyPair& operator=(const KeyPair&) = delete;

    [[nodiscard]] KeyKind kind() const { return kind_; }
    [[nodiscard]] const std::string& algorithm() const { return algorithm_; }
    [[nodiscard]] const std::vector<uint8_t>& public_key() const { return public_key_; }
    [[nodiscard]] uint32_t version() const { return version_; }
    [[nodiscard]] time_point created_at() const { return created_at_; }
    [[nodiscard]] const std::string& key_id() const { return key_id_; }
    [[nodiscard]] const std::string& parent_key_id() const { return parent_key_id_; }

private:
    friend class KeyManager;

    KeyKind kind_;
    std::string algorithm_;
    std::vector<uint8_t> public_key_;
    crypto::SecretBytes secret_key_;
    uint32_t version_;
    time_point created_at_;
    std::string key_id_;
    std::string parent_key_id_;
};

struct PublicKeyInfo
{
    KeyKind kind;
    std::string algorithm;
    std::vector<uint8_t> public_key;
    uint32_t version = 0;
    std::string key_id;
    time_point created_at;
};

struct PublicKeyBundle
{
    std::vector<PublicKeyInfo> kem;
    std::vector<PublicKeyInfo> sig;
};

[[nodiscard]] PublicKeyInfo describe(const KeyPair& kp);

enum class AuditAction : uint8_t
{
    Generate,
    Rotate,
    Backup,
    Restore,
};

[[nodiscard]] constexpr std::string_view to_string(AuditAction action)
{
    switch (action)
    {
        case AuditAction::Generate: return "generate";
        case AuditAction::Rotate:   return "rotate";
        case AuditAction::Backup:   return "backup";
        case AuditAction::Restore:  return "restore";
    }
    return "unknown";
}

// Append-only record. Backup/restore entries carry no kind or versions.
struct RotationAuditEntry
{
    time_point timestamp;
    AuditAction action;
    std::optional<KeyKind> kind;
    std::string algorithm;
    uint32_t old_version = 0;
    uint32_t new_version = 0;
    std::string old_key_id;
    std::string new_key_id;
    std::string cause;
    std::string performed_by;
};

} // namespace keys
