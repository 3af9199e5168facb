#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "fundamentals/clock.hpp"
#include "keys/algorithms.hpp"
#include "keys/key_backup.hpp"
#include "keys/key_pair.hpp"
#include "keys/key_provider.hpp"

namespace keys
{

struct KeyManagerOptions
{
    // How long a rotated-out key keeps validating.
    std::chrono::seconds grace_period{30};
    std::chrono::seconds rotation_interval{std::chrono::days(180)};
};

/**
 * Owner of the server's long-lived KEM and signature key pairs.
 *
 * One slot per algorithm, each holding the current version and at most one
 * retired version that stays usable for the grace period. Handshakes take a
 * snapshot of the current KeyPair and later ask the manager to decapsulate or
 * sign with it; the manager checks the snapshot is still current or in grace.
 *
 * Readers share a lock; generation, rotation, restore and pruning take it
 * exclusively only to publish. Provider calls run without the lock held.
 */
class KeyManager
{
public:
    using Options = KeyManagerOptions;

    KeyManager(std::unique_ptr<KeyProvider> provider, const Clock& clock, Options opts = {});
    ~KeyManager();

    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;

    [[nodiscard]] Result<PublicKeyInfo> generate_kem_keypair(std::string_view alg, std::string_view performed_by = "operator");
    [[nodiscard]] Result<PublicKeyInfo> generate_sig_keypair(std::string_view alg, std::string_view performed_by = "operator");

    // Rotates every slot of the kind. Either all slots rotate or none do.
    [[nodiscard]] Result<std::vector<PublicKeyInfo>> rotate_kem_key(std::string_view cause = "manual rotation",
                                                                    std::string_view performed_by = "operator");
    [[nodiscard]] Result<std::vector<PublicKeyInfo>> rotate_sig_key(std::string_view cause = "manual rotation",
                                                                    std::string_view performed_by = "operator");

    [[nodiscard]] Result<std::vector<uint8_t>> backup_keys(std::string_view passphrase,
                                                           std::string_view performed_by = "operator");
    [[nodiscard]] Result<void> restore_keys(std::string_view passphrase,
                                            std::span<const uint8_t> blob,
                                            std::string_view performed_by = "operator");

    [[nodiscard]] PublicKeyBundle export_public_keys() const;
    [[nodiscard]] std::vector<RotationAuditEntry> get_rotation_audit_log() const;

    // Algorithms that currently have an active key, i.e. the server-supported set.
    [[nodiscard]] std::vector<std::string> supported_algorithms(KeyKind kind) const;
    [[nodiscard]] bool has_active_keys() const;

    [[nodiscard]] std::shared_ptr<const KeyPair> current_key(KeyKind kind, std::string_view alg) const;
    [[nodiscard]] bool is_usable(const KeyPair& key) const;

    [[nodiscard]] Result<crypto::SecretBytes> decapsulate(const KeyPair& key, std::span<const uint8_t> ciphertext) const;
    [[nodiscard]] Result<std::vector<uint8_t>> sign(const KeyPair& key, std::span<const uint8_t> message) const;

    // Rotates slots older than the rotation interval; returns how many rotated.
    size_t rotate_if_due();
    // Discards and zeroes retired versions whose grace period elapsed.
    size_t prune_retired();

    [[nodiscard]] std::chrono::seconds grace_period() const { return opts.grace_period; }
    [[nodiscard]] std::chrono::seconds rotation_interval() const { return opts.rotation_interval; }
    [[nodiscard]] std::string_view provider_name() const { return provider->name(); }

private:
    struct Slot
    {
        std::shared_ptr<KeyPair> current;
        std::shared_ptr<KeyPair> previous;
        time_point retired_at;
    };

    using slot_map = std::map<std::string, Slot, std::less<>>;

    std::unique_ptr<KeyProvider> provider;
    const Clock& clock;
    Options opts;

    mutable std::shared_mutex mtx;
    slot_map kem_slots;
    slot_map sig_slots;

    mutable std::mutex audit_mtx;
    std::vector<RotationAuditEntry> audit_log;

    [[nodiscard]] slot_map& slots(KeyKind kind) { return kind == KeyKind::Kem ? kem_slots : sig_slots; }
    [[nodiscard]] const slot_map& slots(KeyKind kind) const { return kind == KeyKind::Kem ? kem_slots : sig_slots; }

    [[nodiscard]] Result<PublicKeyInfo> generate(KeyKind kind, std::string_view alg, std::string_view performed_by);
    [[nodiscard]] Result<std::vector<PublicKeyInfo>> rotate(KeyKind kind,
                                                            std::function<bool(const Slot&)> select,
                                                            std::string_view cause,
                                                            std::string_view performed_by);

    [[nodiscard]] bool in_grace(const Slot& slot, time_point now) const;
    [[nodiscard]] Result<crypto::SecretBytes> checkout_secret(const KeyPair& key) const;

    std::shared_ptr<KeyPair> install(Slot& slot, KeyKind kind, std::string_view alg,
                                     GeneratedKey&& fresh, std::string key_id, time_point now);
    void append_audit(RotationAuditEntry entry);

    static void discard(std::shared_ptr<KeyPair>& key);
    static void discard_all(slot_map& map);
};

} // namespace keys
