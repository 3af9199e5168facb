#include "keys/key_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <utility>

namespace keys
{

KeyManager::KeyManager(std::unique_ptr<KeyProvider> key_provider, const Clock& clk, Options options)
    : provider(std::move(key_provider))
    , clock(clk)
    , opts(options)
{
}

KeyManager::~KeyManager()
{
    std::unique_lock lock(mtx);
    discard_all(kem_slots);
    discard_all(sig_slots);
}

Result<PublicKeyInfo> KeyManager::generate_kem_keypair(std::string_view alg, std::string_view performed_by)
{
    return generate(KeyKind::Kem, alg, performed_by);
}

Result<PublicKeyInfo> KeyManager::generate_sig_keypair(std::string_view alg, std::string_view performed_by)
{
    return generate(KeyKind::Signature, alg, performed_by);
}

Result<PublicKeyInfo> KeyManager::generate(KeyKind kind, std::string_view alg, std::string_view performed_by)
{
    if (!find_algorithm(alg, kind) || !provider->supports(kind, alg))
    {
        return fail(ErrorCode::UnsupportedAlgorithm,
                    std::format("{} algorithm '{}' is not supported", to_string(kind), alg));
    }

    auto fresh = provider->generate(kind, alg);
    if (!fresh)
    {
        return std::unexpected(fresh.error());
    }
    auto key_id = crypto::random_id(to_string(kind), 8);
    if (!key_id)
    {
        return fail(ErrorCode::KeyGenerationFailed, "failed to allocate key id");
    }

    std::unique_lock lock(mtx);
    auto now = clock.now();
    auto& slot = slots(kind)[std::string(alg)];
    uint32_t old_version = slot.current ? slot.current->version() : 0;
    auto installed = install(slot, kind, alg, std::move(*fresh), std::move(*key_id), now);

    append_audit(RotationAuditEntry{
        .timestamp = now,
        .action = AuditAction::Generate,
        .kind = kind,
        .algorithm = std::string(alg),
        .old_version = old_version,
        .new_version = installed->version(),
        .old_key_id = installed->parent_key_id(),
        .new_key_id = installed->key_id(),
        .cause = "key generation",
        .performed_by = std::string(performed_by),
    });
    LOG_AUDIT("Generated {} key {} ({}) version {} by {}",
              to_string(kind), installed->key_id(), alg, installed->version(), performed_by);
    return describe(*installed);
}

Result<std::vector<PublicKeyInfo>> KeyManager::rotate_kem_key(std::string_view cause, std::string_view performed_by)
{
    return rotate(KeyKind::Kem, [](const Slot&) { return true; }, cause, performed_by);
}

Result<std::vector<PublicKeyInfo>> KeyManager::rotate_sig_key(std::string_view cause, std::string_view performed_by)
{
    return rotate(KeyKind::Signature, [](const Slot&) { return true; }, cause, performed_by);
}

Result<std::vector<PublicKeyInfo>> KeyManager::rotate(
    KeyKind kind,
    std::function<bool(const Slot&)> select,
    std::string_view cause,
    std::string_view performed_by)
{
    // Each target remembers the version it saw so a concurrent rotation is detected at publish time.
    std::vector<std::pair<std::string, std::shared_ptr<KeyPair>>> targets;
    {
        std::shared_lock lock(mtx);
        for (const auto& [alg, slot] : slots(kind))
        {
            if (slot.current && select(slot))
            {
                targets.emplace_back(alg, slot.current);
            }
        }
    }
    if (targets.empty())
    {
        return fail(ErrorCode::NoActiveKey, std::format("no {} keys to rotate", to_string(kind)));
    }

    // Generate everything before touching state so a failure leaves all slots as they were.
    std::vector<std::pair<GeneratedKey, std::string>> fresh;
    fresh.reserve(targets.size());
    for (const auto& [alg, seen] : targets)
    {
        auto gen = provider->generate(kind, alg);
        if (!gen)
        {
            LOG_ERROR("Rotation of {} key {} aborted: {}", to_string(kind), alg, gen.error());
            return fail(ErrorCode::KeyGenerationFailed, std::format("{}: {}", alg, gen.error().detail));
        }
        auto key_id = crypto::random_id(to_string(kind), 8);
        if (!key_id)
        {
            return fail(ErrorCode::KeyGenerationFailed, "failed to allocate key id");
        }
        fresh.emplace_back(std::move(*gen), std::move(*key_id));
    }

    std::vector<PublicKeyInfo> rotated;
    rotated.reserve(targets.size());

    std::unique_lock lock(mtx);
    auto now = clock.now();
    for (size_t i = 0; i < targets.size(); ++i)
    {
        const auto& [alg, seen] = targets[i];
        auto it = slots(kind).find(alg);
        if (it == slots(kind).end() || it->second.current != seen || !select(it->second))
        {
            // Rotated or restored while we were generating; the fresh pair is wiped on scope exit.
            LOG_INFO("Skipping {} rotation of {}: key changed since selection", to_string(kind), alg);
            continue;
        }
        auto& slot = it->second;
        uint32_t old_version = slot.current ? slot.current->version() : 0;
        auto installed = install(slot, kind, alg, std::move(fresh[i].first), std::move(fresh[i].second), now);

        append_audit(RotationAuditEntry{
            .timestamp = now,
            .action = AuditAction::Rotate,
            .kind = kind,
            .algorithm = alg,
            .old_version = old_version,
            .new_version = installed->version(),
            .old_key_id = installed->parent_key_id(),
            .new_key_id = installed->key_id(),
            .cause = std::string(cause),
            .performed_by = std::string(performed_by),
        });
        LOG_AUDIT("Rotated {} key {} v{} -> v{} ({}) by {}: {}",
                  to_string(kind), alg, old_version, installed->version(), installed->key_id(), performed_by, cause);
        rotated.push_back(describe(*installed));
    }
    return rotated;
}

std::shared_ptr<KeyPair> KeyManager::install(
    Slot& slot,
    KeyKind kind,
    std::string_view alg,
    GeneratedKey&& fresh,
    std::string key_id,
    time_point now)
{
    uint32_t version = 1;
    std::string parent;
    if (slot.current)
    {
        version = slot.current->version() + 1;
        parent = slot.current->key_id();
    }

    // Only the immediately preceding version is retained.
    if (slot.previous)
    {
        discard(slot.previous);
    }
    if (slot.current)
    {
        slot.previous = std::move(slot.current);
        slot.retired_at = now;
    }

    slot.current = std::make_shared<KeyPair>(
        kind,
        std::string(alg),
        std::move(fresh.public_key),
        std::move(fresh.secret_key),
        version,
        now,
        std::move(key_id),
        std::move(parent));
    return slot.current;
}

Result<std::vector<uint8_t>> KeyManager::backup_keys(std::string_view passphrase, std::string_view performed_by)
{
    std::vector<BackupEntry> entries;
    {
        std::shared_lock lock(mtx);
        auto now = clock.now();
        for (const auto* map : {&kem_slots, &sig_slots})
        {
            for (const auto& [alg, slot] : *map)
            {
                auto add = [&](const KeyPair& kp, std::optional<time_point> retired)
                {
                    entries.push_back(BackupEntry{
                        .kind = kp.kind(),
                        .algorithm = kp.algorithm(),
                        .public_key = kp.public_key(),
                        .secret_key = kp.secret_key_.clone(),
                        .version = kp.version(),
                        .created_at = kp.created_at(),
                        .key_id = kp.key_id(),
                        .parent_key_id = kp.parent_key_id(),
                        .retired_at = retired,
                    });
                };
                if (slot.current)
                {
                    add(*slot.current, std::nullopt);
                }
                if (slot.previous && in_grace(slot, now))
                {
                    add(*slot.previous, slot.retired_at);
                }
            }
        }
    }

    if (entries.empty())
    {
        return fail(ErrorCode::NoActiveKey, "no keys to back up");
    }

    auto blob = KeyBackup::seal(entries, passphrase, clock.now());
    if (!blob)
    {
        LOG_ERROR("Key backup failed: {}", blob.error());
        return std::unexpected(blob.error());
    }

    append_audit(RotationAuditEntry{
        .timestamp = clock.now(),
        .action = AuditAction::Backup,
        .kind = std::nullopt,
        .algorithm = {},
        .old_version = 0,
        .new_version = 0,
        .old_key_id = {},
        .new_key_id = {},
        .cause = std::format("backup of {} key pairs", entries.size()),
        .performed_by = std::string(performed_by),
    });
    LOG_AUDIT("Backed up {} key pairs by {}", entries.size(), performed_by);
    return blob;
}

Result<void> KeyManager::restore_keys(std::string_view passphrase,
                                      std::span<const uint8_t> blob,
                                      std::string_view performed_by)
{
    auto entries = KeyBackup::open(blob, passphrase);
    if (!entries)
    {
        LOG_AUDIT("Key restore rejected: {}", entries.error());
        return std::unexpected(entries.error());
    }

    // Build the replacement key set completely before publishing it.
    slot_map new_kem;
    slot_map new_sig;
    auto now = clock.now();
    size_t restored = 0;
    for (auto& e : *entries)
    {
        if (!find_algorithm(e.algorithm, e.kind) || !provider->supports(e.kind, e.algorithm))
        {
            discard_all(new_kem);
            discard_all(new_sig);
            return fail(ErrorCode::UnsupportedAlgorithm,
                        std::format("backup holds unsupported {} algorithm '{}'", to_string(e.kind), e.algorithm));
        }

        if (!provider->accepts(e.kind, e.algorithm, e.public_key, e.secret_key.view()))
        {
            discard_all(new_kem);
            discard_all(new_sig);
            return fail(ErrorCode::CorruptBackup,
                        std::format("backup {} key {} has the wrong size for {}", to_string(e.kind), e.key_id, e.algorithm));
        }

        auto& slot = (e.kind == KeyKind::Kem ? new_kem : new_sig)[e.algorithm];
        auto& target = e.retired_at ? slot.previous : slot.current;
        if (target)
        {
            discard_all(new_kem);
            discard_all(new_sig);
            return fail(ErrorCode::CorruptBackup,
                        std::format("backup holds duplicate {} keys for {}", to_string(e.kind), e.algorithm));
        }

        target = std::make_shared<KeyPair>(
            e.kind,
            std::move(e.algorithm),
            std::move(e.public_key),
            std::move(e.secret_key),
            e.version,
            e.created_at,
            std::move(e.key_id),
            std::move(e.parent_key_id));
        if (e.retired_at)
        {
            slot.retired_at = *e.retired_at;
        }
        ++restored;
    }

    for (auto* map : {&new_kem, &new_sig})
    {
        for (auto& [alg, slot] : *map)
        {
            if (!slot.current)
            {
                discard_all(new_kem);
                discard_all(new_sig);
                return fail(ErrorCode::CorruptBackup, std::format("backup has no current key for {}", alg));
            }
            if (slot.previous && !in_grace(slot, now))
            {
                discard(slot.previous);
            }
        }
    }

    // A restore must leave the server able to negotiate.
    if (new_kem.empty() || new_sig.empty())
    {
        discard_all(new_kem);
        discard_all(new_sig);
        LOG_AUDIT("Key restore rejected: backup lacks a current {} key", new_kem.empty() ? "kem" : "sig");
        return fail(ErrorCode::CorruptBackup, "backup must hold at least one KEM and one signature key");
    }

    {
        std::unique_lock lock(mtx);
        std::swap(kem_slots, new_kem);
        std::swap(sig_slots, new_sig);
        discard_all(new_kem);
        discard_all(new_sig);

        append_audit(RotationAuditEntry{
            .timestamp = now,
            .action = AuditAction::Restore,
            .kind = std::nullopt,
            .algorithm = {},
            .old_version = 0,
            .new_version = 0,
            .old_key_id = {},
            .new_key_id = {},
            .cause = std::format("restore of {} key pairs", restored),
            .performed_by = std::string(performed_by),
        });
    }
    LOG_AUDIT("Restored {} key pairs from backup by {}", restored, performed_by);
    return {};
}

PublicKeyBundle KeyManager::export_public_keys() const
{
    PublicKeyBundle bundle;
    std::shared_lock lock(mtx);
    for (const auto& [alg, slot] : kem_slots)
    {
        if (slot.current)
        {
            bundle.kem.push_back(describe(*slot.current));
        }
    }
    for (const auto& [alg, slot] : sig_slots)
    {
        if (slot.current)
        {
            bundle.sig.push_back(describe(*slot.current));
        }
    }
    return bundle;
}

std::vector<RotationAuditEntry> KeyManager::get_rotation_audit_log() const
{
    std::lock_guard lock(audit_mtx);
    return audit_log;
}

std::vector<std::string> KeyManager::supported_algorithms(KeyKind kind) const
{
    std::vector<std::string> out;
    std::shared_lock lock(mtx);
    for (const auto& [alg, slot] : slots(kind))
    {
        if (slot.current)
        {
            out.push_back(alg);
        }
    }
    return out;
}

bool KeyManager::has_active_keys() const
{
    std::shared_lock lock(mtx);
    auto any_current = [](const slot_map& map)
    {
        return std::ranges::any_of(map, [](const auto& kv) { return kv.second.current != nullptr; });
    };
    return any_current(kem_slots) && any_current(sig_slots);
}

std::shared_ptr<const KeyPair> KeyManager::current_key(KeyKind kind, std::string_view alg) const
{
    std::shared_lock lock(mtx);
    const auto& map = slots(kind);
    auto it = map.find(alg);
    if (it == map.end())
    {
        return nullptr;
    }
    return it->second.current;
}

bool KeyManager::in_grace(const Slot& slot, time_point now) const
{
    return slot.previous && now <= slot.retired_at + opts.grace_period;
}

bool KeyManager::is_usable(const KeyPair& key) const
{
    std::shared_lock lock(mtx);
    const auto& map = slots(key.kind());
    auto it = map.find(key.algorithm());
    if (it == map.end())
    {
        return false;
    }
    const auto& slot = it->second;
    return slot.current.get() == std::addressof(key)
        || (slot.previous.get() == std::addressof(key) && in_grace(slot, clock.now()));
}

Result<crypto::SecretBytes> KeyManager::checkout_secret(const KeyPair& key) const
{
    std::shared_lock lock(mtx);
    const auto& map = slots(key.kind());
    auto it = map.find(key.algorithm());
    if (it != map.end())
    {
        const auto& slot = it->second;
        if (slot.current.get() == std::addressof(key)
            || (slot.previous.get() == std::addressof(key) && in_grace(slot, clock.now())))
        {
            return key.secret_key_.clone();
        }
    }
    return fail(key.kind() == KeyKind::Kem ? ErrorCode::DecapsulationFailed : ErrorCode::NoActiveKey,
                std::format("{} key {} version {} is no longer valid", to_string(key.kind()), key.key_id(), key.version()));
}

Result<crypto::SecretBytes> KeyManager::decapsulate(const KeyPair& key, std::span<const uint8_t> ciphertext) const
{
    if (key.kind() != KeyKind::Kem)
    {
        return fail(ErrorCode::InvalidArgument, "decapsulate requires a KEM key");
    }
    auto secret = checkout_secret(key);
    if (!secret)
    {
        return std::unexpected(secret.error());
    }
    return provider->decapsulate(key.algorithm(), secret->view(), ciphertext);
}

Result<std::vector<uint8_t>> KeyManager::sign(const KeyPair& key, std::span<const uint8_t> message) const
{
    if (key.kind() != KeyKind::Signature)
    {
        return fail(ErrorCode::InvalidArgument, "sign requires a signature key");
    }
    auto secret = checkout_secret(key);
    if (!secret)
    {
        return std::unexpected(secret.error());
    }
    return provider->sign(key.algorithm(), secret->view(), message);
}

size_t KeyManager::rotate_if_due()
{
    size_t count = 0;
    for (auto kind : {KeyKind::Kem, KeyKind::Signature})
    {
        auto now = clock.now();
        auto due = [&](const Slot& slot)
        {
            return now - slot.current->created_at() >= opts.rotation_interval;
        };

        bool any_due = false;
        {
            std::shared_lock lock(mtx);
            any_due = std::ranges::any_of(slots(kind), [&](const auto& kv)
            {
                return kv.second.current && due(kv.second);
            });
        }
        if (!any_due)
        {
            continue;
        }

        auto rotated = rotate(kind, due, "scheduled rotation", "scheduler");
        if (!rotated)
        {
            LOG_ERROR("Scheduled {} rotation failed: {}", to_string(kind), rotated.error());
            continue;
        }
        count += rotated->size();
    }
    return count;
}

size_t KeyManager::prune_retired()
{
    size_t pruned = 0;
    std::unique_lock lock(mtx);
    auto now = clock.now();
    for (auto* map : {&kem_slots, &sig_slots})
    {
        for (auto& [alg, slot] : *map)
        {
            if (slot.previous && !in_grace(slot, now))
            {
                LOG_INFO("Discarding retired {} key {} version {}",
                         to_string(slot.previous->kind()), slot.previous->key_id(), slot.previous->version());
                discard(slot.previous);
                ++pruned;
            }
        }
    }
    return pruned;
}

void KeyManager::append_audit(RotationAuditEntry entry)
{
    std::lock_guard lock(audit_mtx);
    audit_log.push_back(std::move(entry));
}

void KeyManager::discard(std::shared_ptr<KeyPair>& key)
{
    if (key)
    {
        key->secret_key_.wipe();
        key.reset();
    }
}

void KeyManager::discard_all(slot_map& map)
{
    for (auto& [alg, slot] : map)
    {
        discard(slot.current);
        discard(slot.previous);
    }
    map.clear();
}

} // namespace keys
