#include "config.hpp"
#include "keys/key_backup.hpp"
#include "keys/key_manager.hpp"
#include "session/sqlite_backend.hpp"
#include "fundamentals/file_io.hpp"

#include <chrono>
#include <cstdlib>
#include <format>
#include <print>
#include <string>

namespace
{

void print_usage(const char* prog)
{
    std::println("Usage: {} <command> [args]", prog);
    std::println("Commands:");
    std::println("  keygen <out>                 Generate server keys into a new backup");
    std::println("  inspect <in>                 List the key pairs held in a backup");
    std::println("  rotate <in> <out>            Rotate every key in a backup");
    std::println("  sessions <db>                Session counts in a durable store");
    std::println("  revoke <db> <session_id>     Invalidate one session");
    std::println("Backup passphrase is read from PQGATE_BACKUP_PASSPHRASE.");
}

std::string format_time(time_point tp)
{
    return std::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::floor<std::chrono::seconds>(tp));
}

const char* passphrase()
{
    const char* pass = std::getenv("PQGATE_BACKUP_PASSPHRASE");
    if (!pass || !*pass)
    {
        std::println(stderr, "PQGATE_BACKUP_PASSPHRASE is not set");
        return nullptr;
    }
    return pass;
}

std::unique_ptr<keys::KeyManager> make_manager(const Config& config, const Clock& clock)
{
    auto provider = keys::make_key_provider(config.keys().provider);
    if (!provider)
    {
        std::println(stderr, "{}", provider.error());
        return nullptr;
    }
    return std::make_unique<keys::KeyManager>(std::move(*provider), clock, keys::KeyManagerOptions{
        .grace_period = config.grace_period(),
        .rotation_interval = std::chrono::duration_cast<std::chrono::seconds>(config.keys().rotation_interval),
    });
}

int write_backup(keys::KeyManager& km, const char* pass, const std::string& out)
{
    auto blob = km.backup_keys(pass, "pqgate_keyadmin");
    if (!blob)
    {
        std::println(stderr, "Backup failed: {}", blob.error());
        return 1;
    }
    if (auto res = file_io::write_private_file(out, *blob); !res)
    {
        std::println(stderr, "{}", res.error());
        return 1;
    }
    return 0;
}

void print_keys(const keys::PublicKeyBundle& bundle)
{
    std::println("{:<5} {:<14} {:<8} {:<26} {}", "Kind", "Algorithm", "Version", "Key id", "Created");
    std::println("{}", std::string(78, '-'));
    for (const auto* list : {&bundle.kem, &bundle.sig})
    {
        for (const auto& k : *list)
        {
            std::println("{:<5} {:<14} {:<8} {:<26} {}",
                         to_string(k.kind), k.algorithm, k.version, k.key_id, format_time(k.created_at));
        }
    }
}

int cmd_keygen(const Config& config, const Clock& clock, const std::string& out)
{
    const char* pass = passphrase();
    auto km = make_manager(config, clock);
    if (!pass || !km)
    {
        return 1;
    }

    for (const auto& alg : config.keys().kem_algorithms)
    {
        if (auto res = km->generate_kem_keypair(alg, "pqgate_keyadmin"); !res)
        {
            std::println(stderr, "Failed to generate {}: {}", alg, res.error());
            return 1;
        }
    }
    for (const auto& alg : config.keys().sig_algorithms)
    {
        if (auto res = km->generate_sig_keypair(alg, "pqgate_keyadmin"); !res)
        {
            std::println(stderr, "Failed to generate {}: {}", alg, res.error());
            return 1;
        }
    }

    if (write_backup(*km, pass, out) != 0)
    {
        return 1;
    }
    print_keys(km->export_public_keys());
    std::println("Keys written to {}", out);
    return 0;
}

int cmd_inspect(const std::string& in)
{
    const char* pass = passphrase();
    if (!pass)
    {
        return 1;
    }
    auto blob = file_io::read_file(in);
    if (!blob)
    {
        std::println(stderr, "{}", blob.error());
        return 1;
    }

    auto entries = keys::KeyBackup::open(*blob, pass);
    if (!entries)
    {
        std::println(stderr, "Cannot open backup: {}", entries.error());
        return 1;
    }

    std::println("{:<5} {:<14} {:<8} {:<26} {:<20} {}", "Kind", "Algorithm", "Version", "Key id", "Created", "Retired");
    std::println("{}", std::string(98, '-'));
    for (const auto& e : *entries)
    {
        std::println("{:<5} {:<14} {:<8} {:<26} {:<20} {}",
                     to_string(e.kind), e.algorithm, e.version, e.key_id, format_time(e.created_at),
                     e.retired_at ? format_time(*e.retired_at) : "-");
    }
    return 0;
}

int cmd_rotate(const Config& config, const Clock& clock, const std::string& in, const std::string& out)
{
    const char* pass = passphrase();
    auto km = make_manager(config, clock);
    if (!pass || !km)
    {
        return 1;
    }
    auto blob = file_io::read_file(in);
    if (!blob)
    {
        std::println(stderr, "{}", blob.error());
        return 1;
    }
    if (auto res = km->restore_keys(pass, *blob, "pqgate_keyadmin"); !res)
    {
        std::println(stderr, "Cannot restore backup: {}", res.error());
        return 1;
    }

    auto kem = km->rotate_kem_key("operator rotation", "pqgate_keyadmin");
    auto sig = km->rotate_sig_key("operator rotation", "pqgate_keyadmin");
    if (!kem || !sig)
    {
        std::println(stderr, "Rotation failed: {}", !kem ? kem.error() : sig.error());
        return 1;
    }

    if (write_backup(*km, pass, out) != 0)
    {
        return 1;
    }
    print_keys(km->export_public_keys());
    std::println("Rotated {} key pairs, written to {}", kem->size() + sig->size(), out);
    return 0;
}

int cmd_sessions(const Clock& clock, const std::string& db_path)
{
    auto backend = session::SqliteBackend::open(db_path, clock);
    if (!backend)
    {
        std::println(stderr, "Failed to open {}: {}", db_path, backend.error());
        return 1;
    }

    auto counts = (*backend)->count(clock.now());
    if (!counts)
    {
        std::println(stderr, "Query failed: {}", counts.error());
        return 1;
    }
    std::println("{:<12} {}", "Active", counts->active);
    std::println("{:<12} {}", "Expired", counts->expired);
    std::println("{:<12} {}", "Invalidated", counts->invalidated);
    return 0;
}

int cmd_revoke(const Clock& clock, const std::string& db_path, const std::string& session_id)
{
    auto backend = session::SqliteBackend::open(db_path, clock);
    if (!backend)
    {
        std::println(stderr, "Failed to open {}: {}", db_path, backend.error());
        return 1;
    }

    auto res = (*backend)->mark_invalidated(session_id);
    if (!res)
    {
        std::println(stderr, "Revoke failed: {}", res.error());
        return 1;
    }
    if (!*res)
    {
        std::println(stderr, "Session '{}' not found", session_id);
        return 1;
    }
    std::println("Session '{}' invalidated", session_id);
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];
    auto config = Config::load_or_defaults("pqgated.json");
    SystemClock clock;

    if (cmd == "keygen" && argc == 3)
    {
        return cmd_keygen(config, clock, argv[2]);
    }
    else if (cmd == "inspect" && argc == 3)
    {
        return cmd_inspect(argv[2]);
    }
    else if (cmd == "rotate" && argc == 4)
    {
        return cmd_rotate(config, clock, argv[2], argv[3]);
    }
    else if (cmd == "sessions" && argc == 3)
    {
        return cmd_sessions(clock, argv[2]);
    }
    else if (cmd == "revoke" && argc == 4)
    {
        return cmd_revoke(clock, argv[2], argv[3]);
    }
    else
    {
        print_usage(argv[0]);
        return 1;
    }
}
