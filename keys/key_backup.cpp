#include "keys/key_backup.hpp"
#include "crypto/aesgcm256.hpp"
#include "crypto/kdf.hpp"
#include "crypto/passphrase_kdf.hpp"
#include "fundamentals/bytes.hpp"
#include "fundamentals/json_utils.hpp"

#include <boost/json.hpp>
#include <algorithm>
#include <format>

namespace json = boost::json;

namespace keys
{

namespace
{

constexpr std::string_view check_label = "pqgate backup passphrase check";

constexpr size_t header_len = KeyBackup::magic.size() + 1
                            + crypto::PassphraseKdf::salt_len
                            + crypto::digest_t{}.size()
                            + crypto::AES256GCM::nonce_sz;

json::value entry_to_json(const BackupEntry& e)
{
    json::object obj{
        {"kind", to_string(e.kind)},
        {"algorithm", e.algorithm},
        {"version", e.version},
        {"key_id", e.key_id},
        {"parent_key_id", e.parent_key_id},
        {"created_at", to_unix_ms(e.created_at)},
        {"public", json_utils::hex(e.public_key)},
    };
    // Written in place so no unwiped copy of the hex outlives this call.
    std::string secret_hex = bytes::to_hex(e.secret_key.view());
    obj["secret"].emplace_string().assign(secret_hex);
    crypto::secure_clear(secret_hex);
    if (e.retired_at)
    {
        obj["retired_at"] = to_unix_ms(*e.retired_at);
    }
    else
    {
        obj["retired_at"] = nullptr;
    }
    return obj;
}

std::expected<BackupEntry, std::string> entry_from_json(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("key entry is not an object");
    }
    const auto& obj = jv.as_object();

    auto kind = json_utils::extract_str(obj, "kind");
    auto alg = json_utils::extract_str(obj, "algorithm");
    auto version = json_utils::extract_int(obj, "version");
    auto key_id = json_utils::extract_str(obj, "key_id");
    auto created = json_utils::extract_int(obj, "created_at");
    auto pub = json_utils::extract_hex(obj, "public");
    auto sec = json_utils::extract_hex(obj, "secret");
    if (!kind) return std::unexpected(kind.error());
    if (!alg) return std::unexpected(alg.error());
    if (!key_id) return std::unexpected(key_id.error());
    if (!version) return std::unexpected(version.error());
    if (!created) return std::unexpected(created.error());
    if (!pub) return std::unexpected(pub.error());
    if (!sec) return std::unexpected(sec.error());

    if (*kind != "kem" && *kind != "sig")
    {
        return std::unexpected(std::format("unknown key kind '{}'", *kind));
    }
    if (*version <= 0 || *version > UINT32_MAX)
    {
        return std::unexpected("key version out of range");
    }
    if (pub->empty() || sec->empty())
    {
        return std::unexpected("empty key material");
    }

    BackupEntry e;
    e.kind = *kind == "kem" ? KeyKind::Kem : KeyKind::Signature;
    e.algorithm = std::move(*alg);
    e.public_key = std::move(*pub);
    e.secret_key = crypto::SecretBytes(std::span<const uint8_t>(*sec));
    crypto::secure_clear(*sec);
    e.version = static_cast<uint32_t>(*version);
    e.created_at = from_unix_ms(*created);
    e.key_id = std::move(*key_id);
    if (auto parent = json_utils::extract_str(obj, "parent_key_id"); parent)
    {
        e.parent_key_id = std::move(*parent);
    }
    if (auto it = obj.find("retired_at"); it != obj.end() && !it->value().is_null())
    {
        auto retired = json_utils::extract_int(obj, "retired_at");
        if (!retired)
        {
            return std::unexpected(retired.error());
        }
        e.retired_at = from_unix_ms(*retired);
    }
    return e;
}

void wipe_secrets(json::array& keys)
{
    for (auto& jv : keys)
    {
        if (auto* obj = jv.if_object())
        {
            if (auto it = obj->find("secret"); it != obj->end() && it->value().is_string())
            {
                crypto::secure_clear(it->value().as_string());
            }
        }
    }
}

} // namespace

Result<std::vector<uint8_t>> KeyBackup::seal(
    std::span<const BackupEntry> entries,
    std::string_view passphrase,
    time_point created_at)
{
    if (entries.empty())
    {
        return fail(ErrorCode::InvalidArgument, "nothing to back up");
    }

    auto salt = crypto::PassphraseKdf::make_salt();
    if (!salt)
    {
        return fail(ErrorCode::CryptoFailure, salt.error());
    }
    auto key = crypto::PassphraseKdf::derive(passphrase, *salt);
    if (!key)
    {
        return fail(ErrorCode::InvalidPassphrase, key.error());
    }
    auto check = crypto::hmac_sha256(key->view(), bytes::as_span(check_label));
    auto nonce = crypto::random_array<crypto::AES256GCM::nonce_sz>();
    if (!check || !nonce)
    {
        return fail(ErrorCode::CryptoFailure, "backup header generation failed");
    }

    json::array keys;
    keys.reserve(entries.size());
    for (const auto& e : entries)
    {
        keys.push_back(entry_to_json(e));
    }
    json::object doc{
        {"format", format_version},
        {"created_at", to_unix_ms(created_at)},
    };
    doc["keys"] = std::move(keys);
    std::string plaintext = json::serialize(doc);
    wipe_secrets(doc["keys"].as_array());

    bytes::Writer header;
    header.put_raw(magic)
          .put_int(format_version)
          .put_raw(*salt)
          .put_raw(*check)
          .put_raw(*nonce);

    auto sealed = crypto::AES256GCM::seal(key->view(), *nonce, bytes::as_span(plaintext), header.data());
    crypto::secure_clear(plaintext);
    if (!sealed)
    {
        return fail(ErrorCode::CryptoFailure, "backup encryption failed");
    }

    header.put_raw(*sealed);
    return header.take();
}

Result<std::vector<BackupEntry>> KeyBackup::open(
    std::span<const uint8_t> blob,
    std::string_view passphrase)
{
    if (blob.size() < header_len + crypto::AES256GCM::tag_sz)
    {
        return fail(ErrorCode::CorruptBackup, "backup truncated");
    }

    bytes::Reader rd(blob);
    auto got_magic = rd.get_raw(magic.size());
    auto got_format = rd.get_int<uint8_t>();
    auto salt = rd.get_raw(crypto::PassphraseKdf::salt_len);
    auto check = rd.get_raw(crypto::digest_t{}.size());
    auto nonce = rd.get_raw(crypto::AES256GCM::nonce_sz);
    if (!got_magic || !got_format || !salt || !check || !nonce)
    {
        return fail(ErrorCode::CorruptBackup, "backup header truncated");
    }
    if (!std::ranges::equal(*got_magic, magic))
    {
        return fail(ErrorCode::CorruptBackup, "bad backup magic");
    }
    if (*got_format != format_version)
    {
        return fail(ErrorCode::CorruptBackup, std::format("unsupported backup format {}", *got_format));
    }

    auto key = crypto::PassphraseKdf::derive(passphrase, *salt);
    if (!key)
    {
        return fail(ErrorCode::InvalidPassphrase, key.error());
    }
    auto expect = crypto::hmac_sha256(key->view(), bytes::as_span(check_label));
    if (!expect)
    {
        return fail(ErrorCode::CryptoFailure, "passphrase check computation failed");
    }
    if (!crypto::constant_time_equal(*expect, *check))
    {
        return fail(ErrorCode::InvalidPassphrase, "passphrase does not match backup");
    }

    auto plaintext = crypto::AES256GCM::open(key->view(), *nonce, rd.remaining(), blob.first(header_len));
    if (!plaintext)
    {
        return fail(ErrorCode::CorruptBackup, "backup authentication failed");
    }

    boost::system::error_code ec;
    json::value doc = json::parse(
        std::string_view(reinterpret_cast<const char*>(plaintext->data()), plaintext->size()), ec);
    crypto::secure_clear(*plaintext);
    if (ec || !doc.is_object())
    {
        return fail(ErrorCode::CorruptBackup, "backup payload is not a JSON object");
    }

    auto& root = doc.as_object();
    auto it = root.find("keys");
    if (it == root.end() || !it->value().is_array())
    {
        return fail(ErrorCode::CorruptBackup, "backup payload has no key list");
    }

    auto& keys = it->value().as_array();
    std::vector<BackupEntry> entries;
    entries.reserve(keys.size());
    for (const auto& jv : keys)
    {
        auto entry = entry_from_json(jv);
        if (!entry)
        {
            wipe_secrets(keys);
            return fail(ErrorCode::CorruptBackup, entry.error());
        }
        entries.push_back(std::move(*entry));
    }
    wipe_secrets(keys);
    return entries;
}

} // namespace keys
