#include "api_codec.hpp"
#include "fundamentals/json_utils.hpp"

#include <algorithm>
#include <format>

namespace json = boost::json;

namespace api
{

namespace
{

json::array string_list(const std::vector<std::string>& items)
{
    json::array arr;
    for (const auto& s : items)
    {
        arr.emplace_back(s);
    }
    return arr;
}

std::expected<std::vector<std::string>, std::string> extract_list(const json::object& obj, std::string_view key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_array())
    {
        return std::unexpected(std::format("\"{}\" must be an array of strings", key));
    }
    std::vector<std::string> out;
    for (const auto& v : it->value().as_array())
    {
        if (!v.is_string())
        {
            return std::unexpected(std::format("\"{}\" must be an array of strings", key));
        }
        out.emplace_back(v.as_string());
    }
    return out;
}

template<size_t N>
std::expected<std::array<uint8_t, N>, std::string> extract_fixed(const json::object& obj, std::string_view key)
{
    auto bin = json_utils::extract_hex(obj, key);
    if (!bin)
    {
        return std::unexpected(bin.error());
    }
    if (bin->size() != N)
    {
        return std::unexpected(std::format("\"{}\" must be {} bytes", key, N));
    }
    std::array<uint8_t, N> out{};
    std::ranges::copy(*bin, out.begin());
    return out;
}

std::expected<uint32_t, std::string> extract_version(const json::object& obj, std::string_view key)
{
    auto v = json_utils::extract_int(obj, key);
    if (!v)
    {
        return std::unexpected(v.error());
    }
    if (*v < 0 || *v > UINT32_MAX)
    {
        return std::unexpected(std::format("\"{}\" out of range", key));
    }
    return static_cast<uint32_t>(*v);
}

} // namespace

json::object to_json(const keys::PublicKeyInfo& info)
{
    return json::object{
        {"kind", to_string(info.kind)},
        {"algorithm", info.algorithm},
        {"public_key", json_utils::hex(info.public_key)},
        {"version", info.version},
        {"key_id", info.key_id},
        {"created_at", to_unix_ms(info.created_at)},
    };
}

json::object to_json(const keys::PublicKeyBundle& bundle)
{
    json::array kem, sig;
    for (const auto& k : bundle.kem)
    {
        kem.push_back(to_json(k));
    }
    for (const auto& k : bundle.sig)
    {
        sig.push_back(to_json(k));
    }
    return json::object{{"kem", std::move(kem)}, {"sig", std::move(sig)}};
}

json::object to_json(const handshake::ServerHello& sh)
{
    json::object obj{
        {"handshake_id", sh.handshake_id},
        {"cipher_suite", sh.suite.cipher_suite()},
        {"kem_algorithm", sh.suite.kem},
        {"sig_algorithm", sh.suite.sig},
        {"kem_public_key", json_utils::hex(sh.kem_public_key)},
        {"kem_key_version", sh.kem_key_version},
        {"sig_public_key", json_utils::hex(sh.sig_public_key)},
        {"sig_key_version", sh.sig_key_version},
        {"server_nonce", json_utils::hex(sh.server_nonce)},
        {"expires_at", to_unix_ms(sh.expires_at)},
    };
    if (sh.x25519_share)
    {
        obj["x25519_share"] = json_utils::hex(*sh.x25519_share);
    }
    return obj;
}

json::object to_json(const handshake::ServerFinished& sf)
{
    return json::object{
        {"session_id", sf.session_id},
        {"signature", json_utils::hex(sf.signature)},
        {"verify_data", json_utils::hex(sf.verify_data)},
        {"sig_key_version", sf.sig_key_version},
        {"session_expires_at", to_unix_ms(sf.session_expires_at)},
    };
}

json::object to_json(const session::VerifyResult& vr)
{
    json::object obj{{"valid", vr.valid}};
    if (vr.reason)
    {
        obj["reason"] = to_string(*vr.reason);
    }
    if (vr.expires_at)
    {
        obj["expires_at"] = to_unix_ms(*vr.expires_at);
    }
    return obj;
}

json::object to_json(const HealthReport& report)
{
    return json::object{
        {"healthy", report.healthy},
        {"running", report.running},
        {"keys_ready", report.keys_ready},
        {"key_provider", report.key_provider},
        {"storage", json::object{
            {"backend", report.storage_backend},
            {"degraded", report.storage_degraded},
            {"active", report.sessions.active},
            {"expired", report.sessions.expired},
            {"invalidated", report.sessions.invalidated},
            {"swept", report.sessions.swept},
        }},
        {"pending_handshakes", report.pending_handshakes},
    };
}

json::object to_json(const GatewayMetrics& m)
{
    return json::object{
        {"handshakes_started", m.handshakes_started.load()},
        {"handshakes_completed", m.handshakes_completed.load()},
        {"handshakes_failed", m.handshakes_failed.load()},
        {"handshakes_expired", m.handshakes_expired.load()},
        {"negotiation_failures", m.negotiation_failures.load()},
        {"integrity_failures", m.integrity_failures.load()},
        {"order_violations", m.order_violations.load()},
        {"sessions_created", m.sessions_created.load()},
        {"sessions_invalidated", m.sessions_invalidated.load()},
        {"sessions_swept", m.sessions_swept.load()},
        {"key_rotations", m.key_rotations.load()},
        {"key_backups", m.key_backups.load()},
        {"key_restores", m.key_restores.load()},
    };
}

json::object error_reply(const Error& err)
{
    auto obj = json_utils::status_msg("error", err.detail.empty() ? to_string(err.code) : err.detail);
    obj["code"] = to_string(err.code);
    return obj;
}

std::expected<handshake::ClientHello, std::string> client_hello_from_json(const json::object& obj)
{
    auto kem = extract_list(obj, "kem_algorithms");
    auto sig = extract_list(obj, "sig_algorithms");
    auto nonce = extract_fixed<handshake::nonce_sz>(obj, "client_nonce");
    if (!kem) return std::unexpected(kem.error());
    if (!sig) return std::unexpected(sig.error());
    if (!nonce) return std::unexpected(nonce.error());

    handshake::ClientHello ch{
        .kem_algorithms = std::move(*kem),
        .sig_algorithms = std::move(*sig),
        .client_nonce = *nonce,
        .client_address = {},
        .x25519_share = std::nullopt,
    };
    if (auto addr = json_utils::extract_str(obj, "client_address"); addr)
    {
        ch.client_address = std::move(*addr);
    }
    if (obj.contains("x25519_share"))
    {
        auto share = json_utils::extract_hex(obj, "x25519_share");
        if (!share)
        {
            return std::unexpected(share.error());
        }
        ch.x25519_share = std::move(*share);
    }
    return ch;
}

std::expected<handshake::ClientKeyExchange, std::string> key_exchange_from_json(const json::object& obj)
{
    auto id = json_utils::extract_str(obj, "handshake_id");
    auto ct = json_utils::extract_hex(obj, "ciphertext");
    if (!id) return std::unexpected(id.error());
    if (!ct) return std::unexpected(ct.error());

    handshake::ClientKeyExchange cke{
        .handshake_id = std::move(*id),
        .ciphertext = std::move(*ct),
        .client_verify_data = std::nullopt,
    };
    if (obj.contains("client_verify_data"))
    {
        auto vd = extract_fixed<crypto::digest_t{}.size()>(obj, "client_verify_data");
        if (!vd)
        {
            return std::unexpected(vd.error());
        }
        cke.client_verify_data = *vd;
    }
    return cke;
}

json::object to_json(const handshake::ClientHello& ch)
{
    json::object obj{
        {"kem_algorithms", string_list(ch.kem_algorithms)},
        {"sig_algorithms", string_list(ch.sig_algorithms)},
        {"client_nonce", json_utils::hex(ch.client_nonce)},
        {"client_address", ch.client_address},
    };
    if (ch.x25519_share)
    {
        obj["x25519_share"] = json_utils::hex(*ch.x25519_share);
    }
    return obj;
}

json::object to_json(const handshake::ClientKeyExchange& cke)
{
    json::object obj{
        {"handshake_id", cke.handshake_id},
        {"ciphertext", json_utils::hex(cke.ciphertext)},
    };
    if (cke.client_verify_data)
    {
        obj["client_verify_data"] = json_utils::hex(*cke.client_verify_data);
    }
    return obj;
}

std::expected<handshake::ServerHello, std::string> server_hello_from_json(const json::object& obj)
{
    auto id = json_utils::extract_str(obj, "handshake_id");
    auto kem_alg = json_utils::extract_str(obj, "kem_algorithm");
    auto sig_alg = json_utils::extract_str(obj, "sig_algorithm");
    auto kem_pk = json_utils::extract_hex(obj, "kem_public_key");
    auto kem_ver = extract_version(obj, "kem_key_version");
    auto sig_pk = json_utils::extract_hex(obj, "sig_public_key");
    auto sig_ver = extract_version(obj, "sig_key_version");
    auto nonce = extract_fixed<handshake::nonce_sz>(obj, "server_nonce");
    auto expires = json_utils::extract_int(obj, "expires_at");
    if (!id) return std::unexpected(id.error());
    if (!kem_alg) return std::unexpected(kem_alg.error());
    if (!sig_alg) return std::unexpected(sig_alg.error());
    if (!kem_pk) return std::unexpected(kem_pk.error());
    if (!kem_ver) return std::unexpected(kem_ver.error());
    if (!sig_pk) return std::unexpected(sig_pk.error());
    if (!sig_ver) return std::unexpected(sig_ver.error());
    if (!nonce) return std::unexpected(nonce.error());
    if (!expires) return std::unexpected(expires.error());

    const auto* kem_info = keys::find_algorithm(*kem_alg, keys::KeyKind::Kem);
    const auto* sig_info = keys::find_algorithm(*sig_alg, keys::KeyKind::Signature);
    if (!kem_info || !sig_info)
    {
        return std::unexpected("unknown algorithm in server hello");
    }

    std::optional<std::vector<uint8_t>> share;
    if (obj.contains("x25519_share"))
    {
        auto hex_share = json_utils::extract_hex(obj, "x25519_share");
        if (!hex_share)
        {
            return std::unexpected(hex_share.error());
        }
        share = std::move(*hex_share);
    }

    return handshake::ServerHello{
        .handshake_id = std::move(*id),
        .suite = keys::AlgorithmSuite{
            .kem = std::move(*kem_alg),
            .sig = std::move(*sig_alg),
            .rank = std::min(kem_info->rank, sig_info->rank),
        },
        .kem_public_key = std::move(*kem_pk),
        .kem_key_version = *kem_ver,
        .sig_public_key = std::move(*sig_pk),
        .sig_key_version = *sig_ver,
        .server_nonce = *nonce,
        .expires_at = from_unix_ms(*expires),
        .x25519_share = std::move(share),
    };
}

std::expected<handshake::ServerFinished, std::string> server_finished_from_json(const json::object& obj)
{
    auto id = json_utils::extract_str(obj, "session_id");
    auto sig = json_utils::extract_hex(obj, "signature");
    auto vd = extract_fixed<crypto::digest_t{}.size()>(obj, "verify_data");
    auto ver = extract_version(obj, "sig_key_version");
    auto expires = json_utils::extract_int(obj, "session_expires_at");
    if (!id) return std::unexpected(id.error());
    if (!sig) return std::unexpected(sig.error());
    if (!vd) return std::unexpected(vd.error());
    if (!ver) return std::unexpected(ver.error());
    if (!expires) return std::unexpected(expires.error());

    return handshake::ServerFinished{
        .session_id = std::move(*id),
        .signature = std::move(*sig),
        .verify_data = *vd,
        .sig_key_version = *ver,
        .session_expires_at = from_unix_ms(*expires),
    };
}

} // namespace api
