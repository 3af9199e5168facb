#include "handshake/key_schedule.hpp"

#include <algorithm>
#include <string_view>

namespace handshake
{

namespace
{

constexpr std::string_view label_client_key = "pqgate c write key";
constexpr std::string_view label_server_key = "pqgate s write key";
constexpr std::string_view label_client_iv = "pqgate c write iv";
constexpr std::string_view label_server_iv = "pqgate s write iv";
constexpr std::string_view label_finished = "pqgate finished";

constexpr std::string_view label_server_finished = "pqgate server finished";
constexpr std::string_view label_client_finished = "pqgate client finished";
constexpr std::string_view label_signature = "pqgate server signature";

std::optional<crypto::digest_t> finished_mac(const KeyBlock& kb, std::string_view label, const crypto::digest_t& transcript)
{
    bytes::Writer w;
    w.put_raw(bytes::as_span(label)).put_raw(transcript);
    return crypto::hmac_sha256(kb.finished_key, w.data());
}

} // namespace

std::optional<KeyBlock> derive_key_block(
    std::span<const uint8_t> shared_secret,
    const nonce_t& client_nonce,
    const nonce_t& server_nonce,
    std::span<const uint8_t> classical_secret)
{
    std::array<uint8_t, nonce_sz * 2> salt{};
    std::ranges::copy(client_nonce, salt.begin());
    std::ranges::copy(server_nonce, salt.begin() + nonce_sz);

    crypto::SecretBytes ikm(shared_secret.size() + classical_secret.size());
    std::ranges::copy(shared_secret, ikm.data());
    std::ranges::copy(classical_secret, ikm.data() + shared_secret.size());

    KeyBlock kb;
    auto material = ikm.view();
    bool ok = crypto::hkdf_sha256(material, salt, bytes::as_span(label_client_key), kb.keys.client_write_key)
           && crypto::hkdf_sha256(material, salt, bytes::as_span(label_server_key), kb.keys.server_write_key)
           && crypto::hkdf_sha256(material, salt, bytes::as_span(label_client_iv), kb.keys.client_write_iv)
           && crypto::hkdf_sha256(material, salt, bytes::as_span(label_server_iv), kb.keys.server_write_iv)
           && crypto::hkdf_sha256(material, salt, bytes::as_span(label_finished), kb.finished_key);
    if (!ok)
    {
        return std::nullopt;
    }
    return kb;
}

std::optional<crypto::digest_t> server_verify_data(const KeyBlock& kb, const crypto::digest_t& transcript)
{
    return finished_mac(kb, label_server_finished, transcript);
}

std::optional<crypto::digest_t> client_verify_data(const KeyBlock& kb, const crypto::digest_t& transcript)
{
    return finished_mac(kb, label_client_finished, transcript);
}

bytes::buffer_t signature_input(const crypto::digest_t& transcript)
{
    bytes::Writer w;
    w.put_raw(bytes::as_span(label_signature)).put_raw(transcript);
    return w.take();
}

} // namespace handshake
