#include "session/session_cipher.hpp"
#include "crypto/utils.hpp"
#include "fundamentals/bytes.hpp"

#include <algorithm>
#include <ranges>

namespace session
{

SessionCipher::SessionCipher(const SessionKeys& keys, Role role)
{
    if (role == Role::Client)
    {
        send_key = keys.client_write_key;
        send_iv = keys.client_write_iv;
        recv_key = keys.server_write_key;
        recv_iv = keys.server_write_iv;
    }
    else
    {
        send_key = keys.server_write_key;
        send_iv = keys.server_write_iv;
        recv_key = keys.client_write_key;
        recv_iv = keys.client_write_iv;
    }
    ready = true;
}

SessionCipher::~SessionCipher()
{
    clear();
}

crypto::AES256GCM::nonce_t SessionCipher::make_nonce(const iv_t& iv, uint64_t seq)
{
    // Last 8 bytes carry the big-endian sequence number.
    crypto::AES256GCM::nonce_t nonce = iv;
    std::array<uint8_t, 8> seq_be{};
    bytes::from_int(seq_be, seq);
    for (size_t i = 0; i < seq_be.size(); ++i)
    {
        nonce[nonce.size() - seq_be.size() + i] ^= seq_be[i];
    }
    return nonce;
}

std::optional<std::vector<uint8_t>> SessionCipher::seal(std::span<const uint8_t> plaintext,
                                                        std::span<const uint8_t> aad)
{
    if (!ready)
    {
        return std::nullopt;
    }

    uint64_t seq = send_seq.fetch_add(1);
    bytes::Writer frame;
    frame.put_int(seq);

    std::vector<uint8_t> full_aad(frame.data());
    full_aad.insert(full_aad.end(), aad.begin(), aad.end());

    auto sealed = crypto::AES256GCM::seal(send_key, make_nonce(send_iv, seq), plaintext, full_aad);
    if (!sealed)
    {
        return std::nullopt;
    }
    frame.put_raw(*sealed);
    return frame.take();
}

std::optional<std::vector<uint8_t>> SessionCipher::open(std::span<const uint8_t> frame,
                                                        std::span<const uint8_t> aad)
{
    if (!ready || frame.size() < sizeof(uint64_t) + crypto::AES256GCM::tag_sz)
    {
        return std::nullopt;
    }

    uint64_t seq = bytes::to_int<uint64_t>(frame.first(sizeof(uint64_t)));
    if (seq < recv_next.load())
    {
        return std::nullopt;
    }

    std::vector<uint8_t> full_aad(frame.begin(), frame.begin() + sizeof(uint64_t));
    full_aad.insert(full_aad.end(), aad.begin(), aad.end());

    auto plain = crypto::AES256GCM::open(recv_key, make_nonce(recv_iv, seq), frame.subspan(sizeof(uint64_t)), full_aad);
    if (!plain)
    {
        return std::nullopt;
    }

    // Only an authenticated frame may advance the window.
    uint64_t expected = recv_next.load();
    while (seq >= expected && !recv_next.compare_exchange_weak(expected, seq + 1))
    {
    }
    if (seq < expected)
    {
        crypto::secure_clear(*plain);
        return std::nullopt;
    }
    return plain;
}

void SessionCipher::clear()
{
    crypto::secure_clear(send_key);
    crypto::secure_clear(send_iv);
    crypto::secure_clear(recv_key);
    crypto::secure_clear(recv_iv);
    ready = false;
    send_seq.store(0);
    recv_next.store(0);
}

} // namespace session
