#include "handshake/messages.hpp"

namespace handshake
{

namespace
{

enum class Tag : uint8_t
{
    ClientHello = 1,
    ServerHello = 2,
    ClientKeyExchange = 3,
};

void put_list(bytes::Writer& w, const std::vector<std::string>& names)
{
    w.put_int(static_cast<uint16_t>(names.size()));
    for (const auto& name : names)
    {
        w.put_field(name);
    }
}

void put_share(bytes::Writer& w, const std::optional<std::vector<uint8_t>>& share)
{
    w.put_int(static_cast<uint8_t>(share ? 1 : 0));
    if (share)
    {
        w.put_field(*share);
    }
}

} // namespace

bytes::buffer_t encode(const ClientHello& msg)
{
    bytes::Writer w;
    w.put_int(static_cast<uint8_t>(Tag::ClientHello));
    put_list(w, msg.kem_algorithms);
    put_list(w, msg.sig_algorithms);
    w.put_raw(msg.client_nonce);
    put_share(w, msg.x25519_share);
    return w.take();
}

bytes::buffer_t encode(const ServerHello& msg)
{
    bytes::Writer w;
    w.put_int(static_cast<uint8_t>(Tag::ServerHello))
     .put_field(msg.handshake_id)
     .put_field(msg.suite.kem)
     .put_field(msg.suite.sig)
     .put_field(msg.kem_public_key)
     .put_int(msg.kem_key_version)
     .put_field(msg.sig_public_key)
     .put_int(msg.sig_key_version)
     .put_raw(msg.server_nonce);
    put_share(w, msg.x25519_share);
    return w.take();
}

bytes::buffer_t encode(const ClientKeyExchange& msg)
{
    bytes::Writer w;
    w.put_int(static_cast<uint8_t>(Tag::ClientKeyExchange))
     .put_field(msg.handshake_id)
     .put_field(msg.ciphertext);
    return w.take();
}

} // namespace handshake
