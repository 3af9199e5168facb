#pragma once

#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "crypto/kdf.hpp"
#include "crypto/utils.hpp"
#include "handshake/key_schedule.hpp"
#include "handshake/messages.hpp"
#include "session/session_record.hpp"

namespace handshake
{

/**
 * Client half of the handshake, one instance per attempt:
 *   hello() -> on_server_hello() -> on_server_finished()
 * When a signature public key is pinned, ServerHello must advertise exactly it.
 * With `offer_x25519` the hello carries an ephemeral X25519 share; a server
 * that declines it falls back to the KEM secret alone.
 */
class ClientHandshake
{
public:
    ClientHandshake(std::vector<std::string> kem_offer,
                    std::vector<std::string> sig_offer,
                    std::optional<std::vector<uint8_t>> pinned_sig_key = std::nullopt,
                    bool offer_x25519 = true);

    ClientHandshake(const ClientHandshake&) = delete;
    ClientHandshake& operator=(const ClientHandshake&) = delete;

    [[nodiscard]] Result<ClientHello> hello(std::string client_address = {});
    [[nodiscard]] Result<ClientKeyExchange> on_server_hello(const ServerHello& sh);
    [[nodiscard]] Result<session::SessionKeys> on_server_finished(const ServerFinished& sf);

    [[nodiscard]] const std::optional<ServerHello>& server_hello() const { return server; }

private:
    enum class Step { Start, HelloSent, KeyExchangeSent, Done, Failed };

    std::vector<std::string> kem_offer;
    std::vector<std::string> sig_offer;
    std::optional<std::vector<uint8_t>> pinned_sig_key;
    bool offer_x25519;
    crypto::SecretBytes x25519_secret;

    Step step = Step::Start;
    std::optional<ClientHello> client;
    std::optional<ServerHello> server;
    crypto::TranscriptHash transcript;
    std::optional<crypto::digest_t> transcript_hash;
    std::optional<KeyBlock> key_block;

    [[nodiscard]] std::unexpected<Error> failed(ErrorCode code, std::string detail);
};

} // namespace handshake
