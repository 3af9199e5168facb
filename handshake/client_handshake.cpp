#include "handshake/client_handshake.hpp"
#include "crypto/kem.hpp"
#include "crypto/signer.hpp"
#include "crypto/x25519.hpp"

#include <algorithm>
#include <format>

namespace handshake
{

ClientHandshake::ClientHandshake(std::vector<std::string> kems,
                                 std::vector<std::string> sigs,
                                 std::optional<std::vector<uint8_t>> pinned,
                                 bool hybrid)
    : kem_offer(std::move(kems))
    , sig_offer(std::move(sigs))
    , pinned_sig_key(std::move(pinned))
    , offer_x25519(hybrid)
{
}

std::unexpected<Error> ClientHandshake::failed(ErrorCode code, std::string detail)
{
    step = Step::Failed;
    x25519_secret.wipe();
    if (key_block)
    {
        key_block->wipe();
        key_block.reset();
    }
    return fail(code, std::move(detail));
}

Result<ClientHello> ClientHandshake::hello(std::string client_address)
{
    if (step != Step::Start)
    {
        return fail(ErrorCode::ProtocolOrderViolation, "hello already sent");
    }

    auto nonce = crypto::random_array<nonce_sz>();
    if (!nonce)
    {
        return failed(ErrorCode::CryptoFailure, "failed to generate client nonce");
    }

    client = ClientHello{
        .kem_algorithms = kem_offer,
        .sig_algorithms = sig_offer,
        .client_nonce = *nonce,
        .client_address = std::move(client_address),
        .x25519_share = std::nullopt,
    };
    if (offer_x25519)
    {
        auto ephemeral = crypto::X25519::generate_keypair();
        if (!ephemeral)
        {
            return failed(ErrorCode::CryptoFailure, "failed to generate X25519 key");
        }
        client->x25519_share = std::move(ephemeral->public_key);
        x25519_secret = std::move(ephemeral->secret_key);
    }
    if (!transcript.absorb(encode(*client)))
    {
        return failed(ErrorCode::CryptoFailure, "transcript hash failure");
    }
    step = Step::HelloSent;
    return *client;
}

Result<ClientKeyExchange> ClientHandshake::on_server_hello(const ServerHello& sh)
{
    if (step != Step::HelloSent)
    {
        return fail(ErrorCode::ProtocolOrderViolation, "unexpected ServerHello");
    }

    // A suite we never offered means the hello was tampered with.
    if (std::ranges::find(kem_offer, sh.suite.kem) == kem_offer.end()
        || std::ranges::find(sig_offer, sh.suite.sig) == sig_offer.end())
    {
        return failed(ErrorCode::TranscriptIntegrityFailure,
                      std::format("server selected unoffered suite {}", sh.suite.cipher_suite()));
    }
    if (pinned_sig_key && *pinned_sig_key != sh.sig_public_key)
    {
        return failed(ErrorCode::TranscriptIntegrityFailure, "server signature key does not match pinned key");
    }
    if (sh.x25519_share && x25519_secret.empty())
    {
        return failed(ErrorCode::TranscriptIntegrityFailure, "server answered an X25519 share that was never offered");
    }

    std::optional<crypto::SecretBytes> classical;
    if (sh.x25519_share)
    {
        classical = crypto::X25519::exchange(x25519_secret.view(), *sh.x25519_share);
        if (!classical)
        {
            return failed(ErrorCode::CryptoFailure, "X25519 exchange with server share failed");
        }
    }
    x25519_secret.wipe();

    if (!crypto::Kem::is_available(sh.suite.kem))
    {
        return failed(ErrorCode::UnsupportedAlgorithm, sh.suite.kem);
    }

    auto enc = crypto::Kem(sh.suite.kem).encapsulate(sh.kem_public_key);
    if (!enc)
    {
        return failed(ErrorCode::CryptoFailure, "encapsulation to server key failed");
    }

    ClientKeyExchange cke{
        .handshake_id = sh.handshake_id,
        .ciphertext = std::move(enc->ciphertext),
        .client_verify_data = std::nullopt,
    };

    if (!transcript.absorb(encode(sh)) || !transcript.absorb(encode(cke)))
    {
        return failed(ErrorCode::CryptoFailure, "transcript hash failure");
    }
    transcript_hash = transcript.peek();
    key_block = derive_key_block(enc->shared_secret.view(), client->client_nonce, sh.server_nonce,
                                 classical ? std::span<const uint8_t>(classical->view()) : std::span<const uint8_t>{});
    enc->shared_secret.wipe();
    if (classical)
    {
        classical->wipe();
    }
    if (!transcript_hash || !key_block)
    {
        return failed(ErrorCode::CryptoFailure, "key schedule failure");
    }

    cke.client_verify_data = client_verify_data(*key_block, *transcript_hash);
    if (!cke.client_verify_data)
    {
        return failed(ErrorCode::CryptoFailure, "verify data failure");
    }

    server = sh;
    step = Step::KeyExchangeSent;
    return cke;
}

Result<session::SessionKeys> ClientHandshake::on_server_finished(const ServerFinished& sf)
{
    if (step != Step::KeyExchangeSent)
    {
        return fail(ErrorCode::ProtocolOrderViolation, "unexpected ServerFinished");
    }
    if (sf.sig_key_version != server->sig_key_version)
    {
        return failed(ErrorCode::TranscriptIntegrityFailure, "signature key version changed mid-handshake");
    }

    if (!crypto::Signer::is_available(server->suite.sig))
    {
        return failed(ErrorCode::UnsupportedAlgorithm, server->suite.sig);
    }
    if (!crypto::Signer(server->suite.sig).verify(signature_input(*transcript_hash), sf.signature, server->sig_public_key))
    {
        return failed(ErrorCode::TranscriptIntegrityFailure, "server signature does not verify");
    }

    auto expect = server_verify_data(*key_block, *transcript_hash);
    if (!expect || !crypto::constant_time_equal(*expect, sf.verify_data))
    {
        return failed(ErrorCode::TranscriptIntegrityFailure, "server verify data mismatch");
    }

    session::SessionKeys keys = key_block->keys;
    key_block->wipe();
    key_block.reset();
    step = Step::Done;
    return keys;
}

} // namespace handshake
