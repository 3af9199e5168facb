#include <catch2/catch_test_macros.hpp>

#include "crypto/aesgcm256.hpp"
#include "crypto/kdf.hpp"
#include "crypto/kem.hpp"
#include "crypto/passphrase_kdf.hpp"
#include "crypto/signer.hpp"
#include "fundamentals/bytes.hpp"
#include "session/session_cipher.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

using namespace crypto;

TEST_CASE("Kem decapsulate recovers the encapsulated secret")
{
    Kem server("ML-KEM-768");
    Kem client("ML-KEM-768");

    auto kp = server.generate_keypair();
    REQUIRE(kp.has_value());
    CHECK(kp->public_key.size() == server.public_key_size());
    CHECK(kp->secret_key.size() == server.secret_key_size());

    auto enc = client.encapsulate(kp->public_key);
    REQUIRE(enc.has_value());
    CHECK(enc->ciphertext.size() == server.ciphertext_size());

    auto ss = server.decapsulate(enc->ciphertext, kp->secret_key.view());
    REQUIRE(ss.has_value());
    CHECK(constant_time_equal(ss->view(), enc->shared_secret.view()));
}

TEST_CASE("Kem decapsulate rejects a truncated ciphertext")
{
    Kem kem("ML-KEM-768");
    auto kp = kem.generate_keypair();
    REQUIRE(kp.has_value());
    auto enc = kem.encapsulate(kp->public_key);
    REQUIRE(enc.has_value());

    enc->ciphertext.pop_back();
    CHECK_FALSE(kem.decapsulate(enc->ciphertext, kp->secret_key.view()).has_value());
}

TEST_CASE("Kem encapsulate rejects a public key of the wrong size")
{
    Kem kem("ML-KEM-768");
    std::vector<uint8_t> short_pk(16, 0x01);
    CHECK_FALSE(kem.encapsulate(short_pk).has_value());
}

TEST_CASE("Kem constructor throws for unknown algorithms")
{
    CHECK_FALSE(Kem::is_available("NOT-A-KEM"));
    CHECK_THROWS_AS(Kem("NOT-A-KEM"), std::runtime_error);
}

TEST_CASE("Signer verifies its own signature and rejects tampering")
{
    Signer signer("ML-DSA-65");
    auto kp = signer.generate_keypair();
    REQUIRE(kp.has_value());

    auto msg = bytes::as_span("transcript digest");
    auto sig = signer.sign(msg, kp->secret_key.view());
    REQUIRE(sig.has_value());
    CHECK(signer.verify(msg, *sig, kp->public_key));

    auto other = bytes::as_span("transcript digesT");
    CHECK_FALSE(signer.verify(other, *sig, kp->public_key));

    (*sig)[0] ^= 0x01;
    CHECK_FALSE(signer.verify(msg, *sig, kp->public_key));
}

TEST_CASE("AES256GCM seal and open with associated data")
{
    std::array<uint8_t, AES256GCM::key_sz> key{};
    key.fill(0x42);
    std::array<uint8_t, AES256GCM::nonce_sz> nonce{};
    nonce.fill(0x07);

    auto plaintext = bytes::as_span("session payload");
    auto aad = bytes::as_span("header");

    auto sealed = AES256GCM::seal(key, nonce, plaintext, aad);
    REQUIRE(sealed.has_value());
    CHECK(sealed->size() == plaintext.size() + AES256GCM::tag_sz);

    auto opened = AES256GCM::open(key, nonce, *sealed, aad);
    REQUIRE(opened.has_value());
    CHECK(std::string(opened->begin(), opened->end()) == "session payload");

    CHECK_FALSE(AES256GCM::open(key, nonce, *sealed, bytes::as_span("other")).has_value());
    (*sealed)[0] ^= 0xFF;
    CHECK_FALSE(AES256GCM::open(key, nonce, *sealed, aad).has_value());
}

TEST_CASE("AES256GCM rejects keys and nonces of the wrong size")
{
    std::array<uint8_t, 16> short_key{};
    std::array<uint8_t, AES256GCM::nonce_sz> nonce{};
    CHECK_FALSE(AES256GCM::seal(short_key, nonce, bytes::as_span("x")).has_value());
}

TEST_CASE("sha256 matches the known empty-string digest")
{
    auto d = sha256({});
    REQUIRE(d.has_value());
    CHECK(bytes::to_hex(*d) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("hkdf_sha256 matches RFC 5869 test case 1")
{
    std::vector<uint8_t> ikm(22, 0x0b);
    auto salt = bytes::from_hex("000102030405060708090a0b0c");
    auto info = bytes::from_hex("f0f1f2f3f4f5f6f7f8f9");
    REQUIRE(salt.has_value());
    REQUIRE(info.has_value());

    std::array<uint8_t, 42> okm{};
    REQUIRE(hkdf_sha256(ikm, *salt, *info, okm));
    CHECK(bytes::to_hex(okm) ==
          "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
}

TEST_CASE("TranscriptHash peek equals sha256 of everything absorbed")
{
    TranscriptHash th;
    REQUIRE(th.ok());
    REQUIRE(th.absorb(bytes::as_span("client hello|")));
    auto early = th.peek();
    REQUIRE(th.absorb(bytes::as_span("server hello")));
    auto late = th.peek();

    auto whole = sha256(bytes::as_span("client hello|server hello"));
    REQUIRE(early.has_value());
    REQUIRE(late.has_value());
    REQUIRE(whole.has_value());
    CHECK(*late == *whole);
    CHECK(*early != *late);
}

TEST_CASE("PassphraseKdf derives the same key only for the same inputs")
{
    auto salt = PassphraseKdf::make_salt();
    REQUIRE(salt.has_value());

    auto a = PassphraseKdf::derive("correct horse", *salt);
    auto b = PassphraseKdf::derive("correct horse", *salt);
    auto c = PassphraseKdf::derive("battery staple", *salt);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(c.has_value());
    CHECK(a->size() == PassphraseKdf::key_len);
    CHECK(constant_time_equal(a->view(), b->view()));
    CHECK_FALSE(constant_time_equal(a->view(), c->view()));
}

TEST_CASE("SecretBytes wipe clears the buffer")
{
    std::array<uint8_t, 4> src{1, 2, 3, 4};
    SecretBytes secret(std::span<const uint8_t>(src));
    auto copy = secret.clone();

    secret.wipe();
    CHECK(secret.empty());
    CHECK(copy.size() == 4);
}

namespace
{

session::SessionKeys test_keys()
{
    session::SessionKeys keys;
    keys.client_write_key.fill(0x11);
    keys.server_write_key.fill(0x22);
    keys.client_write_iv.fill(0x33);
    keys.server_write_iv.fill(0x44);
    return keys;
}

} // namespace

TEST_CASE("SessionCipher client frames open on the server side")
{
    auto keys = test_keys();
    session::SessionCipher client(keys, session::SessionCipher::Role::Client);
    session::SessionCipher server(keys, session::SessionCipher::Role::Server);

    auto frame = client.seal(bytes::as_span("ping"), bytes::as_span("sid"));
    REQUIRE(frame.has_value());
    auto plain = server.open(*frame, bytes::as_span("sid"));
    REQUIRE(plain.has_value());
    CHECK(std::string(plain->begin(), plain->end()) == "ping");

    auto reply = server.seal(bytes::as_span("pong"));
    REQUIRE(reply.has_value());
    auto back = client.open(*reply);
    REQUIRE(back.has_value());
    CHECK(std::string(back->begin(), back->end()) == "pong");
}

TEST_CASE("SessionCipher rejects replayed and reflected frames")
{
    auto keys = test_keys();
    session::SessionCipher client(keys, session::SessionCipher::Role::Client);
    session::SessionCipher server(keys, session::SessionCipher::Role::Server);

    auto first = client.seal(bytes::as_span("one"));
    auto second = client.seal(bytes::as_span("two"));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    REQUIRE(server.open(*second).has_value());
    CHECK_FALSE(server.open(*first).has_value());
    CHECK_FALSE(server.open(*second).has_value());

    // A client frame bounced back to the client uses the wrong direction keys.
    auto third = client.seal(bytes::as_span("three"));
    REQUIRE(third.has_value());
    CHECK_FALSE(client.open(*third).has_value());
}

TEST_CASE("SessionCipher refuses to work after clear")
{
    session::SessionCipher cipher(test_keys(), session::SessionCipher::Role::Client);
    cipher.clear();
    CHECK_FALSE(cipher.seal(bytes::as_span("x")).has_value());
}
