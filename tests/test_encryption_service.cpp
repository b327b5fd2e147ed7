#include <doctest/doctest.h>
#include "hopmesh/encryption_service.hpp"

#include <string>

using namespace hopmesh;

namespace {

Bytes bytes_of(const std::string& s) { return Bytes(s.begin(), s.end()); }

struct Pair {
    ManualClock clock{0};
    KeyManager  alice_keys{clock};
    KeyManager  bob_keys{clock};
    EncryptionService alice{alice_keys};
    EncryptionService bob{bob_keys};
};

} // namespace

TEST_CASE("Private messages open at the recipient") {
    Pair p;
    std::string text;
    SUBCASE("empty") { text = ""; }
    SUBCASE("ascii") { text = "meet at the north gate"; }
    SUBCASE("multi-kilobyte non-ascii") {
        for (int i = 0; i < 800; ++i) text += "\xC3\xA9\xE2\x82\xAC";   // e-acute, euro sign
    }

    EncryptedMessage env;
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(),
                                            bytes_of(text), env) == CryptoResult::Ok);
    CHECK(env.nonce.size() == 12);
    CHECK(env.tag.size() == 16);
    REQUIRE(env.ephemeral_public);
    REQUIRE(env.signature);
    REQUIRE(env.signing_public);
    CHECK(*env.signing_public == p.alice_keys.identity_signing_public());

    Bytes plain;
    REQUIRE(p.bob.decrypt_private_message("alice", p.alice_keys.identity_signing_public(),
                                          env, plain) == CryptoResult::Ok);
    CHECK(std::string(plain.begin(), plain.end()) == text);
}

TEST_CASE("Each encryption draws a fresh nonce") {
    Pair p;
    EncryptedMessage a, b;
    const Bytes msg = bytes_of("same words");
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(), msg, a) == CryptoResult::Ok);
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(), msg, b) == CryptoResult::Ok);
    CHECK(a.nonce != b.nonce);
    CHECK(a.ciphertext != b.ciphertext);
}

TEST_CASE("Envelopes survive the wire form") {
    Pair p;
    EncryptedMessage env;
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(),
                                            bytes_of("over the air"), env) == CryptoResult::Ok);
    Bytes wire;
    env.serialize(wire);

    EncryptedMessage back;
    REQUIRE(EncryptedMessage::deserialize(wire.data(), wire.size(), back) == CryptoResult::Ok);
    Bytes plain;
    REQUIRE(p.bob.decrypt_private_message("alice", std::nullopt, back, plain) == CryptoResult::Ok);
    CHECK(std::string(plain.begin(), plain.end()) == "over the air");

    wire.pop_back();
    CHECK(EncryptedMessage::deserialize(wire.data(), wire.size(), back) == CryptoResult::MalformedEnvelope);
}

TEST_CASE("Tampering is caught before any plaintext comes out") {
    Pair p;
    EncryptedMessage env;
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(),
                                            bytes_of("pay 10"), env) == CryptoResult::Ok);
    Bytes plain{'x'};

    SUBCASE("ciphertext bit flip") {
        env.ciphertext[0] ^= 0x01;
        CHECK(p.bob.decrypt_private_message("alice", std::nullopt, env, plain) == CryptoResult::InvalidSignature);
    }
    SUBCASE("tag bit flip") {
        env.tag[3] ^= 0x80;
        CHECK(p.bob.decrypt_private_message("alice", std::nullopt, env, plain) == CryptoResult::InvalidSignature);
    }
    SUBCASE("signature removed") {
        env.signature.reset();
        CHECK(p.bob.decrypt_private_message("alice", std::nullopt, env, plain) == CryptoResult::InvalidSignature);
    }
    SUBCASE("signer differs from the pinned key") {
        CHECK(p.bob.decrypt_private_message("alice", p.bob_keys.identity_signing_public(), env, plain)
              == CryptoResult::InvalidSignature);
    }
    SUBCASE("ephemeral key missing") {
        env.ephemeral_public.reset();
        CHECK(p.bob.decrypt_private_message("alice", std::nullopt, env, plain) == CryptoResult::MissingEphemeralKey);
    }
    CHECK(plain == Bytes{'x'});
}

TEST_CASE("Only the intended recipient can open a private message") {
    Pair p;
    KeyManager eve_keys(p.clock);
    EncryptionService eve(eve_keys);

    EncryptedMessage env;
    REQUIRE(p.alice.encrypt_private_message("bob", p.bob_keys.identity_agreement_public(),
                                            bytes_of("for bob"), env) == CryptoResult::Ok);
    Bytes plain;
    CHECK(eve.decrypt_private_message("alice", std::nullopt, env, plain) == CryptoResult::DecryptFailed);
    CHECK(plain.empty());
}

TEST_CASE("Channel messages need the right password") {
    Pair p;
    REQUIRE(p.alice_keys.join_channel("#ops", "s3cret") == CryptoResult::Ok);

    EncryptedMessage env;
    REQUIRE(p.alice.encrypt_channel_message("#ops", bytes_of("status green"), env) == CryptoResult::Ok);
    CHECK_FALSE(env.ephemeral_public);

    Bytes plain;
    SUBCASE("not joined") {
        CHECK(p.bob.decrypt_channel_message("#ops", env, std::nullopt, plain) == CryptoResult::ChannelNotJoined);
    }
    SUBCASE("wrong password") {
        REQUIRE(p.bob_keys.join_channel("#ops", "guess") == CryptoResult::Ok);
        CHECK(p.bob.decrypt_channel_message("#ops", env, std::nullopt, plain) == CryptoResult::WrongChannelPassword);
    }
    SUBCASE("right password") {
        REQUIRE(p.bob_keys.join_channel("#ops", "s3cret") == CryptoResult::Ok);
        REQUIRE(p.bob.decrypt_channel_message("#ops", env, p.alice_keys.identity_signing_public(), plain)
                == CryptoResult::Ok);
        CHECK(std::string(plain.begin(), plain.end()) == "status green");
    }
}

TEST_CASE("Sending to a channel we have not joined fails") {
    Pair p;
    EncryptedMessage env;
    CHECK(p.alice.encrypt_channel_message("#nope", bytes_of("x"), env) == CryptoResult::ChannelNotJoined);
}
