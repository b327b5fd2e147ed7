#include <doctest/doctest.h>
#include "mesh_fixture.hpp"
#include "hopmesh/payloads.hpp"

#include <atomic>
#include <memory>
#include <set>
#include <thread>
#include <utility>

using namespace hopmesh;
using hopmesh::testing::TestMesh;
using hopmesh::testing::quiet_config;

// ---------- lifecycle ----------

TEST_CASE("A stopped core refuses to send or connect") {
    TestMesh mesh;
    mesh.add("A", false);
    Core& a = mesh.core("A");

    CHECK_FALSE(a.running());
    CHECK(a.send_public("x") == SendResult::NotRunning);
    CHECK(a.announce() == SendResult::NotRunning);
    CHECK(a.connect(mesh.id("A")) == ConnectResult::InvalidState);

    REQUIRE(a.start());
    CHECK(a.start());   // idempotent
    CHECK(a.running());
    CHECK(TestMesh::has_event(mesh.mesh_events("A"), MeshEvent::Kind::MeshStarted));
}

TEST_CASE("An invalid config is refused at start") {
    TestMesh mesh;
    MeshConfig cfg = quiet_config();
    cfg.cache_capacity = 0;
    mesh.add("A", cfg, false);

    CHECK_FALSE(mesh.core("A").start());
    CHECK_FALSE(mesh.core("A").running());
    const auto events = mesh.mesh_events("A");
    REQUIRE(events.size() == 1);
    CHECK(events[0].kind == MeshEvent::Kind::Error);
    CHECK(events[0].text.find("cache_capacity") != std::string::npos);
}

TEST_CASE("Stopping drops every link") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C"}) mesh.add(n);
    mesh.chain({"A", "B", "C"});
    REQUIRE(mesh.net.linked("A", "B"));

    mesh.core("B").stop();
    mesh.settle();
    CHECK_FALSE(mesh.net.linked("A", "B"));
    CHECK_FALSE(mesh.net.linked("B", "C"));
    CHECK(mesh.core("B").connected_peers().empty());
    CHECK(mesh.core("A").connected_peers().empty());
    CHECK(TestMesh::has_event(mesh.mesh_events("B"), MeshEvent::Kind::MeshStopped));
}

TEST_CASE("Sending with no links is not an error") {
    TestMesh mesh;
    mesh.add("A");
    int64_t id = 0;
    CHECK(mesh.core("A").send_public("anyone?", &id) == SendResult::Ok);
    CHECK(id != 0);
    CHECK(mesh.core("A").stats().sent == 1);
}

TEST_CASE("Oversized payloads are refused") {
    TestMesh mesh;
    mesh.add("A");
    CHECK(mesh.core("A").send_public(std::string(MessageHeader::MAX_PAYLOAD + 1, 'x')) == SendResult::PayloadTooLarge);
    CHECK(mesh.core("A").stats().sent == 0);
}

// ---------- handshake ----------

TEST_CASE("Linking binds each link to the announced sender") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.chain({"A", "B"});

    auto b_at_a = mesh.core("A").find_peer(mesh.id("B"));
    REQUIRE(b_at_a);
    CHECK(b_at_a->state == ConnectionState::Connected);
    CHECK(b_at_a->connection_id == "B");
    CHECK(b_at_a->nickname == "B");
    CHECK(mesh.core("A").keys().get_peer_public_key(mesh.id("B").str()));

    bool identified = false;
    PeerEvent ev;
    while (mesh.core("A").next_peer_event(ev)) {
        if (ev.kind == PeerEvent::Kind::Identified) identified = true;
    }
    CHECK(identified);
}

TEST_CASE("Outbound connect to a discovered peer") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.net.advertise("B");
    mesh.settle();

    auto seen = mesh.core("A").find_peer(mesh.id("B"));
    REQUIRE(seen);
    CHECK(seen->state == ConnectionState::Discovered);

    CHECK(mesh.core("A").connect(mesh.id("B")) == ConnectResult::Ok);
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Connecting);
    mesh.settle();
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Connected);

    CHECK(mesh.core("A").disconnect(mesh.id("B")));
    mesh.settle();
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Disconnected);
    CHECK_FALSE(mesh.core("A").disconnect(mesh.id("B")));
}

TEST_CASE("Connect to a peer out of range fails cleanly") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.net.advertise("B");
    mesh.settle();
    mesh.net.set_in_range("A", "B", false);

    CHECK(mesh.core("A").connect(mesh.id("B")) == ConnectResult::TransportError);
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Disconnected);
    const uint8_t raw[CompactId::SIZE] = {7, 7, 7, 7, 7, 7};
    CHECK(mesh.core("A").connect(CompactId(raw)) == ConnectResult::UnknownPeer);
}

// ---------- private and channel ----------

TEST_CASE("A private message reaches only its recipient") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C", "D"}) mesh.add(n);
    mesh.chain({"A", "B", "C", "D"});
    mesh.announce_all();

    int64_t id = 0;
    REQUIRE(mesh.core("A").send_private(mesh.id("D"), "the key is under the mat", &id) == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").empty());
    CHECK(mesh.messages("C").empty());
    const auto at_d = mesh.messages("D");
    REQUIRE(at_d.size() == 1);
    CHECK(at_d[0].type == MessageType::Private);
    CHECK(at_d[0].encrypted);
    CHECK(at_d[0].text() == "the key is under the mat");
    CHECK(at_d[0].message_id == id);
    CHECK(at_d[0].sender_id == mesh.id("A"));
    CHECK(mesh.core("B").stats().forwarded >= 1);
}

TEST_CASE("Private sends need the recipient's announced keys") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    const uint8_t raw[CompactId::SIZE] = {9, 9, 9, 9, 9, 9};
    CHECK(mesh.core("A").send_private(CompactId(raw), "hi") == SendResult::UnknownRecipient);
    CHECK(mesh.core("A").send_private(mesh.id("A"), "me") == SendResult::UnknownRecipient);
}

TEST_CASE("A private message with a forged signer is dropped") {
    TestMesh mesh;
    for (const char* n : {"A", "B"}) mesh.add(n);
    mesh.chain({"A", "B"});

    // B pins A's real signing key; a different key now claims to be A.
    KeyManager forger_keys(mesh.clock);
    EncryptionService forger(forger_keys);
    EncryptedMessage env;
    REQUIRE(forger.encrypt_private_message(mesh.id("B").str(),
                                           mesh.core("B").keys().identity_agreement_public(),
                                           Bytes{'p', 'w', 'n'}, env) == CryptoResult::Ok);
    PrivatePayload body;
    body.recipient = mesh.id("B");
    env.serialize(body.envelope);
    std::vector<uint8_t> payload;
    encode_private(body, payload);

    MessageHeader hdr(MessageType::Private, 7, 0, generate_message_id(), mesh.id("A"),
                      static_cast<uint16_t>(payload.size()));
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, payload, frame));
    mesh.core("B").on_bytes_received("A", frame);

    CHECK(mesh.messages("B").empty());
    CHECK(mesh.core("B").stats().crypto_failures == 1);
    CHECK(TestMesh::has_event(mesh.mesh_events("B"), MeshEvent::Kind::MessageDropped));
}

TEST_CASE("Channel traffic is readable by members and relayed by everyone") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C", "D"}) mesh.add(n);
    mesh.chain({"A", "B", "C", "D"});
    mesh.announce_all();

    REQUIRE(mesh.core("A").join_channel("#ops", "s3cret") == CryptoResult::Ok);
    REQUIRE(mesh.core("D").join_channel("#ops", "s3cret") == CryptoResult::Ok);
    CHECK(mesh.core("A").joined_channels() == (std::vector<std::string>{"#ops"}));

    REQUIRE(mesh.core("A").send_channel("#ops", "status green") == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").empty());
    CHECK(mesh.messages("C").empty());
    const auto at_d = mesh.messages("D");
    REQUIRE(at_d.size() == 1);
    CHECK(at_d[0].type == MessageType::Channel);
    CHECK(at_d[0].channel == "#ops");
    CHECK(at_d[0].text() == "status green");
    CHECK(at_d[0].encrypted);
}

TEST_CASE("A member with the wrong password sees a dropped message") {
    TestMesh mesh;
    for (const char* n : {"A", "B"}) mesh.add(n);
    mesh.chain({"A", "B"});
    REQUIRE(mesh.core("A").join_channel("#ops", "right") == CryptoResult::Ok);
    REQUIRE(mesh.core("B").join_channel("#ops", "wrong") == CryptoResult::Ok);

    REQUIRE(mesh.core("A").send_channel("#ops", "hello") == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").empty());
    CHECK(mesh.core("B").stats().crypto_failures == 1);
    CHECK(TestMesh::has_event(mesh.mesh_events("B"), MeshEvent::Kind::MessageDropped));
}

TEST_CASE("Channel membership is required to send") {
    TestMesh mesh;
    mesh.add("A");
    CHECK(mesh.core("A").send_channel("#ops", "x") == SendResult::ChannelNotJoined);
    CHECK(mesh.core("A").join_channel("", "pw") == CryptoResult::MissingKeyMaterial);
    CHECK(mesh.core("A").join_channel(std::string(256, 'c'), "pw") == CryptoResult::MissingKeyMaterial);

    REQUIRE(mesh.core("A").join_channel("#ops", "pw") == CryptoResult::Ok);
    CHECK(mesh.core("A").leave_channel("#ops"));
    CHECK(mesh.core("A").send_channel("#ops", "x") == SendResult::ChannelNotJoined);
}

// ---------- blocking ----------

TEST_CASE("Blocking a neighbour drops its link and keeps it out") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.chain({"A", "B"});

    CHECK(mesh.core("A").block(mesh.id("B")));
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->is_blocked);
    mesh.settle();
    CHECK_FALSE(mesh.net.linked("A", "B"));

    // B dials back in; A turns it away.
    CHECK(mesh.core("B").connect(mesh.id("A")) == ConnectResult::Ok);
    mesh.settle();
    CHECK_FALSE(mesh.net.linked("A", "B"));
    CHECK(mesh.core("A").connect(mesh.id("B")) == ConnectResult::Blocked);

    CHECK(mesh.core("A").unblock(mesh.id("B")));
    CHECK(mesh.core("A").connect(mesh.id("B")) == ConnectResult::Ok);
    mesh.settle();
    CHECK(mesh.net.linked("A", "B"));
}

TEST_CASE("Traffic from a blocked origin is dropped even when relayed") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C"}) mesh.add(n);
    mesh.chain({"A", "B", "C"});
    mesh.announce_all();

    mesh.core("A").block(mesh.id("C"));
    REQUIRE(mesh.core("C").send_public("let me in") == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").size() == 1);
    CHECK(mesh.messages("A").empty());
    CHECK(mesh.core("A").stats().blocked_dropped == 1);
    CHECK(mesh.net.linked("A", "B"));   // the relay is not punished
}

// ---------- capacity and timeouts ----------

TEST_CASE("Links over the connection cap are turned away") {
    TestMesh mesh;
    MeshConfig tight = quiet_config();
    tight.max_connections = 1;
    mesh.add("H", tight);
    mesh.add("A");
    mesh.add("B");

    mesh.net.link("H", "A");
    mesh.settle();
    mesh.net.link("H", "B");
    mesh.settle();

    CHECK(mesh.net.linked("H", "A"));
    CHECK_FALSE(mesh.net.linked("H", "B"));
    CHECK(mesh.core("H").connected_peers().size() == 1);
    CHECK(TestMesh::has_event(mesh.mesh_events("H"), MeshEvent::Kind::CapacityExceeded));
}

TEST_CASE("Outbound connects are capped too") {
    TestMesh mesh;
    MeshConfig tight = quiet_config();
    tight.max_connections = 1;
    mesh.add("H", tight);
    mesh.add("A");
    mesh.add("B");
    mesh.net.advertise("A");
    mesh.net.advertise("B");
    mesh.settle();

    CHECK(mesh.core("H").connect(mesh.id("A")) == ConnectResult::Ok);
    CHECK(mesh.core("H").connect(mesh.id("B")) == ConnectResult::CapacityExceeded);
    CHECK(TestMesh::has_event(mesh.mesh_events("H"), MeshEvent::Kind::CapacityExceeded));
}

TEST_CASE("A connect that never completes times out") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.net.advertise("B");
    mesh.settle();

    REQUIRE(mesh.core("A").connect(mesh.id("B")) == ConnectResult::Ok);
    const uint64_t timeout = mesh.core("A").config().connection_timeout_ms;

    mesh.clock.advance(timeout);
    CHECK(mesh.core("A").enforce_connect_timeouts() == 0);
    mesh.clock.advance(1);
    CHECK(mesh.core("A").enforce_connect_timeouts() == 1);
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Disconnected);

    const auto events = mesh.mesh_events("A");
    bool timed_out = false;
    for (const auto& e : events) {
        if (e.kind == MeshEvent::Kind::ConnectionTimeout) {
            timed_out = true;
            REQUIRE(e.peer);
            CHECK(*e.peer == mesh.id("B"));
        }
    }
    CHECK(timed_out);

    mesh.settle();
    CHECK_FALSE(mesh.net.linked("A", "B"));
}

TEST_CASE("Peers unseen for too long are forgotten") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.net.advertise("B");
    mesh.settle();
    REQUIRE(mesh.core("A").find_peer(mesh.id("B")));

    mesh.clock.advance(mesh.core("A").config().stale_peer_timeout_ms + 1);
    CHECK(mesh.core("A").sweep_stale_peers() == 1);
    CHECK_FALSE(mesh.core("A").find_peer(mesh.id("B")));
}

// ---------- transport failures ----------

TEST_CASE("Lost frames are reported as send failures") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.chain({"A", "B"});
    mesh.mesh_events("A");

    mesh.net.set_send_failure("A", "B", true);
    REQUIRE(mesh.core("A").send_public("into the void") == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").empty());
    CHECK(mesh.core("A").stats().send_failures == 1);
    const auto events = mesh.mesh_events("A");
    REQUIRE(TestMesh::has_event(events, MeshEvent::Kind::SendFailed));
}

// ---------- concurrency ----------

TEST_CASE("Concurrent senders and pumps deliver every message once") {
    TestMesh mesh;
    const std::vector<std::string> names = {"A", "B", "C", "D"};
    for (const auto& n : names) mesh.add(n);
    mesh.chain({"A", "B", "C", "D", "A"});

    constexpr int PER_NODE = 20;
    std::atomic<bool> sending{true};
    std::vector<std::thread> pumps;
    for (int i = 0; i < 3; ++i) {
        pumps.emplace_back([&] {
            while (sending.load()) {
                if (mesh.net.pump() == 0) std::this_thread::yield();
            }
        });
    }

    std::vector<std::thread> senders;
    for (const auto& n : names) {
        senders.emplace_back([&mesh, n] {
            for (int k = 0; k < PER_NODE; ++k) {
                mesh.core(n).send_public(n + "-" + std::to_string(k));
            }
        });
    }
    for (auto& t : senders) t.join();
    sending.store(false);
    for (auto& t : pumps) t.join();
    mesh.settle();

    for (const auto& n : names) {
        const auto got = mesh.messages(n);
        std::set<std::pair<std::string, int64_t>> unique;
        for (const auto& m : got) unique.emplace(m.sender_id.str(), m.message_id);
        CHECK_MESSAGE(got.size() == PER_NODE * 3, "node " << n);
        CHECK(unique.size() == got.size());
    }
}

// ---------- pinned keys and the sender directory ----------

namespace {

CompactId stranger(uint8_t n) {
    const uint8_t raw[CompactId::SIZE] = {0xF0, 0x00, 0x00, 0x00, 0x00, n};
    return CompactId(raw);
}

std::vector<uint8_t> announcement_frame(const CompactId& sender, const std::string& nickname,
                                        const KeyManager& keys, uint8_t hop_count) {
    AnnouncementPayload a;
    a.nickname         = nickname;
    a.agreement_public = keys.identity_agreement_public();
    a.signing_public   = keys.identity_signing_public();
    std::vector<uint8_t> payload;
    REQUIRE(encode_announcement(a, payload));

    MessageHeader hdr(MessageType::PeerAnnouncement, static_cast<uint8_t>(7 - hop_count), hop_count,
                      generate_message_id(), sender, static_cast<uint16_t>(payload.size()));
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, payload, frame));
    return frame;
}

std::vector<uint8_t> public_frame(const CompactId& sender, const std::string& text) {
    const std::vector<uint8_t> payload(text.begin(), text.end());
    MessageHeader hdr(MessageType::Public, 7, 1, generate_message_id(), sender,
                      static_cast<uint16_t>(payload.size()));
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, payload, frame));
    return frame;
}

} // namespace

TEST_CASE("A relayed announcement cannot replace a sender's pinned keys") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C"}) mesh.add(n);
    mesh.chain({"A", "B", "C"});
    mesh.announce_all();

    Core& b = mesh.core("B");
    const auto real = b.keys().get_peer_public_key(mesh.id("A").str());
    REQUIRE(real);
    const uint64_t forwarded_before = b.stats().forwarded;
    mesh.mesh_events("B");

    // C's side of the mesh claims to be A with someone else's keys.
    KeyManager mallory(mesh.clock);
    uint8_t hop = 1;
    SUBCASE("relayed") { hop = 1; }
    SUBCASE("straight off a link") { hop = 0; }
    b.on_bytes_received("C", announcement_frame(mesh.id("A"), "A-prime", mallory, hop));

    const auto held = b.keys().get_peer_public_key(mesh.id("A").str());
    REQUIRE(held);
    CHECK(held->agreement == real->agreement);
    REQUIRE(held->signing);
    CHECK(*held->signing == *real->signing);
    CHECK(b.stats().crypto_failures == 1);
    CHECK(b.stats().forwarded == forwarded_before);
    CHECK(TestMesh::has_event(mesh.mesh_events("B"), MeshEvent::Kind::MessageDropped));

    // Neither the nickname nor the link binding moved.
    CHECK(b.find_peer(mesh.id("A"))->nickname == "A");
    CHECK(b.find_peer(mesh.id("A"))->connection_id == "A");
    CHECK(b.find_peer(mesh.id("C"))->connection_id == "C");

    // Genuine traffic still flows both ways.
    REQUIRE(mesh.core("A").send_private(mesh.id("B"), "still me") == SendResult::Ok);
    REQUIRE(b.send_private(mesh.id("A"), "got it") == SendResult::Ok);
    mesh.settle();
    const auto at_b = mesh.messages("B");
    REQUIRE(at_b.size() == 1);
    CHECK(at_b[0].text() == "still me");
    const auto at_a = mesh.messages("A");
    REQUIRE(at_a.size() == 1);
    CHECK(at_a[0].text() == "got it");
}

TEST_CASE("The sender directory is capped and keeps linked senders") {
    MeshConfig cfg = quiet_config();
    cfg.max_known_senders = 3;
    TestMesh mesh(cfg);
    mesh.add("A");
    mesh.add("B");
    mesh.chain({"A", "B"});

    Core& b = mesh.core("B");
    REQUIRE(b.known_sender_count() == 1);   // A, from the link handshake

    std::vector<std::unique_ptr<KeyManager>> strangers;
    for (uint8_t i = 0; i < 5; ++i) {
        strangers.push_back(std::make_unique<KeyManager>(mesh.clock));
        mesh.clock.advance(1);
        b.on_bytes_received("A", announcement_frame(stranger(i), "s", *strangers.back(), 1));
    }

    CHECK(b.known_sender_count() == 3);
    CHECK(b.keys().peer_key_count() == 3);
    CHECK(b.keys().get_peer_public_key(mesh.id("A").str()));
    CHECK_FALSE(b.keys().get_peer_public_key(stranger(0).str()));
    CHECK_FALSE(b.keys().get_peer_public_key(stranger(2).str()));
    CHECK(b.keys().get_peer_public_key(stranger(3).str()));
    CHECK(b.keys().get_peer_public_key(stranger(4).str()));
}

TEST_CASE("Silent senders are forgotten by the stale sweep") {
    MeshConfig cfg = quiet_config();
    cfg.known_sender_timeout_ms = 10000;
    TestMesh mesh(cfg);
    mesh.add("A");
    mesh.add("B");
    mesh.chain({"A", "B"});
    Core& b = mesh.core("B");

    KeyManager quiet(mesh.clock), chatty(mesh.clock);
    b.on_bytes_received("A", announcement_frame(stranger(1), "quiet", quiet, 1));
    b.on_bytes_received("A", announcement_frame(stranger(2), "chatty", chatty, 1));
    REQUIRE(b.known_sender_count() == 3);

    std::shared_ptr<const SessionKeys> s;
    REQUIRE(b.keys().get_session_keys(stranger(1).str(), quiet.identity_agreement_public(), s) == CryptoResult::Ok);

    mesh.clock.advance(6000);
    b.on_bytes_received("A", public_frame(stranger(2), "still here"));
    mesh.clock.advance(4001);
    b.sweep_stale_peers();

    CHECK_FALSE(b.keys().get_peer_public_key(stranger(1).str()));
    CHECK(b.keys().session_state(stranger(1).str()) == SessionState::NoSession);
    CHECK(b.keys().get_peer_public_key(stranger(2).str()));
    CHECK(b.keys().get_peer_public_key(mesh.id("A").str()));   // linked, kept while silent
    CHECK(b.known_sender_count() == 2);

    // A forgotten sender can announce itself afresh.
    b.on_bytes_received("A", announcement_frame(stranger(1), "quiet", quiet, 1));
    CHECK(b.keys().get_peer_public_key(stranger(1).str()));
}

TEST_CASE("Connecting by link id needs an identified link") {
    TestMesh mesh;
    mesh.add("A");
    mesh.add("B");
    mesh.add("C", false);
    CHECK(mesh.core("C").connect_link("A") == ConnectResult::InvalidState);

    PeerDescriptor anonymous;
    anonymous.nickname = "B";
    mesh.net.set_advertisement("B", anonymous);
    mesh.net.advertise("B");
    mesh.settle();

    CHECK(mesh.core("A").connect_link("B") == ConnectResult::NoSenderId);
    CHECK(mesh.core("A").connect_link("nowhere") == ConnectResult::UnknownPeer);
    CHECK_FALSE(mesh.net.linked("A", "B"));

    PeerDescriptor named;
    named.sender_id = mesh.id("B");
    named.nickname  = "B";
    mesh.net.set_advertisement("B", named);
    mesh.net.advertise("B");
    mesh.settle();

    CHECK(mesh.core("A").connect_link("B") == ConnectResult::Ok);
    mesh.settle();
    CHECK(mesh.net.linked("A", "B"));
    CHECK(mesh.core("A").find_peer(mesh.id("B"))->state == ConnectionState::Connected);
}
