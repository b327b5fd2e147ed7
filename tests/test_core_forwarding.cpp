#include <doctest/doctest.h>
#include "mesh_fixture.hpp"
#include "hopmesh/message_header.hpp"

#include <set>
#include <utility>

using namespace hopmesh;
using hopmesh::testing::TestMesh;
using hopmesh::testing::quiet_config;

TEST_CASE("A public message crosses a line of four, losing one ttl per hop") {
    TestMesh mesh(quiet_config(3));
    for (const char* n : {"A", "B", "C", "D"}) mesh.add(n);
    mesh.chain({"A", "B", "C", "D"});
    mesh.announce_all();

    int64_t id = 0;
    REQUIRE(mesh.core("A").send_public("hello mesh", &id) == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("A").empty());   // no echo back to the origin

    const auto at_b = mesh.messages("B");
    REQUIRE(at_b.size() == 1);
    CHECK(at_b[0].text() == "hello mesh");
    CHECK(at_b[0].message_id == id);
    CHECK(at_b[0].sender_id == mesh.id("A"));
    CHECK(at_b[0].ttl == 3);
    CHECK(at_b[0].hop_count == 0);
    CHECK(at_b[0].forwarded);
    CHECK(at_b[0].via_connection == "A");

    const auto at_c = mesh.messages("C");
    REQUIRE(at_c.size() == 1);
    CHECK(at_c[0].ttl == 2);
    CHECK(at_c[0].hop_count == 1);
    CHECK(at_c[0].forwarded);

    const auto at_d = mesh.messages("D");
    REQUIRE(at_d.size() == 1);
    CHECK(at_d[0].ttl == 1);
    CHECK(at_d[0].hop_count == 2);
    CHECK_FALSE(at_d[0].forwarded);
    CHECK(at_d[0].sender_nickname == "A");

    CHECK(mesh.core("D").stats().ttl_exhausted >= 1);
    CHECK(mesh.core("A").stats().sent >= 1);
}

TEST_CASE("A message dies when its ttl runs out") {
    TestMesh mesh(quiet_config(2));
    for (const char* n : {"A", "B", "C", "D"}) mesh.add(n);
    mesh.chain({"A", "B", "C", "D"});

    REQUIRE(mesh.core("A").send_public("short range") == SendResult::Ok);
    mesh.settle();

    CHECK(mesh.messages("B").size() == 1);
    CHECK(mesh.messages("C").size() == 1);
    CHECK(mesh.messages("D").empty());
}

TEST_CASE("Every node in a ring surfaces a message exactly once") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C", "D", "E"}) mesh.add(n);
    mesh.chain({"A", "B", "C", "D", "E", "A"});
    mesh.announce_all();

    const auto before = mesh.core("A").stats();
    REQUIRE(mesh.core("C").send_public("round and round") == SendResult::Ok);
    mesh.settle();

    uint64_t duplicates = 0;
    for (const char* n : {"A", "B", "D", "E"}) {
        const auto got = mesh.messages(n);
        CHECK_MESSAGE(got.size() == 1, "node " << n);
        duplicates += mesh.core(n).stats().duplicates;
    }
    CHECK(mesh.messages("C").empty());
    CHECK(duplicates > 0);   // the two flood fronts meet somewhere
    CHECK(mesh.core("A").stats().received == before.received + 1);
}

TEST_CASE("A fully connected mesh still delivers once per node") {
    TestMesh mesh;
    const std::vector<std::string> names = {"A", "B", "C", "D"};
    for (const auto& n : names) mesh.add(n);
    for (size_t i = 0; i < names.size(); ++i) {
        for (size_t j = i + 1; j < names.size(); ++j) mesh.net.link(names[i], names[j]);
    }
    mesh.settle();

    for (int k = 0; k < 5; ++k) {
        REQUIRE(mesh.core("B").send_public("burst " + std::to_string(k)) == SendResult::Ok);
    }
    mesh.settle();

    for (const char* n : {"A", "C", "D"}) {
        const auto got = mesh.messages(n);
        REQUIRE(got.size() == 5);
        std::set<int64_t> ids;
        for (const auto& m : got) ids.insert(m.message_id);
        CHECK(ids.size() == 5);
    }
}

TEST_CASE("Frames of unknown type are relayed but not surfaced") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C"}) mesh.add(n);
    mesh.chain({"A", "B", "C"});

    const uint8_t stranger_raw[CompactId::SIZE] = {0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE};
    MessageHeader hdr(MessageType::Public, 5, 0, 4242, CompactId(stranger_raw), 3);
    hdr.type = 0x7E;
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, {1, 2, 3}, frame));

    const uint64_t forwarded_before = mesh.core("B").stats().forwarded;
    mesh.core("B").on_bytes_received("A", frame);
    mesh.settle();

    CHECK(mesh.core("B").stats().forwarded == forwarded_before + 1);
    CHECK(mesh.messages("B").empty());
    CHECK(mesh.messages("C").empty());
    CHECK(mesh.core("C").cache().contains(CompactId(stranger_raw), 4242));
}

TEST_CASE("Frames carrying our own sender id are dropped") {
    TestMesh mesh;
    mesh.add("A");
    MessageHeader hdr(MessageType::Public, 5, 2, 77, mesh.id("A"), 2);
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, {'h', 'i'}, frame));

    mesh.core("A").on_bytes_received("ghost", frame);
    CHECK(mesh.messages("A").empty());
    CHECK(mesh.core("A").stats().duplicates == 1);
}

TEST_CASE("Malformed frames are counted and go nowhere") {
    TestMesh mesh;
    for (const char* n : {"A", "B", "C"}) mesh.add(n);
    mesh.chain({"A", "B", "C"});
    const uint64_t frames_before = mesh.net.frames_sent();

    SUBCASE("short header") {
        mesh.core("B").on_bytes_received("A", {0x01, 0x01, 0x07});
    }
    SUBCASE("truncated payload") {
        const uint8_t raw[CompactId::SIZE] = {1, 1, 1, 1, 1, 1};
        MessageHeader hdr(MessageType::Public, 5, 0, 1, CompactId(raw), 10);
        std::vector<uint8_t> frame(MessageHeader::SIZE);
        hdr.pack(frame.data());
        frame.push_back('x');
        mesh.core("B").on_bytes_received("A", frame);
    }
    SUBCASE("announcement with a bad body") {
        const uint8_t raw[CompactId::SIZE] = {2, 2, 2, 2, 2, 2};
        MessageHeader hdr(MessageType::PeerAnnouncement, 5, 0, 2, CompactId(raw), 3);
        std::vector<uint8_t> frame;
        REQUIRE(encode_frame(hdr, {9, 'a', 'b'}, frame));
        mesh.core("B").on_bytes_received("A", frame);
    }
    SUBCASE("private body shorter than a recipient id") {
        const uint8_t raw[CompactId::SIZE] = {3, 3, 3, 3, 3, 3};
        MessageHeader hdr(MessageType::Private, 5, 0, 3, CompactId(raw), 4);
        std::vector<uint8_t> frame;
        REQUIRE(encode_frame(hdr, {1, 2, 3, 4}, frame));
        mesh.core("B").on_bytes_received("A", frame);
    }
    mesh.settle();

    CHECK(mesh.core("B").stats().malformed == 1);
    CHECK(mesh.net.frames_sent() == frames_before);
    CHECK(mesh.messages("B").empty());
    CHECK(mesh.messages("C").empty());
    CHECK(mesh.net.linked("A", "B"));
}

TEST_CASE("A message seen again after the cache window is treated as new") {
    TestMesh mesh;
    mesh.add("A");
    const uint8_t raw[CompactId::SIZE] = {5, 5, 5, 5, 5, 5};
    MessageHeader hdr(MessageType::Public, 1, 0, 99, CompactId(raw), 1);
    std::vector<uint8_t> frame;
    REQUIRE(encode_frame(hdr, {'!'}, frame));

    mesh.core("A").on_bytes_received("x", frame);
    mesh.core("A").on_bytes_received("x", frame);
    CHECK(mesh.messages("A").size() == 1);

    mesh.clock.advance(mesh.core("A").config().cache_expiration_ms + 1);
    CHECK(mesh.core("A").sweep_cache() == 1);
    mesh.core("A").on_bytes_received("x", frame);
    CHECK(mesh.messages("A").size() == 1);
}
