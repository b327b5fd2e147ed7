// -----------------------------------------------------------------------------
// mesh_fixture.hpp: several Cores wired together over one LoopbackNetwork.
//
// Delivery is driven by settle() on the test thread, and time by the shared
// ManualClock, so scenarios are deterministic. Maintenance timers are set to
// an hour so they never fire during a test.
// -----------------------------------------------------------------------------
#ifndef HOPMESH_TESTS_MESH_FIXTURE_HPP
#define HOPMESH_TESTS_MESH_FIXTURE_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "hopmesh/clock.hpp"
#include "hopmesh/core.hpp"
#include "hopmesh/mesh_config.hpp"
#include "hopmesh/transport/loopback.hpp"

namespace hopmesh::testing {

inline MeshConfig quiet_config(uint8_t ttl = 7) {
    MeshConfig cfg;
    cfg.default_ttl               = ttl;
    cfg.cache_sweep_interval_ms   = 3600000;
    cfg.stale_sweep_interval_ms   = 3600000;
    cfg.connect_check_interval_ms = 3600000;
    return cfg;
}

struct TestNode {
    std::string                                   name;
    CompactId                                     id;
    std::shared_ptr<transport::LoopbackTransport> radio;
    std::unique_ptr<Core>                         core;
};

class TestMesh {
public:
    explicit TestMesh(MeshConfig cfg = quiet_config()) : cfg_(cfg) {}

    TestNode& add(const std::string& name, bool start = true) {
        return add(name, cfg_, start);
    }

    TestNode& add(const std::string& name, MeshConfig cfg, bool start = true) {
        cfg.nickname = name;
        const uint8_t raw[CompactId::SIZE] = {0xA0, 0x00, 0x00, 0x00, 0x00,
                                              static_cast<uint8_t>(nodes_.size() + 1)};
        TestNode n;
        n.name  = name;
        n.id    = CompactId(raw);
        n.radio = net.add_node(name);
        n.core  = std::make_unique<Core>(n.id, *n.radio, cfg, clock);

        PeerDescriptor adv;
        adv.sender_id = n.id;
        adv.nickname  = name;
        net.set_advertisement(name, adv);
        net.attach(name, n.core.get());
        if (start) n.core->start();
        return nodes_.emplace(name, std::move(n)).first->second;
    }

    TestNode& node(const std::string& name) { return nodes_.at(name); }
    Core&     core(const std::string& name) { return *nodes_.at(name).core; }
    CompactId id(const std::string& name) const { return nodes_.at(name).id; }

    /// Link a-b, b-c, ... in order.
    void chain(const std::vector<std::string>& names) {
        for (size_t i = 0; i + 1 < names.size(); ++i) net.link(names[i], names[i + 1]);
        settle();
    }

    size_t settle() { return net.pump_until_idle(); }

    /// Every node floods its keys, so everybody knows everybody.
    void announce_all() {
        for (auto& kv : nodes_) kv.second.core->announce();
        settle();
    }

    std::vector<InboundMessage> messages(const std::string& name) {
        std::vector<InboundMessage> out;
        InboundMessage m;
        while (core(name).next_message(m)) out.push_back(m);
        return out;
    }

    std::vector<MeshEvent> mesh_events(const std::string& name) {
        std::vector<MeshEvent> out;
        MeshEvent e;
        while (core(name).next_mesh_event(e)) out.push_back(e);
        return out;
    }

    static bool has_event(const std::vector<MeshEvent>& events, MeshEvent::Kind kind) {
        for (const auto& e : events) {
            if (e.kind == kind) return true;
        }
        return false;
    }

    ManualClock                  clock{1000};
    transport::LoopbackNetwork   net;

private:
    MeshConfig                       cfg_;
    std::map<std::string, TestNode>  nodes_;
};

} // namespace hopmesh::testing

#endif // HOPMESH_TESTS_MESH_FIXTURE_HPP
