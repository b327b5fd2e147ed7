/**
 * @file main.cpp
 * @brief hopmesh-sim: N HopMesh nodes on an in-process loopback radio.
 *
 * Responsibilities:
 *  - Parse options (CLI11): node count, topology, what to send and from where.
 *  - Build one Core per node on a LoopbackNetwork, link them, let them announce.
 *  - Send one message, pump delivery until the network is quiet (optionally one
 *    pumping thread per node), then report what every node saw.
 *
 * Notes:
 *  - Nodes are named n0..n{N-1}; those names are also their connection ids.
 *  - --format json prints one document (nlohmann/json); pretty prints a table.
 *  - Exit codes: 0 ok, 1 send refused, 2 bad arguments.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "hopmesh/clock.hpp"
#include "hopmesh/core.hpp"
#include "hopmesh/device_id.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/mesh_config.hpp"
#include "hopmesh/state_store.hpp"
#include "hopmesh/transport/loopback.hpp"

using json = nlohmann::json;
using namespace hopmesh;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static std::string node_name(size_t i) { return "n" + std::to_string(i); }

struct SimNode {
  std::string                                   name;
  MemoryStateStore                              store;
  CompactId                                     id;
  std::shared_ptr<transport::LoopbackTransport> radio;
  std::unique_ptr<Core>                         core;

  // What this node surfaced for the probe message.
  bool    surfaced{false};
  uint8_t ttl_seen{0};
  uint8_t hop_seen{0};
  bool    relayed{false};
  std::string text_seen;
};

static std::vector<std::pair<size_t, size_t>> topology_links(const std::string& topo, size_t n) {
  std::vector<std::pair<size_t, size_t>> links;
  if (topo == "line" || topo == "ring") {
    for (size_t i = 0; i + 1 < n; ++i) links.emplace_back(i, i + 1);
    if (topo == "ring" && n > 2) links.emplace_back(n - 1, 0);
  } else if (topo == "full") {
    for (size_t i = 0; i < n; ++i)
      for (size_t j = i + 1; j < n; ++j) links.emplace_back(i, j);
  } else if (topo == "star") {
    for (size_t i = 1; i < n; ++i) links.emplace_back(0, i);
  }
  return links;
}

// One pumping thread per node; the main thread decides when the air is quiet.
static void pump_threaded(transport::LoopbackNetwork& net, const std::vector<SimNode>& nodes) {
  std::atomic<bool> done{false};
  std::atomic<int>  busy{0};
  std::vector<std::thread> workers;
  for (const SimNode& n : nodes) {
    const std::string name = n.name;
    workers.emplace_back([&net, &done, &busy, name] {
      while (!done.load()) {
        ++busy;
        const size_t delivered = net.pump_node(name);
        --busy;
        if (delivered == 0) std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
    });
  }

  int quiet_checks = 0;
  while (quiet_checks < 5) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    size_t pending = 0;
    for (const SimNode& n : nodes) pending += net.pending(n.name);
    quiet_checks = (pending == 0 && busy.load() == 0) ? quiet_checks + 1 : 0;
  }
  done.store(true);
  for (auto& w : workers) w.join();
}

static void settle(transport::LoopbackNetwork& net, const std::vector<SimNode>& nodes, bool threaded) {
  if (threaded) {
    pump_threaded(net, nodes);
  } else {
    net.pump_until_idle();
  }
}

static json stats_json(const MeshStats& s) {
  json j;
  j["sent"]            = s.sent;
  j["received"]        = s.received;
  j["forwarded"]       = s.forwarded;
  j["duplicates"]      = s.duplicates;
  j["cache_misses"]    = s.cache_misses;
  j["ttl_exhausted"]   = s.ttl_exhausted;
  j["malformed"]       = s.malformed;
  j["crypto_failures"] = s.crypto_failures;
  j["blocked_dropped"] = s.blocked_dropped;
  j["send_failures"]   = s.send_failures;
  return j;
}

// ---------- main ----------

int main(int argc, char** argv) {
  size_t      opt_nodes     = 4;
  std::string opt_topology  = "line";
  int         opt_ttl       = -1;          // -1 => config default
  size_t      opt_from      = 0;
  std::string opt_message   = "hello mesh";
  int         opt_private   = -1;
  std::string opt_channel;
  std::string opt_password;
  std::string opt_config;
  std::string opt_format    = "pretty";
  bool        opt_no_color  = false;
  bool        opt_threads   = false;
  bool        opt_verbose   = false;

  CLI::App app{"HopMesh loopback simulator"};
  app.add_option("--nodes", opt_nodes, "Number of nodes")->check(CLI::Range(size_t{2}, size_t{64}));
  app.add_option("--topology", opt_topology, "Link layout: line|ring|full|star")
     ->check(CLI::IsMember({"line", "ring", "full", "star"}));
  app.add_option("--ttl", opt_ttl, "Initial TTL of the probe (overrides config)")->check(CLI::Range(1, 255));
  app.add_option("--from", opt_from, "Index of the sending node");
  app.add_option("--message", opt_message, "Text to send");
  app.add_option("--private-to", opt_private, "Send privately to this node index");
  CLI::Option* ch = app.add_option("--channel", opt_channel, "Send on this channel (all nodes join)");
  CLI::Option* pw = app.add_option("--password", opt_password, "Channel password");
  ch->needs(pw);
  pw->needs(ch);
  app.add_option("--config", opt_config, "Mesh config JSON file");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty", "json"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--threads", opt_threads, "Pump each node from its own thread");
  app.add_flag("-v,--verbose", opt_verbose, "Debug logging to stderr");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && opt_format == "pretty";
  set_log_level(opt_verbose ? LogLevel::Debug : LogLevel::Warn);

  if (opt_from >= opt_nodes) {
    std::cerr << ansi.red("error: --from out of range") << "\n";
    return 2;
  }
  if (opt_private >= 0 && (static_cast<size_t>(opt_private) >= opt_nodes ||
                           static_cast<size_t>(opt_private) == opt_from)) {
    std::cerr << ansi.red("error: --private-to must name another node") << "\n";
    return 2;
  }
  if (opt_private >= 0 && !opt_channel.empty()) {
    std::cerr << ansi.red("error: --private-to and --channel are exclusive") << "\n";
    return 2;
  }

  MeshConfig cfg;
  if (!opt_config.empty()) {
    const ConfigResult r = load_mesh_config(opt_config, cfg);
    if (r != ConfigResult::Ok) {
      std::cerr << ansi.red(std::string("error: config ") + opt_config + ": " + to_string(r)) << "\n";
      return 2;
    }
  }
  if (opt_ttl > 0) cfg.default_ttl = static_cast<uint8_t>(opt_ttl);
  std::string why;
  if (validate_mesh_config(cfg, &why) != ConfigResult::Ok) {
    std::cerr << ansi.red("error: config: " + why) << "\n";
    return 2;
  }

  // ---- build the network ----
  SteadyClock clock;
  transport::LoopbackNetwork net;
  std::vector<SimNode> nodes(opt_nodes);

  for (size_t i = 0; i < opt_nodes; ++i) {
    SimNode& n = nodes[i];
    n.name  = node_name(i);
    n.id    = DeviceIdentity::get_or_create(n.store).compact_id();
    n.radio = net.add_node(n.name);

    MeshConfig node_cfg = cfg;
    node_cfg.nickname = n.name;
    n.core = std::make_unique<Core>(n.id, *n.radio, node_cfg, clock, &n.store);
    net.attach(n.name, n.core.get());
    if (!n.core->start()) {
      std::cerr << ansi.red("error: " + n.name + " failed to start") << "\n";
      return 2;
    }
    if (!opt_channel.empty() && n.core->join_channel(opt_channel, opt_password) != CryptoResult::Ok) {
      std::cerr << ansi.red("error: " + n.name + " could not join #" + opt_channel) << "\n";
      return 2;
    }
  }

  for (const auto& l : topology_links(opt_topology, opt_nodes)) {
    net.link(nodes[l.first].name, nodes[l.second].name);
  }
  settle(net, nodes, opt_threads);   // link-up + per-link announcements

  // Per-link announcements can race link-ups further along; a full round of
  // floods makes every node's keys known everywhere before the probe.
  for (SimNode& n : nodes) n.core->announce();
  settle(net, nodes, opt_threads);

  // ---- send the probe ----
  SimNode& origin = nodes[opt_from];
  int64_t  probe_id = 0;
  SendResult sr;
  std::string kind = "public";
  if (opt_private >= 0) {
    kind = "private";
    sr = origin.core->send_private(nodes[static_cast<size_t>(opt_private)].id, opt_message, &probe_id);
  } else if (!opt_channel.empty()) {
    kind = "channel";
    sr = origin.core->send_channel(opt_channel, opt_message, &probe_id);
  } else {
    sr = origin.core->send_public(opt_message, &probe_id);
  }
  if (sr != SendResult::Ok) {
    std::cerr << ansi.red(std::string("error: send: ") + to_string(sr)) << "\n";
    return 1;
  }
  const uint64_t frames_before = net.frames_sent();
  settle(net, nodes, opt_threads);

  // ---- collect ----
  for (SimNode& n : nodes) {
    InboundMessage m;
    while (n.core->next_message(m)) {
      if (m.sender_id != origin.id || m.message_id != probe_id) continue;
      n.surfaced  = true;
      n.ttl_seen  = m.ttl;
      n.hop_seen  = m.hop_count;
      n.relayed   = m.forwarded;
      n.text_seen = m.text();
    }
  }
  const uint64_t probe_frames = net.frames_sent() - frames_before;

  // ---- report ----
  if (opt_format == "json") {
    json doc;
    doc["topology"]     = opt_topology;
    doc["kind"]         = kind;
    doc["from"]         = origin.name;
    doc["ttl"]          = cfg.default_ttl;
    doc["message_id"]   = probe_id;
    doc["frames_on_air"] = probe_frames;
    json arr = json::array();
    for (const SimNode& n : nodes) {
      json j;
      j["node"]     = n.name;
      j["id"]       = n.id.str();
      j["surfaced"] = n.surfaced;
      if (n.surfaced) {
        j["ttl"]       = n.ttl_seen;
        j["hop_count"] = n.hop_seen;
        j["relayed"]   = n.relayed;
        j["text"]      = n.text_seen;
      }
      j["links"] = n.core->connected_peers().size();
      j["stats"] = stats_json(n.core->stats());
      arr.push_back(j);
    }
    doc["nodes"] = arr;
    std::cout << doc.dump(2) << "\n";
  } else {
    std::cout << ansi.bold(kind + " message from " + origin.name) << "  "
              << ansi.dim("topology=" + opt_topology + " ttl=" + std::to_string(cfg.default_ttl)
                          + " frames=" + std::to_string(probe_frames)) << "\n\n";
    std::cout << "  " << std::left << std::setw(6) << "node" << std::setw(19) << "id"
              << std::setw(10) << "surfaced" << std::setw(5) << "ttl" << std::setw(5) << "hop"
              << std::setw(6) << "fwd" << std::setw(6) << "dup" << "links\n";
    for (const SimNode& n : nodes) {
      const MeshStats s = n.core->stats();
      const std::string label = (&n == &origin) ? "origin" : n.surfaced ? "yes" : "no";
      const std::string mark  = (&n == &origin) ? ansi.dim(label)
                              : n.surfaced       ? ansi.green(label)
                                                 : ansi.dim(label);
      std::cout << "  " << std::left << std::setw(6) << n.name << std::setw(19) << n.id.str()
                << mark << std::string(10 - label.size(), ' ')
                << std::setw(5) << (n.surfaced ? std::to_string(n.ttl_seen) : "-")
                << std::setw(5) << (n.surfaced ? std::to_string(n.hop_seen) : "-")
                << std::setw(6) << s.forwarded << std::setw(6) << s.duplicates
                << n.core->connected_peers().size() << "\n";
    }
  }

  for (SimNode& n : nodes) n.core->stop();
  net.pump_until_idle();
  return 0;
}
