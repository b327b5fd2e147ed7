/**
 * @file loopback.hpp
 * @brief In-process "radio" for tests and the simulator.
 *
 * @details
 * A LoopbackNetwork holds named nodes, which pairs are in radio range, and
 * which pairs are linked. Each node gets a LoopbackTransport; the node's
 * listener (its Core) is attached afterwards.
 *
 * Nothing is delivered inside a transport call. Sends, link-ups and
 * link-downs are queued in the receiving node's inbox and handed to its
 * listener by pump_node()/pump(). So a test decides exactly when traffic
 * moves, and a threaded test can pump each node from its own thread.
 *
 * Connection ids are node names: on node "b", the link to node "a" is "a".
 *
 * @code
 * LoopbackNetwork net;
 * auto ta = net.add_node("a");
 * auto tb = net.add_node("b");
 * Core a(id_a, *ta, cfg, clock);  net.attach("a", &a);
 * Core b(id_b, *tb, cfg, clock);  net.attach("b", &b);
 * net.link("a", "b");
 * net.pump_until_idle();
 * @endcode
 */
#ifndef HOPMESH_TRANSPORT_LOOPBACK_HPP
#define HOPMESH_TRANSPORT_LOOPBACK_HPP

#include <stddef.h>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "hopmesh/transport/transport_base.hpp"

namespace hopmesh::transport {

class LoopbackNetwork;

class LoopbackTransport : public ITransport {
public:
  LoopbackTransport(LoopbackNetwork& net, std::string address);

  TxResult    send_bytes(const std::string& connection_id, const std::vector<uint8_t>& bytes) override;
  TxResult    request_connect(const std::string& connection_id) override;
  TxResult    request_disconnect(const std::string& connection_id) override;
  const char* name() const override { return "loopback"; }

  const std::string& address() const { return address_; }

private:
  LoopbackNetwork& net_;
  std::string      address_;
};

class LoopbackNetwork {
public:
  /// Register a node; every new node is in range of every other node.
  std::shared_ptr<LoopbackTransport> add_node(const std::string& address);

  /// Set the listener that receives this node's deliveries (nullptr detaches).
  bool attach(const std::string& address, ITransportListener* listener);

  /// What `address` advertises when it is discovered.
  void set_advertisement(const std::string& address, const PeerDescriptor& desc);

  void set_in_range(const std::string& a, const std::string& b, bool in_range);

  /// Queue a discovery of `address` at every in-range node.
  void advertise(const std::string& address);

  /// Establish a link directly (both ends get on_peer_connected).
  bool link(const std::string& a, const std::string& b);

  /// Tear a link down (both ends get on_peer_disconnected).
  bool unlink(const std::string& a, const std::string& b);

  bool linked(const std::string& a, const std::string& b) const;

  /**
   * @brief Make sends from `from` to `to` fail after handoff.
   *
   * The send still returns Ok; `from` later gets on_send_failed().
   */
  void set_send_failure(const std::string& from, const std::string& to, bool fail);

  /// Deliver everything queued for one node. @return items delivered.
  size_t pump_node(const std::string& address);

  /// One round over all nodes. @return items delivered.
  size_t pump();

  /// Pump until a round delivers nothing or `max_rounds` is reached. @return items delivered.
  size_t pump_until_idle(size_t max_rounds = 10000);

  size_t pending(const std::string& address) const;
  std::vector<std::string> nodes() const;

  /// Bytes handed to the network since creation (all nodes).
  uint64_t frames_sent() const;

private:
  friend class LoopbackTransport;

  enum class Kind { Bytes, Connected, Disconnected, Discovered, SendFailed };

  struct Delivery {
    Kind                 kind;
    std::string          from;
    std::vector<uint8_t> bytes;
    PeerDescriptor       desc;
  };

  struct Node {
    ITransportListener*  listener{nullptr};
    PeerDescriptor       advertisement;
    std::mutex           inbox_mutex;
    std::deque<Delivery> inbox;
    std::mutex           pump_mutex;   // one delivery run per node at a time
  };

  using Pair = std::pair<std::string, std::string>;
  static Pair ordered(const std::string& a, const std::string& b);

  TxResult send(const std::string& from, const std::string& to, const std::vector<uint8_t>& bytes);
  TxResult connect(const std::string& from, const std::string& to);
  TxResult disconnect(const std::string& from, const std::string& to);

  std::shared_ptr<Node> node(const std::string& address) const;
  void enqueue(const std::string& to, Delivery d);

  mutable std::mutex                            mutex_;
  std::map<std::string, std::shared_ptr<Node>>  nodes_;
  std::set<Pair>                                out_of_range_;
  std::set<Pair>                                links_;
  std::set<std::pair<std::string, std::string>> failing_;   // directed from -> to
  uint64_t                                      frames_sent_{0};
};

} // namespace hopmesh::transport

#endif // HOPMESH_TRANSPORT_LOOPBACK_HPP
