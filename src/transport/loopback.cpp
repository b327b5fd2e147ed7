// -----------------------------------------------------------------------------
// loopback.cpp: queued in-process links for tests and the simulator.
// -----------------------------------------------------------------------------
#include "hopmesh/transport/loopback.hpp"
#include "hopmesh/log.hpp"

namespace hopmesh::transport {

const char* to_string(TxResult r) {
  switch (r) {
    case TxResult::Ok:    return "ok";
    case TxResult::Busy:  return "busy";
    case TxResult::Error: return "error";
  }
  return "?";
}

// =============================================================================
// LoopbackTransport
// =============================================================================

LoopbackTransport::LoopbackTransport(LoopbackNetwork& net, std::string address)
: net_(net), address_(std::move(address)) {}

TxResult LoopbackTransport::send_bytes(const std::string& connection_id, const std::vector<uint8_t>& bytes) {
  return net_.send(address_, connection_id, bytes);
}

TxResult LoopbackTransport::request_connect(const std::string& connection_id) {
  return net_.connect(address_, connection_id);
}

TxResult LoopbackTransport::request_disconnect(const std::string& connection_id) {
  return net_.disconnect(address_, connection_id);
}

// =============================================================================
// LoopbackNetwork: topology
// =============================================================================

LoopbackNetwork::Pair LoopbackNetwork::ordered(const std::string& a, const std::string& b) {
  return a < b ? Pair(a, b) : Pair(b, a);
}

std::shared_ptr<LoopbackTransport> LoopbackNetwork::add_node(const std::string& address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& slot = nodes_[address];
  if (!slot) {
    slot = std::make_shared<Node>();
    slot->advertisement.connection_id = address;
  }
  return std::make_shared<LoopbackTransport>(*this, address);
}

bool LoopbackNetwork::attach(const std::string& address, ITransportListener* listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(address);
  if (it == nodes_.end()) return false;
  it->second->listener = listener;
  return true;
}

void LoopbackNetwork::set_advertisement(const std::string& address, const PeerDescriptor& desc) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(address);
  if (it == nodes_.end()) return;
  it->second->advertisement = desc;
  it->second->advertisement.connection_id = address;
}

void LoopbackNetwork::set_in_range(const std::string& a, const std::string& b, bool in_range) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_range) {
    out_of_range_.erase(ordered(a, b));
  } else {
    out_of_range_.insert(ordered(a, b));
  }
}

void LoopbackNetwork::advertise(const std::string& address) {
  std::vector<std::string> targets;
  PeerDescriptor desc;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(address);
    if (it == nodes_.end()) return;
    desc = it->second->advertisement;
    for (const auto& kv : nodes_) {
      if (kv.first == address) continue;
      if (out_of_range_.count(ordered(address, kv.first))) continue;
      targets.push_back(kv.first);
    }
  }
  for (const auto& t : targets) {
    Delivery d;
    d.kind = Kind::Discovered;
    d.from = address;
    d.desc = desc;
    enqueue(t, std::move(d));
  }
}

bool LoopbackNetwork::link(const std::string& a, const std::string& b) {
  if (a == b) return false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!nodes_.count(a) || !nodes_.count(b)) return false;
    if (!links_.insert(ordered(a, b)).second) return false;
  }
  enqueue(a, Delivery{Kind::Connected, b, {}, {}});
  enqueue(b, Delivery{Kind::Connected, a, {}, {}});
  return true;
}

bool LoopbackNetwork::unlink(const std::string& a, const std::string& b) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (links_.erase(ordered(a, b)) == 0) return false;
  }
  enqueue(a, Delivery{Kind::Disconnected, b, {}, {}});
  enqueue(b, Delivery{Kind::Disconnected, a, {}, {}});
  return true;
}

bool LoopbackNetwork::linked(const std::string& a, const std::string& b) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return links_.count(ordered(a, b)) != 0;
}

void LoopbackNetwork::set_send_failure(const std::string& from, const std::string& to, bool fail) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fail) {
    failing_.insert({from, to});
  } else {
    failing_.erase({from, to});
  }
}

// =============================================================================
// LoopbackNetwork: transport side
// =============================================================================

TxResult LoopbackNetwork::send(const std::string& from, const std::string& to,
                               const std::vector<uint8_t>& bytes) {
  bool fail = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!links_.count(ordered(from, to))) return TxResult::Error;
    fail = failing_.count({from, to}) != 0;
    ++frames_sent_;
  }
  if (fail) {
    enqueue(from, Delivery{Kind::SendFailed, to, {}, {}});
    return TxResult::Ok;
  }
  enqueue(to, Delivery{Kind::Bytes, from, bytes, {}});
  return TxResult::Ok;
}

TxResult LoopbackNetwork::connect(const std::string& from, const std::string& to) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!nodes_.count(to)) return TxResult::Error;
    if (out_of_range_.count(ordered(from, to))) return TxResult::Error;
  }
  link(from, to);   // already linked: nothing queued, still Ok
  return TxResult::Ok;
}

TxResult LoopbackNetwork::disconnect(const std::string& from, const std::string& to) {
  if (!unlink(from, to)) {
    // Link already gone; the requester still expects a disconnect notice.
    enqueue(from, Delivery{Kind::Disconnected, to, {}, {}});
  }
  return TxResult::Ok;
}

// =============================================================================
// LoopbackNetwork: delivery
// =============================================================================

std::shared_ptr<LoopbackNetwork::Node> LoopbackNetwork::node(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(address);
  return it == nodes_.end() ? nullptr : it->second;
}

void LoopbackNetwork::enqueue(const std::string& to, Delivery d) {
  std::shared_ptr<Node> n = node(to);
  if (!n) return;
  std::lock_guard<std::mutex> lock(n->inbox_mutex);
  n->inbox.push_back(std::move(d));
}

size_t LoopbackNetwork::pump_node(const std::string& address) {
  std::shared_ptr<Node> n = node(address);
  if (!n) return 0;

  std::lock_guard<std::mutex> pump_lock(n->pump_mutex);
  std::deque<Delivery> batch;
  {
    std::lock_guard<std::mutex> lock(n->inbox_mutex);
    batch.swap(n->inbox);
  }
  ITransportListener* listener = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listener = n->listener;
  }
  if (!listener) return 0;

  for (const Delivery& d : batch) {
    switch (d.kind) {
      case Kind::Bytes:        listener->on_bytes_received(d.from, d.bytes); break;
      case Kind::Connected:    listener->on_peer_connected(d.from); break;
      case Kind::Disconnected: listener->on_peer_disconnected(d.from); break;
      case Kind::Discovered:   listener->on_peer_discovered(d.desc); break;
      case Kind::SendFailed:   listener->on_send_failed(d.from, "loopback link reported failure"); break;
    }
  }
  return batch.size();
}

size_t LoopbackNetwork::pump() {
  size_t delivered = 0;
  for (const auto& address : nodes()) delivered += pump_node(address);
  return delivered;
}

size_t LoopbackNetwork::pump_until_idle(size_t max_rounds) {
  size_t total = 0;
  for (size_t round = 0; round < max_rounds; ++round) {
    const size_t n = pump();
    if (n == 0) break;
    total += n;
  }
  return total;
}

size_t LoopbackNetwork::pending(const std::string& address) const {
  std::shared_ptr<Node> n = node(address);
  if (!n) return 0;
  std::lock_guard<std::mutex> lock(n->inbox_mutex);
  return n->inbox.size();
}

std::vector<std::string> LoopbackNetwork::nodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto& kv : nodes_) out.push_back(kv.first);
  return out;
}

uint64_t LoopbackNetwork::frames_sent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_sent_;
}

} // namespace hopmesh::transport
