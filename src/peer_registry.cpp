// -----------------------------------------------------------------------------
// peer_registry.cpp: peer arena, dual index, connection state machine.
//
// API & invariants: see include/hopmesh/peer_registry.hpp
// -----------------------------------------------------------------------------
#include "hopmesh/peer_registry.hpp"
#include "hopmesh/log.hpp"

namespace hopmesh {

PeerRegistry::PeerRegistry(const Clock& clock, Blocklist& blocklist, size_t max_connections)
: clock_(clock),
  blocklist_(blocklist),
  max_connections_(max_connections ? max_connections : 1) {}

// =============================================================================
// Locked helpers
// =============================================================================

Peer* PeerRegistry::find_conn_locked(const std::string& connection_id) {
  auto it = by_connection_.find(connection_id);
  if (it == by_connection_.end()) return nullptr;
  return &records_.at(it->second);
}

Peer* PeerRegistry::find_sender_locked(const CompactId& sender) {
  auto it = by_sender_.find(sender);
  if (it == by_sender_.end()) return nullptr;
  return &records_.at(it->second);
}

Peer PeerRegistry::snapshot_locked(const Peer& rec) const {
  Peer p = rec;
  p.is_blocked = rec.sender_id && blocklist_.is_blocked(*rec.sender_id);
  return p;
}

// POLICY: the only writer of Peer::state. Illegal edges are refused and logged.
void PeerRegistry::set_state_locked(Peer& rec, ConnectionState to, uint64_t now) {
  if (rec.state == to) return;
  if (!is_valid_transition(rec.state, to)) {
    HOPMESH_LOG_WARN("peers", "refused " << to_string(rec.state) << " -> " << to_string(to)
                              << " for " << rec.display_id());
    return;
  }
  HOPMESH_LOG_DEBUG("peers", rec.display_id() << ": " << to_string(rec.state) << " -> " << to_string(to));
  rec.state          = to;
  rec.state_since_ms = now;
}

void PeerRegistry::emit_locked(PeerEvent::Kind kind, const Peer& rec) {
  PeerEvent ev;
  ev.kind = kind;
  ev.peer = snapshot_locked(rec);
  events_.push(ev);
}

size_t PeerRegistry::count_state_locked(ConnectionState s) const {
  size_t n = 0;
  for (const auto& kv : records_) {
    if (kv.second.state == s) ++n;
  }
  return n;
}

void PeerRegistry::erase_locked(Handle h) {
  auto it = records_.find(h);
  if (it == records_.end()) return;
  const Peer& rec = it->second;

  auto c = by_connection_.find(rec.connection_id);
  if (c != by_connection_.end() && c->second == h) by_connection_.erase(c);
  if (rec.sender_id) {
    auto s = by_sender_.find(*rec.sender_id);
    if (s != by_sender_.end() && s->second == h) by_sender_.erase(s);
  }
  records_.erase(it);
}

// =============================================================================
// Discovery
// =============================================================================

bool PeerRegistry::add_or_update_discovered(const PeerDescriptor& desc) {
  if (desc.connection_id.empty()) return false;
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);

  Handle h = 0;
  if (desc.sender_id) {
    auto s = by_sender_.find(*desc.sender_id);
    if (s != by_sender_.end()) h = s->second;
  }
  if (h == 0) {
    auto c = by_connection_.find(desc.connection_id);
    if (c != by_connection_.end()) h = c->second;
  }

  if (h == 0) {
    h = next_handle_++;
    Peer rec;
    rec.sender_id      = desc.sender_id;
    rec.connection_id  = desc.connection_id;
    rec.nickname       = desc.nickname;
    rec.rssi           = desc.rssi;
    rec.last_seen_ms   = now;
    rec.state          = ConnectionState::Discovered;
    rec.state_since_ms = now;
    records_.emplace(h, rec);
    by_connection_[desc.connection_id] = h;
    if (desc.sender_id) by_sender_[*desc.sender_id] = h;
    HOPMESH_LOG_DEBUG("peers", "discovered " << rec.display_id() << " rssi=" << desc.rssi);
    emit_locked(PeerEvent::Kind::Discovered, records_.at(h));
    return true;
  }

  Peer& rec = records_.at(h);
  rec.rssi         = desc.rssi;
  rec.last_seen_ms = now;
  if (!desc.nickname.empty()) rec.nickname = desc.nickname;

  // Same device advertising under a new link id; follow it unless a link is live.
  if (rec.connection_id != desc.connection_id &&
      (rec.state == ConnectionState::Discovered || rec.state == ConnectionState::Disconnected)) {
    auto c = by_connection_.find(desc.connection_id);
    if (c == by_connection_.end() || c->second == h) {
      by_connection_.erase(rec.connection_id);
      rec.connection_id = desc.connection_id;
      by_connection_[rec.connection_id] = h;
    }
  }

  if (!rec.sender_id && desc.sender_id && by_sender_.count(*desc.sender_id) == 0) {
    rec.sender_id = desc.sender_id;
    by_sender_[*desc.sender_id] = h;
    emit_locked(PeerEvent::Kind::Identified, rec);
  }
  return false;
}

bool PeerRegistry::touch(const std::string& connection_id, std::optional<int> rssi) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_conn_locked(connection_id);
  if (!rec) return false;
  rec->last_seen_ms = now;
  if (rssi) rec->rssi = *rssi;
  return true;
}

void PeerRegistry::note_message_from(const CompactId& sender, uint8_t hop_count) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_sender_locked(sender);
  if (!rec) return;
  rec->hop_count       = hop_count;
  rec->last_forward_ms = now;
}

void PeerRegistry::set_nickname(const CompactId& sender, const std::string& nickname) {
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_sender_locked(sender);
  if (rec && !nickname.empty()) rec->nickname = nickname;
}

// =============================================================================
// Transitions
// =============================================================================

// -----------------------------------------------------------------------------
// begin_connect
// PRE: peer known by sender id (begin_connect) or by link (begin_connect_link).
// POLICY: can_connect() must hold; connecting + connected < cap. A link whose
// handshake has not revealed a sender id is refused with NoSenderId.
// OUT: connection_out = link to hand to the transport.
// -----------------------------------------------------------------------------
ConnectResult PeerRegistry::begin_connect(const CompactId& sender, std::string& connection_out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_sender_locked(sender);
  if (!rec) return ConnectResult::UnknownPeer;
  return begin_connect_locked(*rec, connection_out);
}

ConnectResult PeerRegistry::begin_connect_link(const std::string& connection_id, std::string& connection_out) {
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_conn_locked(connection_id);
  if (!rec) return ConnectResult::UnknownPeer;
  return begin_connect_locked(*rec, connection_out);
}

ConnectResult PeerRegistry::begin_connect_locked(Peer& rec, std::string& connection_out) {
  const uint64_t now = clock_.now_ms();
  const Peer snap = snapshot_locked(rec);
  if (snap.is_blocked)        return ConnectResult::Blocked;
  if (!snap.sender_id)        return ConnectResult::NoSenderId;
  if (!snap.can_connect())    return ConnectResult::InvalidState;

  const size_t in_use = count_state_locked(ConnectionState::Connected) +
                        count_state_locked(ConnectionState::Connecting);
  if (in_use >= max_connections_) {
    HOPMESH_LOG_WARN("peers", "connect to " << snap.display_id() << " refused: "
                              << in_use << "/" << max_connections_ << " links in use");
    return ConnectResult::CapacityExceeded;
  }

  set_state_locked(rec, ConnectionState::Connecting, now);
  rec.last_seen_ms = now;
  connection_out = rec.connection_id;
  emit_locked(PeerEvent::Kind::Connecting, rec);
  return ConnectResult::Ok;
}

// -----------------------------------------------------------------------------
// admit_connection
// POLICY: remote-initiated links enter through `connecting` so every change
// still follows a legal edge. Rejected links end in `disconnected`.
// -----------------------------------------------------------------------------
ConnectResult PeerRegistry::admit_connection(const std::string& connection_id) {
  if (connection_id.empty()) return ConnectResult::UnknownPeer;
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);

  Peer* rec = find_conn_locked(connection_id);
  if (!rec) {
    const Handle h = next_handle_++;
    Peer fresh;
    fresh.connection_id  = connection_id;
    fresh.last_seen_ms   = now;
    fresh.state          = ConnectionState::Discovered;
    fresh.state_since_ms = now;
    records_.emplace(h, fresh);
    by_connection_[connection_id] = h;
    rec = &records_.at(h);
    emit_locked(PeerEvent::Kind::Discovered, *rec);
  }
  rec->last_seen_ms = now;

  if (rec->state == ConnectionState::Connected)     return ConnectResult::Ok;
  if (rec->state == ConnectionState::Disconnecting) return ConnectResult::InvalidState;

  auto reject = [&](ConnectResult why) {
    if (rec->state == ConnectionState::Discovered) {
      set_state_locked(*rec, ConnectionState::Connecting, now);
    }
    if (rec->state == ConnectionState::Connecting) {
      set_state_locked(*rec, ConnectionState::Disconnected, now);
      emit_locked(PeerEvent::Kind::Disconnected, *rec);
    }
    return why;
  };

  if (rec->sender_id && blocklist_.is_blocked(*rec->sender_id)) {
    return reject(ConnectResult::Blocked);
  }
  if (count_state_locked(ConnectionState::Connected) >= max_connections_) {
    HOPMESH_LOG_WARN("peers", "link " << connection_id << " refused: " << max_connections_
                              << " peers already connected");
    return reject(ConnectResult::CapacityExceeded);
  }

  if (rec->state != ConnectionState::Connecting) {
    set_state_locked(*rec, ConnectionState::Connecting, now);
  }
  set_state_locked(*rec, ConnectionState::Connected, now);
  HOPMESH_LOG_INFO("peers", "connected " << rec->display_id());
  emit_locked(PeerEvent::Kind::Connected, *rec);
  return ConnectResult::Ok;
}

bool PeerRegistry::mark_disconnecting(const std::string& connection_id) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_conn_locked(connection_id);
  if (!rec || rec->state != ConnectionState::Connected) return false;
  set_state_locked(*rec, ConnectionState::Disconnecting, now);
  return true;
}

bool PeerRegistry::mark_disconnected(const std::string& connection_id) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  Peer* rec = find_conn_locked(connection_id);
  if (!rec) return false;
  if (!is_valid_transition(rec->state, ConnectionState::Disconnected)) return false;
  set_state_locked(*rec, ConnectionState::Disconnected, now);
  rec->last_seen_ms = now;
  HOPMESH_LOG_INFO("peers", "disconnected " << rec->display_id());
  emit_locked(PeerEvent::Kind::Disconnected, *rec);
  return true;
}

// -----------------------------------------------------------------------------
// bind_sender_id
// PRE: a record exists for the link.
// POLICY: one record per sender id. An older record for the same sender is
// folded into the link's record, unless that record still owns a live link
// of its own, in which case it only loses the sender id.
// -----------------------------------------------------------------------------
bool PeerRegistry::bind_sender_id(const std::string& connection_id, const CompactId& sender,
                                  const std::string& nickname) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto c = by_connection_.find(connection_id);
  if (c == by_connection_.end()) return false;
  const Handle h = c->second;

  auto s = by_sender_.find(sender);
  if (s != by_sender_.end() && s->second != h) {
    const Handle old = s->second;
    Peer& prev = records_.at(old);
    const bool live = prev.state == ConnectionState::Connected ||
                      prev.state == ConnectionState::Connecting ||
                      prev.state == ConnectionState::Disconnecting;
    by_sender_.erase(s);
    if (live) {
      prev.sender_id.reset();
    } else {
      Peer& cur = records_.at(h);
      if (cur.nickname.empty()) cur.nickname = prev.nickname;
      if (prev.last_seen_ms > cur.last_seen_ms) cur.last_seen_ms = prev.last_seen_ms;
      prev.sender_id.reset();
      erase_locked(old);
    }
  }

  Peer& rec = records_.at(h);
  const bool changed = !rec.sender_id || *rec.sender_id != sender;
  if (rec.sender_id && *rec.sender_id != sender) {
    auto prev_idx = by_sender_.find(*rec.sender_id);
    if (prev_idx != by_sender_.end() && prev_idx->second == h) by_sender_.erase(prev_idx);
  }
  rec.sender_id = sender;
  by_sender_[sender] = h;
  if (!nickname.empty()) rec.nickname = nickname;

  if (changed) {
    HOPMESH_LOG_INFO("peers", "link " << connection_id << " is " << sender.to_string().c_str()
                              << (rec.nickname.empty() ? "" : " (") << rec.nickname
                              << (rec.nickname.empty() ? "" : ")"));
    emit_locked(PeerEvent::Kind::Identified, rec);
  }
  return true;
}

// =============================================================================
// Blocklist
// =============================================================================

bool PeerRegistry::block(const CompactId& sender, std::string& drop_connection_out) {
  const uint64_t now = clock_.now_ms();
  drop_connection_out.clear();
  std::lock_guard<std::mutex> lock(mutex_);

  const bool added = blocklist_.block(sender);

  Peer* rec = find_sender_locked(sender);
  if (rec) {
    if (rec->state == ConnectionState::Connected) {
      set_state_locked(*rec, ConnectionState::Disconnecting, now);
      drop_connection_out = rec->connection_id;
    } else if (rec->state == ConnectionState::Connecting) {
      set_state_locked(*rec, ConnectionState::Disconnected, now);
      drop_connection_out = rec->connection_id;
      emit_locked(PeerEvent::Kind::Disconnected, *rec);
    }
    if (added) emit_locked(PeerEvent::Kind::Blocked, *rec);
  } else if (added) {
    Peer ghost;
    ghost.sender_id  = sender;
    ghost.is_blocked = true;
    PeerEvent ev;
    ev.kind = PeerEvent::Kind::Blocked;
    ev.peer = ghost;
    events_.push(ev);
  }

  if (added) HOPMESH_LOG_INFO("peers", "blocked " << sender.to_string().c_str());
  return added;
}

bool PeerRegistry::unblock(const CompactId& sender) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!blocklist_.unblock(sender)) return false;

  Peer* rec = find_sender_locked(sender);
  PeerEvent ev;
  ev.kind = PeerEvent::Kind::Unblocked;
  if (rec) {
    ev.peer = snapshot_locked(*rec);
  } else {
    ev.peer.sender_id = sender;
  }
  events_.push(ev);
  HOPMESH_LOG_INFO("peers", "unblocked " << sender.to_string().c_str());
  return true;
}

bool PeerRegistry::is_blocked(const CompactId& sender) const {
  return blocklist_.is_blocked(sender);
}

// =============================================================================
// Maintenance
// =============================================================================

size_t PeerRegistry::remove_stale_peers(uint64_t timeout_ms) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<Handle> stale;
  for (const auto& kv : records_) {
    const Peer& p = kv.second;
    if (p.state == ConnectionState::Connected) continue;
    if (now > p.last_seen_ms && now - p.last_seen_ms > timeout_ms) stale.push_back(kv.first);
  }
  for (Handle h : stale) {
    emit_locked(PeerEvent::Kind::Removed, records_.at(h));
    erase_locked(h);
  }
  if (!stale.empty()) {
    HOPMESH_LOG_DEBUG("peers", "removed " << stale.size() << " stale peers, " << records_.size() << " left");
  }
  return stale.size();
}

std::vector<std::string> PeerRegistry::expire_connect_timeouts(uint64_t timeout_ms) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> expired;
  for (auto& kv : records_) {
    Peer& p = kv.second;
    if (p.state != ConnectionState::Connecting) continue;
    if (now > p.state_since_ms && now - p.state_since_ms > timeout_ms) {
      set_state_locked(p, ConnectionState::Disconnected, now);
      emit_locked(PeerEvent::Kind::Disconnected, p);
      expired.push_back(p.connection_id);
      HOPMESH_LOG_WARN("peers", "connect to " << p.display_id() << " timed out after "
                                << timeout_ms << " ms");
    }
  }
  return expired;
}

std::vector<std::string> PeerRegistry::disconnect_all() {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> links;
  for (auto& kv : records_) {
    Peer& p = kv.second;
    if (!is_valid_transition(p.state, ConnectionState::Disconnected)) continue;
    set_state_locked(p, ConnectionState::Disconnected, now);
    emit_locked(PeerEvent::Kind::Disconnected, p);
    links.push_back(p.connection_id);
  }
  return links;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Peer> PeerRegistry::find_by_sender(const CompactId& sender) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_sender_.find(sender);
  if (it == by_sender_.end()) return std::nullopt;
  return snapshot_locked(records_.at(it->second));
}

std::optional<Peer> PeerRegistry::find_by_connection(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_connection_.find(connection_id);
  if (it == by_connection_.end()) return std::nullopt;
  return snapshot_locked(records_.at(it->second));
}

std::optional<CompactId> PeerRegistry::sender_for_connection(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_connection_.find(connection_id);
  if (it == by_connection_.end()) return std::nullopt;
  return records_.at(it->second).sender_id;
}

std::vector<Peer> PeerRegistry::peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Peer> out;
  out.reserve(records_.size());
  for (const auto& kv : records_) out.push_back(snapshot_locked(kv.second));
  return out;
}

std::vector<Peer> PeerRegistry::connected_peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Peer> out;
  for (const auto& kv : records_) {
    if (kv.second.state == ConnectionState::Connected) out.push_back(snapshot_locked(kv.second));
  }
  return out;
}

std::vector<std::string> PeerRegistry::connected_connection_ids(const std::string& exclude) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  for (const auto& kv : records_) {
    const Peer& p = kv.second;
    if (p.state != ConnectionState::Connected) continue;
    if (p.connection_id == exclude) continue;
    out.push_back(p.connection_id);
  }
  return out;
}

size_t PeerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

size_t PeerRegistry::connected_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_state_locked(ConnectionState::Connected);
}

} // namespace hopmesh
